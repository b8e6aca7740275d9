#include "internal/codec/bijective_codec.hpp"

#include <cstdint>

#include <limits>
#include <string>
#include <unordered_set>
#include <vector>

#include "internal/numeral_types.hpp"
#include "internal/text/text_utils.hpp"

namespace numeral {
namespace codec {

const char* const kDefaultAlphabet = "abcdefghijklmnopqrstuvwxyz";

namespace {

void validateTokens(const std::vector<std::string>& tokens, const std::string& negative_sign) {
    if (tokens.empty()) {
        throw ConfigurationError("Token alphabet must not be empty");
    }
    if (negative_sign.empty()) {
        throw ConfigurationError("Negative sign must not be empty");
    }

    const std::vector<std::string> sign_chars = text::splitUtf8(negative_sign);

    // A sign spelled with alphabet characters could be produced by concatenated tokens
    std::unordered_set<std::string> seen;
    for (const auto& token : tokens) {
        if (token.empty()) {
            throw ConfigurationError("Token alphabet contains an empty token");
        }
        if (!seen.insert(token).second) {
            throw ConfigurationError("Duplicate token in alphabet: '" + token + "'");
        }
        if (text::containsAny(token, sign_chars)) {
            throw ConfigurationError(
                "Negative sign '" + negative_sign + "' shares a character with token '" +
                token + "'");
        }
    }
}

uint64_t magnitudeOf(int64_t num) {
    return num < 0 ? 0 - static_cast<uint64_t>(num) : static_cast<uint64_t>(num);
}

int64_t applySign(uint64_t magnitude, bool negative) {
    if (!negative) return static_cast<int64_t>(magnitude);
    if (magnitude == 0) return 0;
    // -(2^63) is representable while +(2^63) is not
    return -static_cast<int64_t>(magnitude - 1) - 1;
}

std::vector<std::string> alphabetToTokens(const std::string& alphabet) {
    return text::splitUtf8(alphabet);
}

}  // namespace

// =============================================================================
// 通用 token 编解码
// =============================================================================

std::string intToTokens(int64_t num,
                        const std::vector<std::string>& tokens,
                        const std::string& negative_sign) {
    validateTokens(tokens, negative_sign);

    const uint64_t k = tokens.size();
    uint64_t remaining = magnitudeOf(num);

    // Digits come out least significant first
    std::vector<const std::string*> digits;
    while (true) {
        digits.push_back(&tokens[remaining % k]);
        if (remaining < k) break;
        remaining = remaining / k - 1;
    }

    std::string result;
    if (num < 0) result = negative_sign;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        result += **it;
    }
    return result;
}

int64_t tokensToInt(const std::string& text,
                    const std::vector<std::string>& tokens,
                    const std::string& negative_sign) {
    validateTokens(tokens, negative_sign);

    if (text.empty()) {
        throw InvalidInputError("Cannot decode an empty string");
    }

    std::string body = text;
    bool negative = false;
    if (body.compare(0, negative_sign.size(), negative_sign) == 0) {
        negative = true;
        body = body.substr(negative_sign.size());
    }
    if (body.find(negative_sign) != std::string::npos) {
        throw InvalidInputError(
            "Negative sign '" + negative_sign + "' must only appear at the start: " + text);
    }
    if (body.empty()) {
        throw InvalidInputError("Missing digits after negative sign: " + text);
    }

    std::unordered_set<std::string> valid_chars;
    for (const auto& token : tokens) {
        for (const auto& ch : text::splitUtf8(token)) {
            valid_chars.insert(ch);
        }
    }
    for (const auto& ch : text::splitUtf8(body)) {
        if (valid_chars.count(ch) == 0) {
            throw InvalidInputError("Invalid character '" + ch + "' in: " + text);
        }
    }

    const uint64_t k = tokens.size();
    const uint64_t limit = static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) +
        (negative ? 1 : 0);

    uint64_t total = 0;
    uint64_t place = 1;
    size_t remaining = body.size();
    size_t position = 0;

    while (remaining > 0) {
        size_t index = tokens.size();
        for (size_t j = 0; j < tokens.size(); ++j) {
            const std::string& token = tokens[j];
            if (token.size() <= remaining &&
                body.compare(remaining - token.size(), token.size(), token) == 0) {
                index = j;
                break;
            }
        }
        if (index == tokens.size()) {
            throw InvalidInputError(
                "Cannot split into tokens: '" + body.substr(0, remaining) + "' in " + text);
        }

        if (position > 0) {
            if (place > limit / k) {
                throw InvalidInputError("Value exceeds the 64-bit integer range: " + text);
            }
            place *= k;
        }

        // The encoder subtracts one per position above the first
        const uint64_t digit = index + (position == 0 ? 0 : 1);
        if (digit != 0 && place > (limit - total) / digit) {
            throw InvalidInputError("Value exceeds the 64-bit integer range: " + text);
        }
        total += digit * place;

        remaining -= tokens[index].size();
        ++position;
    }

    return applySign(total, negative);
}

// =============================================================================
// 字母编解码
// =============================================================================

std::string intToLetters(int64_t num,
                         const std::string& alphabet,
                         const std::string& negative_sign) {
    return intToTokens(num, alphabetToTokens(alphabet), negative_sign);
}

int64_t lettersToInt(const std::string& text,
                     const std::string& alphabet,
                     const std::string& negative_sign) {
    return tokensToInt(text, alphabetToTokens(alphabet), negative_sign);
}

}  // namespace codec
}  // namespace numeral
