#include "internal/roman/roman_decoder.hpp"

#include <cctype>
#include <cstdint>

#include <string>
#include <vector>

#include "internal/numeral_types.hpp"
#include "internal/roman/roman_tables.hpp"
#include "internal/text/string_rewriter.hpp"
#include "internal/text/text_utils.hpp"

namespace numeral {
namespace roman {

bool isRomanNumeralChar(char c) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return SymbolTable::instance().asciiValue(c) >= 0;
}

namespace {

// Unicode, ligature and archaic glyphs -> canonical ASCII symbols
std::string normalize(const std::string& text) {
    static const ReplacementList archaic_inverse = text::invert(archaicRewrites());
    return text::rewrite(text::rewrite(text, archaic_inverse), asciiRewrites());
}

void validateSymbols(const std::string& body, const std::string& original) {
    for (const auto& ch : text::splitUtf8(body)) {
        bool valid = ch.size() == 1 &&
            (ch == glyphs::kEnclosureAscii || isRomanNumeralChar(ch[0]));
        if (!valid) {
            throw InvalidInputError("Invalid character '" + ch + "' in: " + original);
        }
    }
    if (body.size() > 1 && body.find(glyphs::kZero) != std::string::npos) {
        throw InvalidInputError("Zero symbol cannot be combined with other symbols: " + original);
    }
}

// A symbol is subtracted when any later symbol is strictly greater
int64_t accumulate(const std::string& body) {
    const SymbolTable& table = SymbolTable::instance();
    int64_t total = 0;
    int64_t max_after = 0;
    for (auto it = body.rbegin(); it != body.rend(); ++it) {
        int64_t value = table.asciiValue(*it);
        if (max_after > value) {
            total -= value;
        } else {
            total += value;
            max_after = value;
        }
    }
    return total;
}

}  // namespace

int64_t romanToInt(const std::string& text,
                   bool strict,
                   const RomanGrammar& grammar,
                   const std::string& negative_sign) {
    if (negative_sign.empty()) {
        throw ConfigurationError("Negative sign must not be empty");
    }

    std::string body = text::toUpperNumeral(text::trim(text));
    const std::string sign = text::toUpperNumeral(negative_sign);

    // Input is uppercased before the sign is stripped, so "n" would swallow the zero
    for (const auto& ch : text::splitUtf8(normalize(sign))) {
        if (ch.size() == 1 && (ch == glyphs::kEnclosureAscii || isRomanNumeralChar(ch[0]))) {
            throw ConfigurationError(
                "Negative sign '" + negative_sign + "' contains a Roman numeral symbol");
        }
    }

    bool negative = false;
    if (body.compare(0, sign.size(), sign) == 0) {
        negative = true;
        body = body.substr(sign.size());
    }
    if (body.find(sign) != std::string::npos) {
        throw InvalidInputError(
            "Negative sign '" + negative_sign + "' must only appear at the start: " + text);
    }
    if (body.empty()) {
        throw InvalidInputError("No Roman numeral in: '" + text + "'");
    }

    // Checked before transliteration, which would turn ↀ into the valid-looking CD
    if (text::containsAny(body, apostrophusGlyphs()) ||
        body.find(glyphs::kEnclosure) != std::string::npos) {
        throw UnsupportedError("Large-number notation cannot be decoded yet: " + text);
    }

    body = normalize(body);
    validateSymbols(body, text);

    if (body.find(glyphs::kEnclosureAscii) != std::string::npos) {
        throw UnsupportedError("Claudian notation cannot be decoded yet: " + text);
    }

    if (strict && !grammar.matches(body)) {
        throw FormatError("Not a valid Roman numeral in strict mode: " + text);
    }

    int64_t total = accumulate(body);
    return negative ? -total : total;
}

bool isRomanNumeral(const std::string& str) {
    try {
        romanToInt(str);
        return true;
    } catch (const NumeralError&) {
        return false;
    }
}

}  // namespace roman
}  // namespace numeral
