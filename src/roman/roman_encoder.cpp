#include "internal/roman/roman_encoder.hpp"

#include <cstdint>

#include <string>
#include <vector>

#include "internal/numeral_types.hpp"
#include "internal/text/string_rewriter.hpp"
#include "internal/text/text_utils.hpp"

namespace numeral {
namespace roman {

// =============================================================================
// RepeatLimiter
// =============================================================================

RepeatLimiter::RepeatLimiter(int max_consecutive)
    : max_consecutive_(max_consecutive) {}

RepeatLimiter::Decision RepeatLimiter::decide(const RomanSymbol* matched,
                                              const RomanSymbol* larger) {
    run_length_ = (matched == last_) ? run_length_ + 1 : 0;

    if (run_length_ < max_consecutive_ || larger == nullptr) {
        last_ = matched;
        return {Action::APPEND, matched};
    }
    return {Action::REPLACE_RUN, larger};
}

void RepeatLimiter::apply(const Decision& decision, std::vector<std::string>& output) const {
    if (decision.action == Action::REPLACE_RUN) {
        for (int i = 0; i < max_consecutive_ - 1 && !output.empty(); ++i) {
            output.pop_back();
        }
    }
    output.push_back(decision.symbol->glyph);
}

// =============================================================================
// 编码
// =============================================================================

int maxConsecutive(bool only_additive) {
    return only_additive ? 4 : 3;
}

uint64_t standardThreshold(bool only_additive) {
    const uint64_t max_standard = SymbolTable::instance().maxStandardValue();
    return max_standard * (maxConsecutive(only_additive) + 1);
}

namespace {

int decimalOrder(uint64_t value) {
    int order = 0;
    while (value >= 10) {
        value /= 10;
        ++order;
    }
    return order;
}

uint64_t powerOfTen(int order) {
    uint64_t result = 1;
    for (int i = 0; i < order; ++i) result *= 10;
    return result;
}

void appendRepeated(std::vector<std::string>& output, const char* glyph, int count) {
    for (int i = 0; i < count; ++i) output.push_back(glyph);
}

// Magnitudes at or above the smallest apostrophus symbol, one block per step
uint64_t encodeExtended(uint64_t remaining, const RomanConfig& config,
                        std::vector<std::string>& output) {
    const uint64_t threshold = standardThreshold(config.only_additive);
    const uint64_t max_consecutive = maxConsecutive(config.only_additive);
    const int base_order = decimalOrder(apostrophusSymbols().front().value);

    while (remaining >= threshold) {
        if (!config.extended) {
            throw ConfigurationError(
                "`" + std::to_string(remaining) + "` needs the `extended` option");
        }

        const int order = decimalOrder(remaining);
        const uint64_t magnitude = powerOfTen(order);
        const bool is_half = remaining >= 5 * magnitude;
        const int repeat = order - base_order + (is_half ? 1 : 0);
        const uint64_t unit = is_half ? 5 * magnitude : magnitude;

        if (config.claudian) {
            if (is_half) {
                output.push_back(glyphs::kClaudianHalf);
            } else {
                appendRepeated(output, glyphs::kClaudianOpen, repeat);
                output.push_back(repeat > 0 ? glyphs::kClaudianUnit : glyphs::kClaudianBase);
            }
            appendRepeated(output, glyphs::kEnclosure, repeat);
        } else {
            const std::string* glyph = findApostrophus(unit);
            if (glyph == nullptr) {
                throw ConfigurationError(
                    "`" + std::to_string(remaining) + "` needs the `claudian` option");
            }
            output.push_back(*glyph);
        }

        // Too many blocks of this size: emit it as a subtractive prefix of the next one
        if (remaining / unit >= max_consecutive + 1) {
            remaining += unit;
        } else {
            remaining -= unit;
        }
    }
    return remaining;
}

void encodeStandard(uint64_t remaining, const RomanConfig& config,
                    std::vector<std::string>& output) {
    const auto& table = SymbolTable::instance().additive();
    RepeatLimiter limiter(maxConsecutive(config.only_additive));

    while (remaining > 0) {
        const RomanSymbol* larger = nullptr;
        for (const RomanSymbol* symbol : table) {
            const uint64_t value = static_cast<uint64_t>(symbol->value);
            if (value <= remaining) {
                limiter.apply(limiter.decide(symbol, larger), output);
                remaining -= value;
                break;
            }
            larger = symbol;
        }
    }
}

// Rewrites whole Claudian blocks (Ⅽ* ↀ Ↄ+ or Ⅾ Ↄ+) that have an apostrophus glyph
std::string claudianToApostrophus(const std::string& text) {
    const std::vector<std::string> chars = text::splitUtf8(text);
    std::string result;

    size_t i = 0;
    while (i < chars.size()) {
        size_t center = i;
        while (center < chars.size() && chars[center] == glyphs::kClaudianOpen) ++center;

        const bool has_center = center < chars.size() &&
            (chars[center] == glyphs::kClaudianUnit ||
             (center == i && chars[center] == glyphs::kClaudianHalf));
        size_t end = center + 1;
        while (has_center && end < chars.size() && chars[end] == glyphs::kEnclosure) ++end;

        if (!has_center || end == center + 1) {
            result += chars[i++];
            continue;
        }

        std::string block;
        for (size_t j = i; j < end; ++j) block += chars[j];

        const std::string* replacement = &block;
        for (const auto& pair : claudianRewrites()) {
            if (pair.first == block) {
                replacement = &pair.second;
                break;
            }
        }
        result += *replacement;
        i = end;
    }
    return result;
}

std::string finalize(const std::string& raw, const RomanConfig& config) {
    std::string result = text::rewrite(raw, ligatureRewrites());
    if (config.only_additive) {
        result = text::rewrite(result, additiveRewrites());
    }
    if (config.archaic) {
        result = text::rewrite(result, archaicRewrites());
    }
    if (!config.alternatives.empty()) {
        result = text::rewrite(result, config.alternatives);
    }
    if (config.only_ascii) {
        result = text::rewrite(result, asciiRewrites());
    }
    if (config.uppercase) {
        return text::toUpperNumeral(result);
    }
    // Claudian blocks have no lowercase form of their own
    return text::toLowerNumeral(claudianToApostrophus(result));
}

}  // namespace

std::string intToRoman(int64_t num, const RomanConfig& config) {
    if (num < 0) {
        if (!config.allow_signed) {
            throw ConfigurationError("`" + std::to_string(num) + "` needs the `signed` option");
        }
        if (config.negative_sign.empty()) {
            throw ConfigurationError("Negative sign must not be empty");
        }
    }

    std::string raw;
    if (num == 0) {
        if (!config.extended) {
            throw ConfigurationError("`0` needs the `extended` option");
        }
        raw = glyphs::kZero;
    } else {
        uint64_t remaining = num < 0 ? 0 - static_cast<uint64_t>(num) : static_cast<uint64_t>(num);

        std::vector<std::string> output;
        remaining = encodeExtended(remaining, config, output);
        encodeStandard(remaining, config, output);

        for (const auto& glyph : output) {
            raw += glyph;
        }
    }

    std::string result = finalize(raw, config);
    return num < 0 ? config.negative_sign + result : result;
}

}  // namespace roman
}  // namespace numeral
