#include "internal/text/text_utils.hpp"

#include <cstdint>

#include <string>
#include <vector>

namespace numeral {
namespace text {

// =============================================================================
// UTF-8 字符串处理
// =============================================================================

std::vector<std::string> splitUtf8(const std::string& str) {
    std::vector<std::string> result;
    for (size_t i = 0; i < str.length();) {
        size_t char_len = 1;
        unsigned char c = str[i];

        // Determine UTF-8 character length
        if ((c & 0x80) == 0) {
            char_len = 1;  // ASCII
        } else if ((c & 0xE0) == 0xC0) {
            char_len = 2;  // 2-byte UTF-8
        } else if ((c & 0xF0) == 0xE0) {
            char_len = 3;  // 3-byte UTF-8
        } else if ((c & 0xF8) == 0xF0) {
            char_len = 4;  // 4-byte UTF-8
        }

        if (i + char_len > str.length()) {
            char_len = str.length() - i;
        }
        result.push_back(str.substr(i, char_len));
        i += char_len;
    }
    return result;
}

uint32_t decodeUtf8Char(const std::string& ch) {
    if (ch.empty()) return 0xFFFD;
    unsigned char c0 = ch[0];
    if ((c0 & 0x80) == 0) {
        return ch.length() == 1 ? c0 : 0xFFFD;
    }

    size_t len = 0;
    uint32_t cp = 0;
    if ((c0 & 0xE0) == 0xC0) {
        len = 2;
        cp = c0 & 0x1F;
    } else if ((c0 & 0xF0) == 0xE0) {
        len = 3;
        cp = c0 & 0x0F;
    } else if ((c0 & 0xF8) == 0xF0) {
        len = 4;
        cp = c0 & 0x07;
    } else {
        return 0xFFFD;
    }
    if (ch.length() != len) return 0xFFFD;

    for (size_t i = 1; i < len; ++i) {
        unsigned char c = ch[i];
        if ((c & 0xC0) != 0x80) return 0xFFFD;
        cp = (cp << 6) | (c & 0x3F);
    }
    return cp;
}

std::string encodeUtf8(uint32_t cp) {
    std::string out;
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return out;
}

// =============================================================================
// 大小写转换
// =============================================================================

namespace {

// Roman numeral Number Forms: U+2160-216F uppercase, U+2170-217F lowercase
constexpr uint32_t kRomanUpperFirst = 0x2160;
constexpr uint32_t kRomanUpperLast = 0x216F;
constexpr uint32_t kRomanLowerFirst = 0x2170;
constexpr uint32_t kRomanLowerLast = 0x217F;
constexpr uint32_t kRomanCaseOffset = kRomanLowerFirst - kRomanUpperFirst;

// Reversed C (Claudian enclosure)
constexpr uint32_t kReversedCUpper = 0x2183;
constexpr uint32_t kReversedCLower = 0x2184;

uint32_t upperCodepoint(uint32_t cp) {
    if (cp >= 'a' && cp <= 'z') return cp - ('a' - 'A');
    if (cp >= kRomanLowerFirst && cp <= kRomanLowerLast) return cp - kRomanCaseOffset;
    if (cp == kReversedCLower) return kReversedCUpper;
    return cp;
}

uint32_t lowerCodepoint(uint32_t cp) {
    if (cp >= 'A' && cp <= 'Z') return cp + ('a' - 'A');
    if (cp >= kRomanUpperFirst && cp <= kRomanUpperLast) return cp + kRomanCaseOffset;
    if (cp == kReversedCUpper) return kReversedCLower;
    return cp;
}

template <typename Mapper>
std::string mapCase(const std::string& str, Mapper mapper) {
    std::string result;
    result.reserve(str.size());
    for (const auto& ch : splitUtf8(str)) {
        uint32_t cp = decodeUtf8Char(ch);
        if (cp == 0xFFFD) {
            result += ch;  // keep malformed bytes untouched
            continue;
        }
        uint32_t mapped = mapper(cp);
        result += (mapped == cp) ? ch : encodeUtf8(mapped);
    }
    return result;
}

}  // namespace

std::string toUpperNumeral(const std::string& str) {
    return mapCase(str, upperCodepoint);
}

std::string toLowerNumeral(const std::string& str) {
    return mapCase(str, lowerCodepoint);
}

// =============================================================================
// 其他
// =============================================================================

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n\f\v");
    return str.substr(start, end - start + 1);
}

bool containsAny(const std::string& str, const std::vector<std::string>& needles) {
    for (const auto& needle : needles) {
        if (!needle.empty() && str.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace text
}  // namespace numeral
