#include "internal/text/string_rewriter.hpp"

#include <string>
#include <utility>

namespace numeral {
namespace text {

std::string replaceAll(const std::string& text,
                       const std::string& pattern,
                       const std::string& replacement) {
    if (pattern.empty()) {
        throw ConfigurationError("Replacement pattern must not be empty");
    }

    std::string result;
    result.reserve(text.size());

    size_t pos = 0;
    while (true) {
        size_t found = text.find(pattern, pos);
        if (found == std::string::npos) break;
        result.append(text, pos, found - pos);
        result += replacement;
        pos = found + pattern.size();
    }
    result.append(text, pos, std::string::npos);
    return result;
}

std::string rewrite(const std::string& text, const ReplacementList& pairs) {
    std::string result = text;
    for (const auto& [pattern, replacement] : pairs) {
        result = replaceAll(result, pattern, replacement);
    }
    return result;
}

ReplacementList invert(const ReplacementList& pairs) {
    ReplacementList inverted;
    inverted.reserve(pairs.size());
    for (const auto& [pattern, replacement] : pairs) {
        inverted.emplace_back(replacement, pattern);
    }
    return inverted;
}

}  // namespace text
}  // namespace numeral
