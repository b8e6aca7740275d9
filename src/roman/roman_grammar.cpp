#include "internal/roman/roman_grammar.hpp"

#include <string>
#include <vector>

namespace numeral {
namespace roman {

namespace {

bool startsWithPair(const std::string& text, size_t pos, char first, char second) {
    return second != '\0' && pos + 1 < text.size() &&
        text[pos] == first && text[pos + 1] == second;
}

// Returns the position after the longest prefix accepted by the group
size_t matchGroup(const std::string& text, size_t pos, const GrammarGroup& group) {
    if (group.allow_subtractive) {
        if (startsWithPair(text, pos, group.unit, group.ten) ||
            startsWithPair(text, pos, group.unit, group.five)) {
            return pos + 2;
        }
    }

    if (group.five != '\0' && pos < text.size() && text[pos] == group.five) {
        ++pos;
    }
    for (int i = 0; i < group.max_repeats && pos < text.size() && text[pos] == group.unit; ++i) {
        ++pos;
    }
    return pos;
}

}  // namespace

RomanGrammar RomanGrammar::Standard() {
    RomanGrammar grammar;
    grammar.groups = {
        {'M', '\0', '\0', 3, false},
        {'C', 'D', 'M', 3, true},
        {'X', 'L', 'C', 3, true},
        {'I', 'V', 'X', 3, true},
    };
    return grammar;
}

RomanGrammar RomanGrammar::Additive() {
    RomanGrammar grammar;
    grammar.groups = {
        {'M', '\0', '\0', 4, false},
        {'C', 'D', 'M', 4, false},
        {'X', 'L', 'C', 4, false},
        {'I', 'V', 'X', 4, false},
    };
    return grammar;
}

bool RomanGrammar::matches(const std::string& text) const {
    if (text.empty()) return false;

    size_t pos = 0;
    for (const auto& group : groups) {
        pos = matchGroup(text, pos, group);
    }
    return pos == text.size();
}

}  // namespace roman
}  // namespace numeral
