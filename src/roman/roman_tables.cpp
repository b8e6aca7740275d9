#include "internal/roman/roman_tables.hpp"

#include <cstdint>

#include <algorithm>
#include <string>
#include <vector>

namespace numeral {
namespace roman {

namespace glyphs {

const char* const kZero = "N";
const char* const kEnclosure = "Ↄ";
const char* const kEnclosureAscii = "O";
const char* const kClaudianOpen = "Ⅽ";
const char* const kClaudianHalf = "Ⅾ";
const char* const kClaudianUnit = "ↀ";
const char* const kClaudianBase = "M";

}  // namespace glyphs

// =============================================================================
// SymbolTable
// =============================================================================

const SymbolTable& SymbolTable::instance() {
    static const SymbolTable table;
    return table;
}

SymbolTable::SymbolTable() {
    symbols_ = {
        {"Ⅿ", "M", 1000, false},
        {"Ⅾ", "D", 500, false},
        {"Ⅽ", "C", 100, false},
        {"Ⅼ", "L", 50, false},
        {"Ⅻ", "XII", 12, true},
        {"Ⅺ", "XI", 11, true},
        {"Ⅹ", "X", 10, false},
        {"Ⅸ", "IX", 9, false},
        {"Ⅷ", "VIII", 8, false},
        {"Ⅶ", "VII", 7, false},
        {"Ⅵ", "VI", 6, false},
        {"Ⅴ", "V", 5, false},
        {"Ⅳ", "IV", 4, false},
        {"Ⅲ", "III", 3, false},
        {"Ⅱ", "II", 2, false},
        {"Ⅰ", "I", 1, false},
        {glyphs::kZero, glyphs::kZero, 0, false},
    };

    for (size_t i = 0; i < symbols_.size(); ++i) {
        const RomanSymbol& symbol = symbols_[i];
        by_glyph_[symbol.glyph] = i;
        if (symbol.ascii.size() == 1) {
            by_ascii_[symbol.ascii[0]] = symbol.value;
        }
        if (symbol.value > 0 && !symbol.ligature_only) {
            additive_.push_back(&symbols_[i]);
        }
        max_standard_value_ = std::max(max_standard_value_, symbol.value);
    }
}

const RomanSymbol* SymbolTable::findGlyph(const std::string& glyph) const {
    auto it = by_glyph_.find(glyph);
    if (it == by_glyph_.end()) return nullptr;
    return &symbols_[it->second];
}

int64_t SymbolTable::asciiValue(char c) const {
    auto it = by_ascii_.find(c);
    return it == by_ascii_.end() ? -1 : it->second;
}

// =============================================================================
// Apostrophus
// =============================================================================

const std::vector<ApostrophusSymbol>& apostrophusSymbols() {
    static const std::vector<ApostrophusSymbol> symbols = {
        {"ↀ", 1000},
        {"ↁ", 5000},
        {"ↂ", 10000},
        {"ↇ", 50000},
        {"ↈ", 100000},
    };
    return symbols;
}

const std::string* findApostrophus(uint64_t value) {
    for (const auto& symbol : apostrophusSymbols()) {
        if (static_cast<uint64_t>(symbol.value) == value) {
            return &symbol.glyph;
        }
    }
    return nullptr;
}

std::vector<std::string> apostrophusGlyphs() {
    std::vector<std::string> result;
    for (const auto& symbol : apostrophusSymbols()) {
        result.push_back(symbol.glyph);
    }
    return result;
}

// =============================================================================
// 固定替换表
// =============================================================================

const ReplacementList& ligatureRewrites() {
    static const ReplacementList pairs = {
        {"ⅩⅠ", "Ⅺ"},
        {"ⅩⅡ", "Ⅻ"},
    };
    return pairs;
}

const ReplacementList& additiveRewrites() {
    static const ReplacementList pairs = {
        {"Ⅳ", "ⅡⅡ"},
        {"Ⅸ", "ⅧⅠ"},
    };
    return pairs;
}

const ReplacementList& archaicRewrites() {
    static const ReplacementList pairs = {
        {"Ⅵ", "ↅ"},
        {"Ⅼ", "ↆ"},
    };
    return pairs;
}

const ReplacementList& asciiRewrites() {
    static const ReplacementList pairs = [] {
        ReplacementList list;
        for (const auto& symbol : SymbolTable::instance().symbols()) {
            if (symbol.glyph != symbol.ascii) {
                list.emplace_back(symbol.glyph, symbol.ascii);
            }
        }
        list.emplace_back("ↅ", "VI");
        list.emplace_back("ↆ", "L");
        list.emplace_back("ↀ", "CD");
        list.emplace_back(glyphs::kEnclosure, glyphs::kEnclosureAscii);
        list.emplace_back("ↁ", "DO");
        list.emplace_back("ↂ", "CCDO");
        list.emplace_back("ↇ", "DOO");
        list.emplace_back("ↈ", "CCCDOO");
        return list;
    }();
    return pairs;
}

const ReplacementList& claudianRewrites() {
    static const ReplacementList pairs = {
        {"ⅭⅭↀↃↃ", "ↈ"},
        {"ⅮↃↃ", "ↇ"},
        {"ⅭↀↃ", "ↂ"},
        {"ⅮↃ", "ↁ"},
    };
    return pairs;
}

}  // namespace roman
}  // namespace numeral
