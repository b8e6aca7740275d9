#ifndef NUMERAL_ROMAN_TABLES_HPP
#define NUMERAL_ROMAN_TABLES_HPP

/**
 * RomanTables - 罗马数字静态表
 *
 * 所有表在首次使用时构建一次，之后只读，可被多线程同时访问。
 */

#include <cstdint>

#include <string>
#include <unordered_map>
#include <vector>

#include "internal/numeral_types.hpp"

namespace numeral {
namespace roman {

// =============================================================================
// 特殊字形
// =============================================================================

namespace glyphs {

extern const char* const kZero;             ///< 零: N
extern const char* const kEnclosure;        ///< Claudian 右括号: Ↄ (U+2183)
extern const char* const kEnclosureAscii;   ///< Claudian 右括号的 ASCII 替代: O
extern const char* const kClaudianOpen;     ///< Claudian 左括号: Ⅽ
extern const char* const kClaudianHalf;     ///< Claudian 半量级前缀: Ⅾ
extern const char* const kClaudianUnit;     ///< Claudian 中心: ↀ
extern const char* const kClaudianBase;     ///< 量级为 0 时的中心: M (ASCII)

}  // namespace glyphs

// =============================================================================
// RomanSymbol (符号表项)
// =============================================================================

struct RomanSymbol {
    std::string glyph;      ///< Unicode 大写字形
    std::string ascii;      ///< ASCII 转写
    int64_t value;          ///< 数值
    bool ligature_only;     ///< 仅由后处理合并产生 (11, 12)
};

// =============================================================================
// SymbolTable (符号表)
// =============================================================================

/**
 * @brief 标准罗马数字符号表
 *
 * 同一份数据提供两个视图：
 * - additive(): 按数值降序，排除合字与零，供编码扫描使用
 * - findGlyph(): 按 Unicode 字形取回表项
 */
class SymbolTable {
public:
    static const SymbolTable& instance();

    /// @brief 全部符号，按数值降序 (零在最后)
    const std::vector<RomanSymbol>& symbols() const { return symbols_; }

    /// @brief 参与加减法扫描的符号，按数值降序
    const std::vector<const RomanSymbol*>& additive() const { return additive_; }

    /// @brief 按 Unicode 字形查找，未找到返回 nullptr
    const RomanSymbol* findGlyph(const std::string& glyph) const;

    /// @brief 单字母 ASCII 符号的数值，非罗马数字字母返回 -1
    int64_t asciiValue(char c) const;

    /// @brief 最大的标准符号数值 (1000)
    int64_t maxStandardValue() const { return max_standard_value_; }

    SymbolTable(const SymbolTable&) = delete;
    SymbolTable& operator=(const SymbolTable&) = delete;

private:
    SymbolTable();

    std::vector<RomanSymbol> symbols_;
    std::vector<const RomanSymbol*> additive_;
    std::unordered_map<std::string, size_t> by_glyph_;
    std::unordered_map<char, int64_t> by_ascii_;
    int64_t max_standard_value_ = 0;
};

// =============================================================================
// Apostrophus 大数符号
// =============================================================================

struct ApostrophusSymbol {
    std::string glyph;
    int64_t value;
};

/// @brief ↀ 1000, ↁ 5000, ↂ 10000, ↇ 50000, ↈ 100000
const std::vector<ApostrophusSymbol>& apostrophusSymbols();

/// @brief 按数值查找 apostrophus 字形，未列表的数值返回 nullptr
const std::string* findApostrophus(uint64_t value);

/// @brief 全部 apostrophus 字形
std::vector<std::string> apostrophusGlyphs();

// =============================================================================
// 固定替换表
// =============================================================================

/// @brief 合字: ⅩⅠ -> Ⅺ, ⅩⅡ -> Ⅻ
const ReplacementList& ligatureRewrites();

/// @brief 仅加法: Ⅳ -> ⅡⅡ, Ⅸ -> ⅧⅠ
const ReplacementList& additiveRewrites();

/// @brief 古体: Ⅵ -> ↅ, Ⅼ -> ↆ
const ReplacementList& archaicRewrites();

/// @brief Unicode -> ASCII 转写 (含合字、古体与大数字形)
const ReplacementList& asciiRewrites();

/**
 * @brief Claudian 整块 -> apostrophus 字形: ⅭⅭↀↃↃ -> ↈ, ⅮↃↃ -> ↇ, ⅭↀↃ -> ↂ, ⅮↃ -> ↁ
 *
 * 只能按整块替换：较小的块也会出现在更大的块内部 (ⅭⅭↀↃↃ ⊂ ⅭⅭⅭↀↃↃↃ)，
 * 因此不要直接交给 text::rewrite。
 */
const ReplacementList& claudianRewrites();

}  // namespace roman
}  // namespace numeral

#endif  // NUMERAL_ROMAN_TABLES_HPP
