#ifndef NUMERAL_ROMAN_GRAMMAR_HPP
#define NUMERAL_ROMAN_GRAMMAR_HPP

/**
 * RomanGrammar - 严格模式语法
 *
 * 把罗马数字拆成若干固定分组 (千、百、十、个)，每组独立校验
 * 允许的重复次数与减法组合。不依赖正则引擎。
 */

#include <string>
#include <vector>

namespace numeral {
namespace roman {

// =============================================================================
// GrammarGroup (分组规则)
// =============================================================================

/**
 * @brief 单个数位分组
 *
 * 匹配以下之一：
 * - unit + ten 或 unit + five (仅当 allow_subtractive)
 * - 可选的 five，后跟 0..max_repeats 个 unit
 */
struct GrammarGroup {
    char unit;                  ///< 单位符号，如 'X'
    char five;                  ///< 五倍符号，如 'L'，'\0' 表示无
    char ten;                   ///< 十倍符号，如 'C'，'\0' 表示无
    int max_repeats;            ///< unit 最多连续出现次数
    bool allow_subtractive;     ///< 是否允许 unit+five / unit+ten
};

// =============================================================================
// RomanGrammar (语法)
// =============================================================================

struct RomanGrammar {
    std::vector<GrammarGroup> groups;   ///< 从高位到低位

    /**
     * @brief 标准语法：1-3999
     *
     * 等价于 ^M{0,3}(CM|CD|D?C{0,3})(XC|XL|L?X{0,3})(IX|IV|V?I{0,3})$，且不能为空。
     */
    static RomanGrammar Standard();

    /**
     * @brief 纯加法语法：1-4999，每组最多 4 次重复，不允许减法组合
     */
    static RomanGrammar Additive();

    /**
     * @brief 检查已规范化 (大写 ASCII) 的文本是否符合语法
     * @param text 不含负号的罗马数字
     * @return 整个文本被各分组完整消费且非空时返回 true
     */
    bool matches(const std::string& text) const;
};

}  // namespace roman
}  // namespace numeral

#endif  // NUMERAL_ROMAN_GRAMMAR_HPP
