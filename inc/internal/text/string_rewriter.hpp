#ifndef NUMERAL_STRING_REWRITER_HPP
#define NUMERAL_STRING_REWRITER_HPP

/**
 * StringRewriter - 有序字面替换
 *
 * 按顺序应用 (pattern, replacement) 列表：每一对在当前文本中替换全部出现之后，
 * 才处理下一对。后面的替换可以匹配前面替换产生的结果；整个列表只遍历一次。
 */

#include <string>

#include "internal/numeral_types.hpp"

namespace numeral {
namespace text {

/**
 * @brief 替换文本中所有出现的子串 (从左到右，不重叠)
 * @param text 输入文本
 * @param pattern 要替换的子串，不能为空
 * @param replacement 替换内容
 * @return 替换后的文本
 * @throws ConfigurationError 如果 pattern 为空
 */
std::string replaceAll(const std::string& text,
                       const std::string& pattern,
                       const std::string& replacement);

/**
 * @brief 按顺序执行多组替换
 * @param text 输入文本
 * @param pairs 替换表，格式 {{old, new}, ...}
 * @return 替换后的文本
 * @throws ConfigurationError 如果某个 pattern 为空
 *
 * 示例:
 *   rewrite("python.best", {{"thon", "mrt"}, {"est", "ase"}})  -> "pymrt.base"
 *   rewrite("x-x-x-x", {{"x", "est"}, {"est", "test"}})         -> "test-test-test-test"
 *   rewrite("x-x-", {{"-x-", ".test"}})                          -> "x.test"
 */
std::string rewrite(const std::string& text, const ReplacementList& pairs);

/**
 * @brief 交换每一对的 pattern 与 replacement，顺序不变
 */
ReplacementList invert(const ReplacementList& pairs);

}  // namespace text
}  // namespace numeral

#endif  // NUMERAL_STRING_REWRITER_HPP
