#ifndef NUMERAL_ROMAN_DECODER_HPP
#define NUMERAL_ROMAN_DECODER_HPP

/**
 * RomanDecoder - 罗马数字转整数
 *
 * 接受 ASCII、Unicode 数字形式 (大小写均可)、合字与古体字形。
 * 宽松模式按 "后面出现更大符号则减，否则加" 的规则计算，
 * 因此 "IIM" = 998、"VL" = 45 这类非规范写法也能解码。
 */

#include <cstdint>

#include <string>

#include "internal/roman/roman_grammar.hpp"

namespace numeral {
namespace roman {

/**
 * @brief 判断字符是否为规范 ASCII 罗马数字字符
 * @param c 要检查的字符 (大小写均可)
 * @return true 如果是 I, V, X, L, C, D, M, N 之一
 */
bool isRomanNumeralChar(char c);

/**
 * @brief 将罗马数字转换为整数
 * @param text 罗马数字字符串 (首尾空白会被忽略)
 * @param strict 是否按 grammar 严格校验
 * @param grammar 严格模式使用的语法
 * @param negative_sign 负号 (只允许出现在开头)
 * @return 对应的整数值
 * @throws InvalidInputError 非法字符、负号位置错误、空输入、零与其他符号混用
 * @throws UnsupportedError 包含 Claudian 或 apostrophus 大数记法
 * @throws FormatError 严格模式下不符合语法
 * @throws ConfigurationError 负号为空，或 (大写后) 含有罗马数字符号
 *
 * 示例:
 *   romanToInt("MDCLXVI")             -> 1666
 *   romanToInt("IC")                  -> 99
 *   romanToInt("MMMMMM")              -> 6000
 *   romanToInt("MMMMMM", true)        -> FormatError
 */
int64_t romanToInt(const std::string& text,
                   bool strict = false,
                   const RomanGrammar& grammar = RomanGrammar::Standard(),
                   const std::string& negative_sign = "-");

/**
 * @brief 判断字符串是否可以被宽松模式解码
 * @param str 要检查的字符串
 * @return true 如果 romanToInt(str) 会成功
 */
bool isRomanNumeral(const std::string& str);

}  // namespace roman
}  // namespace numeral

#endif  // NUMERAL_ROMAN_DECODER_HPP
