#ifndef NUMERAL_API_HPP
#define NUMERAL_API_HPP

/**
 * Numeral - 整数与记数符号互转
 *
 * 两类记数系统：
 * - 双射 k 进制：任意 token 集合，特例为字母编号 (a, b, ..., z, aa, ...)
 * - 扩展罗马数字：负数、零、纯加法记数、Claudian / apostrophus 大数记法
 *
 * 使用示例 1 - 罗马数字:
 *
 *   std::string s = numeral::intToRoman(1666);                        // "ⅯⅮⅭⅬⅩⅥ"
 *   std::string a = numeral::intToRoman(1666, numeral::RomanConfig::Ascii());  // "MDCLXVI"
 *   int64_t n = numeral::romanToInt("MDCLXVI");                       // 1666
 *
 * 使用示例 2 - 字母编号:
 *
 *   numeral::intToLetters(26);      // "aa"
 *   numeral::lettersToInt("bxh");   // 1983
 *
 * 使用示例 3 - 自定义 token:
 *
 *   numeral::intToTokens(161, {"po", "ta"});   // "potapopopotata"
 *
 * 所有函数都是无状态的纯函数，可在多线程中同时调用。
 * 失败时抛出 numeral::NumeralError 的子类。
 */

#include "internal/codec/bijective_codec.hpp"
#include "internal/numeral_config.hpp"
#include "internal/numeral_types.hpp"
#include "internal/roman/roman_decoder.hpp"
#include "internal/roman/roman_encoder.hpp"
#include "internal/roman/roman_grammar.hpp"
#include "internal/text/string_rewriter.hpp"

namespace numeral {

// =============================================================================
// 公开接口
// =============================================================================

using codec::kDefaultAlphabet;
using codec::intToTokens;
using codec::tokensToInt;
using codec::intToLetters;
using codec::lettersToInt;

using roman::RomanGrammar;
using roman::intToRoman;
using roman::romanToInt;
using roman::isRomanNumeral;

using text::rewrite;

/// @brief 库版本号
const char* getVersion();

}  // namespace numeral

#endif  // NUMERAL_API_HPP
