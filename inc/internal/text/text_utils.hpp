#ifndef NUMERAL_TEXT_UTILS_HPP
#define NUMERAL_TEXT_UTILS_HPP

/**
 * TextUtils - 文本处理工具模块
 *
 * 提供 UTF-8 字符串分割、罗马数字字形的大小写转换、空白裁剪等功能。
 */

#include <cstdint>

#include <string>
#include <vector>

namespace numeral {
namespace text {

// =============================================================================
// UTF-8 字符串处理
// =============================================================================

/**
 * @brief 将 UTF-8 字符串分割为单个字符
 * @param str UTF-8 编码的字符串
 * @return 每个 UTF-8 字符组成的向量
 *
 * 截断的多字节序列会作为一个不完整字符保留，以便调用方将其报告为非法字符。
 */
std::vector<std::string> splitUtf8(const std::string& str);

/**
 * @brief 解码单个 UTF-8 字符
 * @param ch UTF-8 编码的单个字符
 * @return Unicode 码位，非法序列返回 0xFFFD
 */
uint32_t decodeUtf8Char(const std::string& ch);

/**
 * @brief 将 Unicode 码位编码为 UTF-8
 * @param cp Unicode 码位
 * @return UTF-8 字符串
 */
std::string encodeUtf8(uint32_t cp);

// =============================================================================
// 大小写转换
// =============================================================================

/**
 * @brief 转为大写
 *
 * 覆盖 ASCII 字母、罗马数字形式 (U+2170-217F -> U+2160-216F)
 * 以及反向 C (U+2184 -> U+2183)。其他字符原样保留。
 */
std::string toUpperNumeral(const std::string& str);

/**
 * @brief 转为小写 (toUpperNumeral 的逆操作)
 */
std::string toLowerNumeral(const std::string& str);

// =============================================================================
// 其他
// =============================================================================

/// @brief 去除首尾 ASCII 空白字符
std::string trim(const std::string& str);

/**
 * @brief 判断字符串是否包含任一子串
 * @param str 要检查的字符串
 * @param needles 子串列表
 */
bool containsAny(const std::string& str, const std::vector<std::string>& needles);

}  // namespace text
}  // namespace numeral

#endif  // NUMERAL_TEXT_UTILS_HPP
