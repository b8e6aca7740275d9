#ifndef NUMERAL_BIJECTIVE_CODEC_HPP
#define NUMERAL_BIJECTIVE_CODEC_HPP

/**
 * BijectiveCodec - 双射 k 进制编解码
 *
 * 以任意有序、互不相同的 token 集合作为 "数字"，没有零数字，
 * 每个非负整数都有唯一的表示 (与电子表格列名 a, b, ..., z, aa, ab, ... 同理)。
 */

#include <cstdint>

#include <string>
#include <vector>

namespace numeral {
namespace codec {

/// 默认字母表：26 个小写字母
extern const char* const kDefaultAlphabet;

// =============================================================================
// 通用 token 编解码
// =============================================================================

/**
 * @brief 将整数编码为 token 序列
 * @param num 要编码的整数 (负数会加上负号前缀)
 * @param tokens 有序 token 列表 (k = tokens.size())
 * @param negative_sign 负号
 * @return 编码后的字符串
 * @throws ConfigurationError 如果 token 列表为空、含空 token 或重复 token，
 *         或负号中的字符出现在任一 token 中
 *
 * 示例 (tokens = {"po", "ta"}):
 *   0 -> "po", 1 -> "ta", 2 -> "popo", 3 -> "pota", 161 -> "potapopopotata"
 */
std::string intToTokens(int64_t num,
                        const std::vector<std::string>& tokens,
                        const std::string& negative_sign = "-");

/**
 * @brief 将 token 序列解码为整数
 * @param text 编码后的字符串
 * @param tokens 有序 token 列表
 * @param negative_sign 负号 (只允许出现在开头)
 * @return 解码后的整数
 * @throws ConfigurationError 同 intToTokens
 * @throws InvalidInputError 如果文本为空、包含字母表外的字符、无法切分为 token、
 *         负号位置错误，或超出 64 位整数范围
 *
 * 从末尾开始扫描，每一步选取列表中第一个作为剩余文本后缀的 token。
 */
int64_t tokensToInt(const std::string& text,
                    const std::vector<std::string>& tokens,
                    const std::string& negative_sign = "-");

// =============================================================================
// 字母编解码
// =============================================================================

/**
 * @brief 将整数编码为字母序列
 * @param alphabet 字母表，每个 UTF-8 字符是一个数字
 *
 * 示例: 0 -> "a", 23 -> "x", 26 -> "aa", 702 -> "aaa", 1983 -> "bxh"
 */
std::string intToLetters(int64_t num,
                         const std::string& alphabet = kDefaultAlphabet,
                         const std::string& negative_sign = "-");

/**
 * @brief 将字母序列解码为整数 (intToLetters 的逆操作)
 */
int64_t lettersToInt(const std::string& text,
                     const std::string& alphabet = kDefaultAlphabet,
                     const std::string& negative_sign = "-");

}  // namespace codec
}  // namespace numeral

#endif  // NUMERAL_BIJECTIVE_CODEC_HPP
