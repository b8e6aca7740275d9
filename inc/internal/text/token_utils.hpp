#ifndef NUMERAL_TOKEN_UTILS_HPP
#define NUMERAL_TOKEN_UTILS_HPP

/**
 * TokenUtils - Token 字母表读取工具模块
 *
 * 从文件读取自定义双射进制使用的 token 列表。
 */

#include <string>
#include <vector>

namespace numeral {
namespace text {

/**
 * @brief 读取 token 列表文件
 * @param path 文件路径
 * @return 按文件顺序排列的 token 列表
 * @throws std::runtime_error 如果文件无法打开
 *
 * 文件格式：每行一个 token。空行被忽略，token 的数值是它在非空行中的序号
 * (0-indexed)。行尾的 '\r' 会被去除，token 内部的空格保留。
 */
std::vector<std::string> readTokenList(const std::string& path);

}  // namespace text
}  // namespace numeral

#endif  // NUMERAL_TOKEN_UTILS_HPP
