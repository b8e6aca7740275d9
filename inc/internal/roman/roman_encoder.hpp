#ifndef NUMERAL_ROMAN_ENCODER_HPP
#define NUMERAL_ROMAN_ENCODER_HPP

/**
 * RomanEncoder - 整数转罗马数字
 *
 * 支持负数、零、减法/纯加法记数，以及超出 1-3999 的大数
 * (Claudian 或 apostrophus 记法)。
 */

#include <cstdint>

#include <string>
#include <vector>

#include "internal/numeral_config.hpp"
#include "internal/roman/roman_tables.hpp"

namespace numeral {
namespace roman {

// =============================================================================
// RepeatLimiter (连续重复限制)
// =============================================================================

/**
 * @brief 限制同一符号连续出现次数的状态机
 *
 * 记录 (上一个输出符号, 连续次数)。当再输出一次会达到上限时，
 * 改为删除已输出的 (上限 - 1) 个重复，并追加扫描中遇到的上一个更大符号，
 * 例如 ⅩⅩⅩ + Ⅹ -> ⅩⅬ。
 */
class RepeatLimiter {
public:
    enum class Action {
        APPEND,         // 追加匹配的符号
        REPLACE_RUN,    // 用更大的符号替换当前重复
    };

    struct Decision {
        Action action;
        const RomanSymbol* symbol;
    };

    explicit RepeatLimiter(int max_consecutive);

    /**
     * @brief 决定如何输出匹配到的符号
     * @param matched 本次匹配的符号
     * @param larger 扫描中位于 matched 之前的更大符号，可为 nullptr
     */
    Decision decide(const RomanSymbol* matched, const RomanSymbol* larger);

    /// @brief 将决定应用到输出缓冲
    void apply(const Decision& decision, std::vector<std::string>& output) const;

private:
    int max_consecutive_;
    const RomanSymbol* last_ = nullptr;
    int run_length_ = 0;    // 与 last_ 相同的后续符号个数
};

// =============================================================================
// 编码
// =============================================================================

/// @brief 连续重复上限：减法记数 3，纯加法记数 4
int maxConsecutive(bool only_additive);

/// @brief 标准记法可表示的上限 (不含)：1000 * (maxConsecutive + 1)
uint64_t standardThreshold(bool only_additive);

/**
 * @brief 将整数转换为罗马数字
 * @param num 要转换的整数
 * @param config 编码配置
 * @return 罗马数字字符串
 * @throws ConfigurationError 负数但未启用 allow_signed；零或大数但未启用 extended；
 *         apostrophus 记法无法表示的量级；替换表中有空 pattern
 *
 * 示例:
 *   intToRoman(1666)                        -> "ⅯⅮⅭⅬⅩⅥ"
 *   intToRoman(1666, RomanConfig::Ascii())  -> "MDCLXVI"
 *   intToRoman(4000, RomanConfig::Ascii())  -> "MDO"
 *   intToRoman(0)                           -> "N"
 */
std::string intToRoman(int64_t num, const RomanConfig& config = RomanConfig());

}  // namespace roman
}  // namespace numeral

#endif  // NUMERAL_ROMAN_ENCODER_HPP
