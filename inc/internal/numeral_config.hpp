#ifndef NUMERAL_CONFIG_HPP
#define NUMERAL_CONFIG_HPP

#include <string>
#include <utility>

#include "numeral_types.hpp"

namespace numeral {

// =============================================================================
// Roman Config (罗马数字编码配置)
// =============================================================================

struct RomanConfig {
    // -------------------------------------------------------------------------
    // 字形选择
    // -------------------------------------------------------------------------

    bool only_ascii = false;            ///< 仅输出 ASCII 字母 (否则使用 Unicode 数字形式)
    bool uppercase = true;              ///< 大写输出
    bool archaic = false;               ///< 使用古体合字 (ↅ, ↆ)
    ReplacementList alternatives;       ///< 自定义替代字形 (按顺序替换)

    // -------------------------------------------------------------------------
    // 记数规则
    // -------------------------------------------------------------------------

    bool only_additive = false;         ///< 仅加法记数 (IIII 而非 IV)
    bool extended = true;               ///< 支持零以及大于标准范围的数值
    bool claudian = true;               ///< 大数使用 Claudian 记法 (否则使用 apostrophus)

    // -------------------------------------------------------------------------
    // 符号
    // -------------------------------------------------------------------------

    bool allow_signed = true;           ///< 支持负数
    std::string negative_sign = "-";    ///< 负号

    // -------------------------------------------------------------------------
    // 便捷构建方法
    // -------------------------------------------------------------------------

    /// @brief 默认配置 (Unicode、扩展范围、Claudian 大数)
    static RomanConfig Default() {
        return RomanConfig();
    }

    /// @brief 纯 ASCII 输出
    static RomanConfig Ascii() {
        RomanConfig config;
        config.only_ascii = true;
        return config;
    }

    /// @brief 仅加法记数
    static RomanConfig Additive() {
        RomanConfig config;
        config.only_additive = true;
        return config;
    }

    /// @brief 古典罗马数字：ASCII、1-3999、无负数
    static RomanConfig Classical() {
        RomanConfig config;
        config.only_ascii = true;
        config.extended = false;
        config.allow_signed = false;
        return config;
    }

    // 链式配置
    RomanConfig withAscii(bool enable = true) const {
        auto c = *this;
        c.only_ascii = enable;
        return c;
    }

    RomanConfig withAdditive(bool enable = true) const {
        auto c = *this;
        c.only_additive = enable;
        return c;
    }

    RomanConfig withExtended(bool enable = true) const {
        auto c = *this;
        c.extended = enable;
        return c;
    }

    RomanConfig withUppercase(bool enable = true) const {
        auto c = *this;
        c.uppercase = enable;
        return c;
    }

    RomanConfig withClaudian(bool enable = true) const {
        auto c = *this;
        c.claudian = enable;
        return c;
    }

    RomanConfig withArchaic(bool enable = true) const {
        auto c = *this;
        c.archaic = enable;
        return c;
    }

    RomanConfig withAlternatives(ReplacementList pairs) const {
        auto c = *this;
        c.alternatives = std::move(pairs);
        return c;
    }

    RomanConfig withSigned(bool enable, const std::string& sign = "-") const {
        auto c = *this;
        c.allow_signed = enable;
        c.negative_sign = sign;
        return c;
    }
};

}  // namespace numeral

#endif  // NUMERAL_CONFIG_HPP
