#ifndef NUMERAL_TYPES_HPP
#define NUMERAL_TYPES_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace numeral {

// =============================================================================
// Replacement List (有序替换表)
// =============================================================================

/// (pattern, replacement) pairs, applied in order
using ReplacementList = std::vector<std::pair<std::string, std::string>>;

// =============================================================================
// Error Code (错误码)
// =============================================================================

enum class ErrorCode {
    OK = 0,

    // 配置错误 (1xx)
    INVALID_CONFIG = 100,

    // 输入错误 (2xx)
    INVALID_INPUT = 200,
    INVALID_FORMAT = 201,

    // 能力限制 (3xx)
    UNSUPPORTED = 300,
};

inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:             return "OK";
        case ErrorCode::INVALID_CONFIG: return "INVALID_CONFIG";
        case ErrorCode::INVALID_INPUT:  return "INVALID_INPUT";
        case ErrorCode::INVALID_FORMAT: return "INVALID_FORMAT";
        case ErrorCode::UNSUPPORTED:    return "UNSUPPORTED";
        default:                        return "UNKNOWN";
    }
}

// =============================================================================
// Exceptions (异常类型)
// =============================================================================

/**
 * @brief 所有转换错误的基类
 *
 * 转换是原子的：抛出异常时不产生任何部分输出。
 */
class NumeralError : public std::runtime_error {
public:
    NumeralError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

/// 选项组合无法表示该输入，或字母表/符号配置非法
class ConfigurationError : public NumeralError {
public:
    explicit ConfigurationError(const std::string& message)
        : NumeralError(ErrorCode::INVALID_CONFIG, message) {}
};

/// 输入包含非法字符，或负号位置错误
class InvalidInputError : public NumeralError {
public:
    explicit InvalidInputError(const std::string& message)
        : NumeralError(ErrorCode::INVALID_INPUT, message) {}
};

/// 严格模式下语法校验失败
class FormatError : public NumeralError {
public:
    explicit FormatError(const std::string& message)
        : NumeralError(ErrorCode::INVALID_FORMAT, message) {}
};

/// 输入格式正确，但暂不支持解码 (大数记法)
class UnsupportedError : public NumeralError {
public:
    explicit UnsupportedError(const std::string& message)
        : NumeralError(ErrorCode::UNSUPPORTED, message) {}
};

}  // namespace numeral

#endif  // NUMERAL_TYPES_HPP
