#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstdint>

#include <string>
#include <vector>

#include "numeral_api.hpp"

namespace py = pybind11;

// =============================================================================
// pybind11 模块定义
// =============================================================================

PYBIND11_MODULE(_numeral, m) {
    m.doc() = "Numeral - integer to numeral conversion Python bindings";

    // =========================================================================
    // 异常类型
    // =========================================================================

    // 派生类后注册，优先匹配
    auto& numeral_error =
        py::register_exception<numeral::NumeralError>(m, "NumeralError", PyExc_ValueError);
    py::register_exception<numeral::ConfigurationError>(m, "ConfigurationError", numeral_error.ptr());
    py::register_exception<numeral::InvalidInputError>(m, "InvalidInputError", numeral_error.ptr());
    py::register_exception<numeral::FormatError>(m, "FormatError", numeral_error.ptr());
    py::register_exception<numeral::UnsupportedError>(m, "UnsupportedError", numeral_error.ptr());

    // =========================================================================
    // 枚举类型
    // =========================================================================

    py::enum_<numeral::ErrorCode>(m, "ErrorCode", "Error codes")
        .value("OK", numeral::ErrorCode::OK)
        .value("INVALID_CONFIG", numeral::ErrorCode::INVALID_CONFIG,
            "Option combination cannot express the input")
        .value("INVALID_INPUT", numeral::ErrorCode::INVALID_INPUT,
            "Input contains characters outside the accepted set")
        .value("INVALID_FORMAT", numeral::ErrorCode::INVALID_FORMAT,
            "Strict grammar validation failed")
        .value("UNSUPPORTED", numeral::ErrorCode::UNSUPPORTED,
            "Large-number notation cannot be decoded")
        .export_values();

    // =========================================================================
    // RomanConfig - 编码配置
    // =========================================================================

    py::class_<numeral::RomanConfig>(m, "RomanConfig", "Roman numeral encoding options")
        .def(py::init<>(), "Create default configuration")

        .def_readwrite("only_ascii", &numeral::RomanConfig::only_ascii, "ASCII letters only")
        .def_readwrite("uppercase", &numeral::RomanConfig::uppercase, "Uppercase output")
        .def_readwrite("archaic", &numeral::RomanConfig::archaic, "Use archaic ligatures")
        .def_readwrite("alternatives", &numeral::RomanConfig::alternatives,
            "Ordered (pattern, replacement) glyph substitutions")
        .def_readwrite("only_additive", &numeral::RomanConfig::only_additive,
            "Additive notation only (IIII instead of IV)")
        .def_readwrite("extended", &numeral::RomanConfig::extended,
            "Allow zero and values beyond the standard range")
        .def_readwrite("claudian", &numeral::RomanConfig::claudian,
            "Claudian notation for large numbers (else apostrophus)")
        .def_readwrite("signed", &numeral::RomanConfig::allow_signed, "Allow negative numbers")
        .def_readwrite("negative_sign", &numeral::RomanConfig::negative_sign, "Negative sign")

        .def_static("Default", &numeral::RomanConfig::Default, "Default configuration")
        .def_static("Ascii", &numeral::RomanConfig::Ascii, "ASCII-only configuration")
        .def_static("Additive", &numeral::RomanConfig::Additive, "Additive-only configuration")
        .def_static("Classical", &numeral::RomanConfig::Classical,
            "ASCII, 1-3999, unsigned configuration")

        .def("__repr__", [](const numeral::RomanConfig& config) {
            return std::string("<RomanConfig") +
                " ascii=" + (config.only_ascii ? "true" : "false") +
                " additive=" + (config.only_additive ? "true" : "false") +
                " extended=" + (config.extended ? "true" : "false") +
                " claudian=" + (config.claudian ? "true" : "false") + ">";
        });

    // =========================================================================
    // RomanGrammar - 严格模式语法
    // =========================================================================

    py::class_<numeral::RomanGrammar>(m, "RomanGrammar", "Strict-mode grammar")
        .def_static("Standard", &numeral::RomanGrammar::Standard, "Canonical 1-3999 grammar")
        .def_static("Additive", &numeral::RomanGrammar::Additive, "Additive-only 1-4999 grammar")
        .def("matches", &numeral::RomanGrammar::matches, py::arg("text"),
            "Check a normalized ASCII numeral");

    // =========================================================================
    // 转换函数
    // =========================================================================

    m.def("int_to_tokens", &numeral::intToTokens,
        py::arg("num"), py::arg("tokens"), py::arg("negative_sign") = "-",
        "Encode an integer in bijective base-k over the given tokens");
    m.def("tokens_to_int", &numeral::tokensToInt,
        py::arg("text"), py::arg("tokens"), py::arg("negative_sign") = "-",
        "Decode a bijective base-k token string");
    m.def("int_to_letters", &numeral::intToLetters,
        py::arg("num"), py::arg("alphabet") = std::string(numeral::kDefaultAlphabet),
        py::arg("negative_sign") = "-",
        "Encode an integer as letters (a, b, ..., z, aa, ...)");
    m.def("letters_to_int", &numeral::lettersToInt,
        py::arg("text"), py::arg("alphabet") = std::string(numeral::kDefaultAlphabet),
        py::arg("negative_sign") = "-",
        "Decode a letter string");
    m.def("int_to_roman", &numeral::intToRoman,
        py::arg("num"), py::arg("config") = numeral::RomanConfig(),
        "Encode an integer as a Roman numeral");
    m.def("roman_to_int", &numeral::romanToInt,
        py::arg("text"), py::arg("strict") = false,
        py::arg("grammar") = numeral::RomanGrammar::Standard(),
        py::arg("negative_sign") = "-",
        "Decode a Roman numeral");
    m.def("is_roman_numeral", &numeral::isRomanNumeral, py::arg("text"),
        "Check whether a string decodes as a Roman numeral");
    m.def("multi_replace", &numeral::rewrite, py::arg("text"), py::arg("replaces"),
        "Apply ordered literal replacements");

    // =========================================================================
    // 模块级属性
    // =========================================================================

    m.attr("__version__") = numeral::getVersion();
}
