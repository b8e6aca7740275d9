#include <cstdint>
#include <cstring>

#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/text/token_utils.hpp"
#include "numeral_api.hpp"

// One requested conversion from the command line
struct Request {
    char kind;          // r, R, l, L, b, B
    std::string value;
};

void printUsage(const char* program) {
    std::cout << "用法: " << program << " [选项] [转换...]\n"
        << "\n"
        << "转换:\n"
        << "  -r <n>         整数 -> 罗马数字\n"
        << "  -R <text>      罗马数字 -> 整数\n"
        << "  -l <n>         整数 -> 字母编号 (a, b, ..., z, aa, ...)\n"
        << "  -L <text>      字母编号 -> 整数\n"
        << "  -b <n>         整数 -> 自定义 token (需要 -t)\n"
        << "  -B <text>      自定义 token -> 整数 (需要 -t)\n"
        << "\n"
        << "选项:\n"
        << "  -t <file>      token 列表文件 (每行一个 token)\n"
        << "  -a <alphabet>  字母编号使用的字母表 (默认: a-z)\n"
        << "  --ascii        罗马数字仅输出 ASCII\n"
        << "  --additive     仅加法记数 (IIII 而非 IV)\n"
        << "  --lower        小写输出\n"
        << "  --apostrophus  大数使用 apostrophus 记法\n"
        << "  --archaic      使用古体合字\n"
        << "  --classical    古典范围 (1-3999，无零与负数)\n"
        << "  --strict       严格校验罗马数字语法\n"
        << "  -h             显示帮助\n"
        << "\n"
        << "不带转换参数时打印示例表。\n"
        << "\n"
        << "示例:\n"
        << "  " << program << " -r 1666 --ascii        # MDCLXVI\n"
        << "  " << program << " -R MMXXIV --strict     # 2024\n"
        << "  " << program << " -l 1983                # bxh\n"
        << "  " << program << " -t tokens.txt -b 161\n"
        << std::endl;
}

void printSamples(const numeral::RomanConfig& config) {
    const std::vector<int64_t> samples = {
        -12, 0, 1, 4, 9, 12, 14, 44, 99, 1666, 1983, 3999, 4000, 16384, 65536, 100000,
    };

    std::cout << "numeral " << numeral::getVersion() << "\n" << std::endl;
    for (int64_t n : samples) {
        std::cout << n << "\t";
        try {
            std::cout << numeral::intToRoman(n, config);
        } catch (const numeral::NumeralError& e) {
            std::cout << "(" << numeral::errorCodeToString(e.code()) << ")";
        }
        std::cout << "\t" << numeral::intToLetters(n) << std::endl;
    }
}

std::string convert(const Request& request,
                    const numeral::RomanConfig& config,
                    bool strict,
                    const std::string& alphabet,
                    const std::vector<std::string>& tokens) {
    switch (request.kind) {
        case 'r':
            return numeral::intToRoman(std::stoll(request.value), config);
        case 'R':
            return std::to_string(numeral::romanToInt(
                request.value,
                strict,
                config.only_additive ? numeral::RomanGrammar::Additive()
                                     : numeral::RomanGrammar::Standard(),
                config.negative_sign));
        case 'l':
            return numeral::intToLetters(std::stoll(request.value), alphabet);
        case 'L':
            return std::to_string(numeral::lettersToInt(request.value, alphabet));
        case 'b':
            return numeral::intToTokens(std::stoll(request.value), tokens);
        case 'B':
            return std::to_string(numeral::tokensToInt(request.value, tokens));
        default:
            return "";
    }
}

int main(int argc, char* argv[]) {
    numeral::RomanConfig config;
    std::string alphabet = numeral::kDefaultAlphabet;
    std::string tokens_file;
    bool strict = false;
    std::vector<Request> requests;

    // 解析参数
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "--ascii") == 0) {
            config.only_ascii = true;
        } else if (strcmp(argv[i], "--additive") == 0) {
            config.only_additive = true;
        } else if (strcmp(argv[i], "--lower") == 0) {
            config.uppercase = false;
        } else if (strcmp(argv[i], "--apostrophus") == 0) {
            config.claudian = false;
        } else if (strcmp(argv[i], "--archaic") == 0) {
            config.archaic = true;
        } else if (strcmp(argv[i], "--classical") == 0) {
            config.extended = false;
            config.allow_signed = false;
        } else if (strcmp(argv[i], "--strict") == 0) {
            strict = true;
        } else if (strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            tokens_file = argv[++i];
        } else if (strcmp(argv[i], "-a") == 0 && i + 1 < argc) {
            alphabet = argv[++i];
        } else if (argv[i][0] == '-' && argv[i][1] != '\0' && argv[i][2] == '\0' &&
                   strchr("rRlLbB", argv[i][1]) != nullptr && i + 1 < argc) {
            requests.push_back({argv[i][1], argv[i + 1]});
            ++i;
        } else {
            std::cerr << "Warning: 忽略未知参数 '" << argv[i] << "'" << std::endl;
        }
    }

    if (requests.empty()) {
        printSamples(config);
        return 0;
    }

    std::vector<std::string> tokens;
    if (!tokens_file.empty()) {
        try {
            tokens = numeral::text::readTokenList(tokens_file);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
    }

    int status = 0;
    for (const auto& request : requests) {
        if ((request.kind == 'b' || request.kind == 'B') && tokens_file.empty()) {
            std::cerr << "Error: -" << request.kind << " 需要 -t 指定 token 文件" << std::endl;
            status = 1;
            continue;
        }

        try {
            std::cout << request.value << " -> "
                << convert(request, config, strict, alphabet, tokens) << std::endl;
        } catch (const numeral::NumeralError& e) {
            std::cerr << "Error [" << numeral::errorCodeToString(e.code()) << "]: "
                << e.what() << std::endl;
            status = 1;
        } catch (const std::logic_error& e) {
            // std::stoll rejects non-numeric or out-of-range arguments
            std::cerr << "Error: 无效整数 '" << request.value << "' (" << e.what() << ")" << std::endl;
            status = 1;
        }
    }

    return status;
}
