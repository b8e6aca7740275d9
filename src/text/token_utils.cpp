#include "internal/text/token_utils.hpp"

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace numeral {
namespace text {

std::vector<std::string> readTokenList(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open tokens file: " + path);
    }

    std::vector<std::string> tokens;
    std::string line;
    while (std::getline(file, line)) {
        // Files written on Windows keep the CR
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            tokens.push_back(line);
        }
    }

    return tokens;
}

}  // namespace text
}  // namespace numeral
