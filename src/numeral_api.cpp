#include "numeral_api.hpp"

namespace numeral {

const char* getVersion() {
    return "1.0.0";
}

}  // namespace numeral
