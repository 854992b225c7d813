#include "HexString.hpp"
#include <iomanip>
#include <sstream>

namespace ipsec {

std::string toHexString(const std::span<const uint8_t> bytes) {
    std::stringstream ss;
    ss << std::hex << std::uppercase;
    for (const uint8_t byte : bytes) {
        ss << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return ss.str();
}

}
