#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace ipsec {

// Upper case hex, two digits per byte, no separators.
[[nodiscard]] std::string toHexString(std::span<const uint8_t> bytes);

}
