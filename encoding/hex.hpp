#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace krbmic {

std::string to_hex(const std::vector<std::uint8_t> &data);

// Accepts upper or lower case; throws Error(InvalidParameter) on odd length
// or a non-hex digit.
std::vector<std::uint8_t> from_hex(const std::string &hex);

} // namespace krbmic
