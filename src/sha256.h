#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace pefeat {

// Lower-case hex digest; empty string if the digest could not be computed.
std::string sha256_hex(const std::vector<std::uint8_t>& data);

}
