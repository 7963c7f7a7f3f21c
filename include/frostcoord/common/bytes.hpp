#pragma once

#include <cstdint>
#include <vector>

namespace frostcoord {

using Bytes = std::vector<uint8_t>;

}  // namespace frostcoord
