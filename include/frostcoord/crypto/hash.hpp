#pragma once

#include <span>

#include "frostcoord/common/bytes.hpp"

namespace frostcoord {

Bytes Sha256(std::span<const uint8_t> data);

}  // namespace frostcoord
