#pragma once

#include <cstdint>
#include <string>

namespace frostcoord {

using SessionId = std::string;
using GroupId = std::string;
using ParticipantId = std::string;

constexpr uint32_t kMinThreshold = 1;
constexpr uint32_t kMaxThreshold = 7;
constexpr size_t kMessageHashLen = 32;

}  // namespace frostcoord
