#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace frostcoord {

// Shared "frostcoord" logger, created with a colour stdout sink on first use.
std::shared_ptr<spdlog::logger> Log();

// Accepts spdlog level names; an unrecognised name falls back to info.
void SetLogLevel(const std::string& level);

// First 8 characters of a session id, enough to correlate log lines.
std::string ShortId(std::string_view id);

}  // namespace frostcoord
