#include "frostcoord/common/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace frostcoord {
namespace {

constexpr char kLoggerName[] = "frostcoord";
constexpr size_t kShortIdLen = 8;

}  // namespace

std::shared_ptr<spdlog::logger> Log() {
  static std::shared_ptr<spdlog::logger> logger = []() {
    std::shared_ptr<spdlog::logger> existing = spdlog::get(kLoggerName);
    if (existing) {
      return existing;
    }
    return spdlog::stdout_color_mt(kLoggerName);
  }();
  return logger;
}

void SetLogLevel(const std::string& level) {
  // from_str maps unknown names to off, which would silence the logger.
  const spdlog::level::level_enum parsed = spdlog::level::from_str(level);
  if (parsed == spdlog::level::off && level != "off") {
    Log()->set_level(spdlog::level::info);
    Log()->warn("unknown log level '{}', logging at info", level);
    return;
  }
  Log()->set_level(parsed);
}

std::string ShortId(std::string_view id) {
  if (id.size() <= kShortIdLen) {
    return std::string(id);
  }
  return std::string(id.substr(0, kShortIdLen)) + "...";
}

}  // namespace frostcoord
