#include "common/log.hpp"

#include <spdlog/spdlog.h>

namespace routeopt {

void InitLogging(const std::string& level) {
  spdlog::set_pattern("[%H:%M:%S] %^%l%$ %v");

  auto lvl = spdlog::level::from_str(level);
  // from_str maps unknown names to "off"; only honour "off" when asked for it
  if (lvl == spdlog::level::off && level != "off") lvl = spdlog::level::info;
  spdlog::set_level(lvl);
}

} // namespace routeopt
