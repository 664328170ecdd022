#pragma once
#include <string>

namespace routeopt {

// Configures the default spdlog logger: console sink, short time pattern.
// level: trace / debug / info / warn / error / off (unknown names => info).
void InitLogging(const std::string& level);

} // namespace routeopt
