#pragma once
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/types.hpp"

namespace routeopt {

// 路线汇总：文本版给司机看，JSON 版给装箱单生成等下游工具用。两者都不带时间戳。
class ManifestWriter {
public:
  static std::string Text(const RouteSet& routes,
                          const std::optional<Depot>& depot,
                          const std::vector<ClusterFailure>& failures);

  static nlohmann::json Json(const RouteSet& routes,
                             const std::optional<Depot>& depot,
                             const std::vector<ClusterFailure>& failures);
};

} // namespace routeopt
