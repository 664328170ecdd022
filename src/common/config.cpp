#include "common/config.hpp"
#include "common/errors.hpp"

namespace routeopt {

void ValidateConfig(const RouterConfig& cfg) {
  auto fail = [](const std::string& what) {
    throw RouteOptError(ErrorCode::kConfigInvalid, what);
  };

  const auto& g = cfg.geocoder;
  if (g.timeout_s <= 0.0) fail("geocoder.timeout_s must be > 0");
  if (g.max_retries < 1) fail("geocoder.max_retries must be >= 1");
  if (g.backoff_base_ms < 0) fail("geocoder.backoff_base_ms must be >= 0");
  if (g.min_interval_ms < 0) fail("geocoder.min_interval_ms must be >= 0");
  if (g.max_variations < 1) fail("geocoder.max_variations must be >= 1");
  if (g.candidate_limit < 1) fail("geocoder.candidate_limit must be >= 1");
  if (g.worker_threads < 1) fail("geocoder.worker_threads must be >= 1");

  const auto& c = cfg.clustering;
  if (c.algorithm != "greedy" && c.algorithm != "centroid") {
    fail("clustering.algorithm must be 'greedy' or 'centroid', got '" + c.algorithm + "'");
  }
  // max_stops_per_route 由 ClusterStage 检查（ClusterConfigInvalid），请求里可以覆盖它。

  if (cfg.optimizer.timeout_s <= 0.0) fail("optimizer.timeout_s must be > 0");
  if (cfg.optimizer.max_workers < 1) fail("optimizer.max_workers must be >= 1");
}

} // namespace routeopt
