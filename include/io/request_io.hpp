#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "common/config.hpp"
#include "common/types.hpp"

namespace routeopt::io {

// RequestIO：JSON 文件 -> RouterConfig / RoutingRequest。
//
// config.json（所有键都可省略）：
//   { "log_level": "info",
//     "geocoder":   { "base_url", "user_agent", "timeout_s", "max_retries",
//                     "backoff_base_ms", "min_interval_ms", "max_variations",
//                     "candidate_limit", "worker_threads" },
//     "clustering": { "algorithm": "greedy|centroid", "max_stops_per_route" },
//     "optimizer":  { "use_trip_service", "base_url", "profile", "timeout_s", "parallel",
//                     "max_workers" },
//     "export":     { "creator", "depot_name" } }
//
// geocode / 完整流程请求：
//   { "addresses": [ "123 Main St ..." | { "address", "original_address", "name",
//                     "phone", "household_size", "special_items", "notes" } ],
//     "originalAddresses": [ ... ]   （可选，展示用标签）
//     "depot_index": 0, "radius_miles": 100, "max_stops_per_route": 4 }
//
// 只做优化的请求（locations 已带坐标）：
//   { "locations": [ { "address", "lat", "lon", "display_name", ... } ],
//     "depot" | "start": { "address", "lat", "lon" },
//     "max_stops_per_route": 4 }
class RequestIO {
public:
  static RouterConfig LoadConfig(const std::string& path);
  static RouterConfig ParseConfig(const nlohmann::json& j);

  // 请求里没给 max_stops_per_route 时用 max_stops_default。
  static RoutingRequest LoadRequest(const std::string& path, int max_stops_default);
  static RoutingRequest ParseRequest(const nlohmann::json& j, int max_stops_default);

  // [{address, originalAddress, displayName, lat, lon, distanceFromStart}
  //  | {address, status, error}]
  static nlohmann::json GeocodeResponse(const std::vector<GeocodeResult>& results);
};

} // namespace routeopt::io
