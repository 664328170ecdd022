#pragma once
#include <string>

namespace routeopt {

// 运行配置。每个字段都有可用的默认值，空配置文件（或没有配置文件）也能直接跑。

struct GeocoderConfig {
  std::string base_url{"https://nominatim.openstreetmap.org"};
  std::string user_agent{"delivery-route-optimizer/1.0"};
  double timeout_s{10.0};
  int max_retries{3};          // 每个变体遇到临时错误时的尝试次数
  int backoff_base_ms{1000};   // 两次尝试间 sleep = base * 2^attempt
  int min_interval_ms{1100};   // provider 限 1 次/秒，留点余量
  int max_variations{8};       // verbatim query included
  int candidate_limit{5};
  int worker_threads{1};       // >1 时并发提交，发出仍经过 rate gate
};

struct ClusteringConfig {
  std::string algorithm{"greedy"}; // greedy | centroid
  int max_stops_per_route{4};
};

struct OptimizerConfig {
  bool use_trip_service{true};
  std::string base_url{"http://router.project-osrm.org"};
  std::string profile{"driving"};
  double timeout_s{30.0};
  bool parallel{true};
  int max_workers{4};          // 同时求解的 cluster 数上限
};

struct ExportConfig {
  std::string creator{"Delivery Route Optimizer"};
  std::string depot_name{"Depot"};
};

struct RouterConfig {
  GeocoderConfig geocoder;
  ClusteringConfig clustering;
  OptimizerConfig optimizer;
  ExportConfig exporter;
  std::string log_level{"info"};
};

// 有越界值时抛 RouteOptError(kConfigInvalid)。
void ValidateConfig(const RouterConfig& cfg);

} // namespace routeopt
