#pragma once
#include <memory>
#include <utility>
#include "cluster/clusterer.hpp"
#include "stages/stage_base.hpp"

namespace routeopt {

// ======================
// Stage：聚类
//
// 输入：
//   ctx.stops, ctx.depot, ctx.request.max_stops_per_route
//
// 输出：
//   ctx.clusters
//
// max_stops_per_route < 1 => RouteOptError(kClusterConfigInvalid)，
// 在调用 clusterer 之前就抛出。
// ======================
class ClusterStage final : public IStage {
public:
  explicit ClusterStage(std::shared_ptr<IClusterer> clusterer) : clusterer_(std::move(clusterer)) {}

  const char* Name() const override { return "cluster"; }
  void Run(RoutingContext& ctx) override;

private:
  std::shared_ptr<IClusterer> clusterer_;
};

} // namespace routeopt
