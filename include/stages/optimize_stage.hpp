#pragma once
#include <memory>
#include <utility>
#include "optimize/route_optimizer.hpp"
#include "stages/stage_base.hpp"

namespace routeopt {

// ======================
// Stage：逐个 cluster 求解访问顺序
//
// 输入：
//   ctx.clusters
//
// 输出：
//   ctx.routes            （按 cluster 顺序）
//   ctx.cluster_failures  （没有任何策略能求解的 cluster）
// ======================
class OptimizeStage final : public IStage {
public:
  explicit OptimizeStage(std::shared_ptr<RouteOptimizer> optimizer) : optimizer_(std::move(optimizer)) {}

  const char* Name() const override { return "optimize"; }
  void Run(RoutingContext& ctx) override;

private:
  std::shared_ptr<RouteOptimizer> optimizer_;
};

} // namespace routeopt
