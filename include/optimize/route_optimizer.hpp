#pragma once
#include <memory>
#include <vector>

#include "common/types.hpp"
#include "optimize/route_solver.hpp"

namespace routeopt {

// ======================
// RouteOptimizer: cluster -> Route
//
// 按优先级依次尝试 solver，第一个通过 CheckRouteInvariants 的结果胜出。
// 非首选 solver 给出的路线标记为 degraded。
// 所有 solver 都失败时，该 cluster 记为失败，不输出残缺路线。
// ======================
class RouteOptimizer {
public:
  RouteOptimizer(std::vector<std::shared_ptr<RouteSolver>> solvers, bool parallel, int max_workers = 4);

  // Throws RouteOptError with the last solver's error code when all fail.
  Route Optimize(const Cluster& cluster) const;

  // 每个 cluster 一条路线，按 cluster 顺序输出。各 cluster 相互独立：
  // parallel == true 时最多 max_workers 个任务并发求解；
  // 某个 cluster 失败或超时只记入 failures，不影响其他 cluster。
  void OptimizeAll(const std::vector<Cluster>& clusters,
                   RouteSet& routes,
                   std::vector<ClusterFailure>& failures) const;

private:
  std::vector<std::shared_ptr<RouteSolver>> solvers_;
  bool parallel_;
  int max_workers_;
};

} // namespace routeopt
