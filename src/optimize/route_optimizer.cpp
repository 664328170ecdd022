#include "optimize/route_optimizer.hpp"

#include <algorithm>
#include <atomic>
#include <future>
#include <optional>
#include <utility>

#include <spdlog/spdlog.h>

#include "common/errors.hpp"

namespace routeopt {

namespace {

struct Outcome {
  std::optional<Route> route;
  std::optional<ClusterFailure> failure;
};

} // namespace

RouteOptimizer::RouteOptimizer(std::vector<std::shared_ptr<RouteSolver>> solvers, bool parallel, int max_workers)
    : solvers_(std::move(solvers)), parallel_(parallel), max_workers_(std::max(1, max_workers)) {}

Route RouteOptimizer::Optimize(const Cluster& cluster) const {
  ErrorCode last_code = ErrorCode::kOptimizeProviderError;
  std::string last_msg = "no route solver configured";

  for (std::size_t i = 0; i < solvers_.size(); ++i) {
    const auto& solver = solvers_[i];
    try {
      Route r = solver->Solve(cluster);
      CheckRouteInvariants(r, cluster);
      r.degraded = (i > 0);
      if (r.degraded) {
        spdlog::warn("[optimize] cluster {}: using fallback '{}'", cluster.id, solver->Name());
      }
      return r;
    } catch (const RouteOptError& e) {
      last_code = e.code();
      last_msg = e.what();
      spdlog::warn("[optimize] cluster {}: solver '{}' failed: {}", cluster.id, solver->Name(), e.what());
    } catch (const std::exception& e) {
      last_code = ErrorCode::kOptimizeProviderError;
      last_msg = e.what();
      spdlog::warn("[optimize] cluster {}: solver '{}' raised: {}", cluster.id, solver->Name(), e.what());
    }
  }
  throw RouteOptError(last_code, "cluster " + std::to_string(cluster.id) + ": all solvers failed (" + last_msg + ")");
}

void RouteOptimizer::OptimizeAll(const std::vector<Cluster>& clusters,
                                 RouteSet& routes,
                                 std::vector<ClusterFailure>& failures) const {
  routes.clear();
  failures.clear();

  auto run = [this](const Cluster& c) -> Outcome {
    Outcome o;
    try {
      o.route = Optimize(c);
    } catch (const RouteOptError& e) {
      o.failure = ClusterFailure{c.id, ToString(e.code()), e.what()};
    }
    return o;
  };

  std::vector<Outcome> outcomes(clusters.size());
  const std::size_t workers =
      parallel_ ? std::min<std::size_t>(static_cast<std::size_t>(max_workers_), clusters.size()) : 1;
  if (workers <= 1) {
    for (std::size_t k = 0; k < clusters.size(); ++k) outcomes[k] = run(clusters[k]);
  } else {
    // 固定数量的 worker 轮流领取 cluster，同时向 trip service 发起的请求不超过 max_workers。
    std::atomic<std::size_t> next{0};
    std::vector<std::future<void>> futs;
    futs.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) {
      futs.emplace_back(std::async(std::launch::async, [&]() {
        for (std::size_t k = next.fetch_add(1); k < clusters.size(); k = next.fetch_add(1)) {
          outcomes[k] = run(clusters[k]);
        }
      }));
    }
    for (auto& f : futs) f.get();
  }

  // 按 cluster 顺序汇总，与完成先后无关
  for (auto& o : outcomes) {
    if (o.route) {
      routes.push_back(std::move(*o.route));
    } else if (o.failure) {
      spdlog::error("[optimize] cluster {} failed: {}", o.failure->cluster_id, o.failure->message);
      failures.push_back(std::move(*o.failure));
    }
  }
  spdlog::info("[optimize] {} route(s), {} failed cluster(s)", routes.size(), failures.size());
}

} // namespace routeopt
