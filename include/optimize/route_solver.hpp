#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/types.hpp"
#include "io/http_client.hpp"

namespace routeopt {

// 把一个 cluster 排成访问顺序的策略。
// Solve() 返回完整 Route（route.index == cluster.id），
// 失败时抛 RouteOptError（kOptimizeProviderTimeout / kOptimizeProviderError）。
class RouteSolver {
public:
  virtual ~RouteSolver() = default;
  virtual const char* Name() const = 0;
  virtual Route Solve(const Cluster& cluster) const = 0;
};

// 本地启发式：从 depot（或 cluster 的种子站点）出发，每次走到道路英里最近的
// 未访问站点；有 depot 时最后回到 depot。非空 cluster 不会失败。
class NearestNeighborSolver final : public RouteSolver {
public:
  const char* Name() const override { return "nearest_neighbor"; }
  Route Solve(const Cluster& cluster) const override;
};

// External trip service (OSRM /trip).
//   GET {base}/trip/v1/{profile}/{lon,lat;...}?roundtrip=true&source=first&overview=false
// 有 depot 时它是第一个坐标，路线为往返；没有 depot 时为开放路线
// （roundtrip=false, destination=any），从 cluster 的种子站点出发。
class TripServiceSolver final : public RouteSolver {
public:
  TripServiceSolver(std::shared_ptr<io::IHttpClient> http, OptimizerConfig cfg);

  const char* Name() const override { return "trip_service"; }
  Route Solve(const Cluster& cluster) const override;

  std::string BuildUrl(const Cluster& cluster) const;

private:
  std::shared_ptr<io::IHttpClient> http_;
  OptimizerConfig cfg_;
};

// depot + 排好序的成员（+ depot），sequence number 从 0 连续编号。
// 距离和时长由调用方填。
Route AssembleRoute(int index, const std::vector<GeocodeResult>& ordered, const std::optional<Depot>& depot);

// Checks the closure invariants of a solved route against its cluster:
// every member exactly once, depot at both ends in round-trip mode,
// sequence numbers 0..n-1, finite non-negative distance.
// Throws RouteOptError(kOptimizeProviderError) describing the first violation.
void CheckRouteInvariants(const Route& route, const Cluster& cluster);

} // namespace routeopt
