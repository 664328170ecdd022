#include "optimize/route_solver.hpp"

#include <cstddef>
#include <limits>

#include "common/errors.hpp"
#include "geo/distance.hpp"

namespace routeopt {

Route NearestNeighborSolver::Solve(const Cluster& cluster) const {
  if (cluster.members.empty()) {
    throw RouteOptError(ErrorCode::kOptimizeProviderError,
                        "cluster " + std::to_string(cluster.id) + " has no members");
  }

  const auto& m = cluster.members;
  std::vector<bool> visited(m.size(), false);
  std::vector<GeocodeResult> ordered;
  ordered.reserve(m.size());

  Coordinate current;
  if (cluster.anchor) {
    current = cluster.anchor->coord;
  } else {
    // 没有 depot：从 cluster 的种子站点出发
    visited[0] = true;
    ordered.push_back(m[0]);
    current = m[0].coord;
  }

  while (ordered.size() < m.size()) {
    std::size_t best = 0;
    double best_d = std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i < m.size(); ++i) {
      if (visited[i]) continue;
      const double d = geo::RoadMiles(current, m[i].coord);
      if (d < best_d) {
        best_d = d;
        best = i;
      }
    }
    visited[best] = true;
    ordered.push_back(m[best]);
    current = m[best].coord;
  }

  Route r = AssembleRoute(cluster.id, ordered, cluster.anchor);
  std::vector<Coordinate> path;
  path.reserve(r.stops.size());
  for (const auto& s : r.stops) path.push_back(s.location.coord);
  r.total_distance_miles = geo::PathRoadMiles(path);
  r.solver = Name();
  return r;
}

} // namespace routeopt
