#include "optimize/route_solver.hpp"

#include <cmath>
#include <map>
#include <string>
#include <tuple>

#include "common/errors.hpp"

namespace routeopt {

namespace {

using StopKey = std::tuple<std::string, double, double>;

StopKey KeyOf(const GeocodeResult& r) {
  return {r.query.text, r.coord.lat_deg, r.coord.lon_deg};
}

[[noreturn]] void Violation(const Route& route, const std::string& what) {
  throw RouteOptError(ErrorCode::kOptimizeProviderError,
                      "route " + std::to_string(route.index) + " (" + route.solver + "): " + what);
}

} // namespace

Route AssembleRoute(int index, const std::vector<GeocodeResult>& ordered, const std::optional<Depot>& depot) {
  Route r;
  r.index = index;
  auto push = [&r](const GeocodeResult& loc, bool is_depot) {
    Stop s;
    s.location = loc;
    s.sequence_number = static_cast<int>(r.stops.size());
    s.is_depot = is_depot;
    r.stops.push_back(std::move(s));
  };
  if (depot) push(*depot, true);
  for (const auto& m : ordered) push(m, false);
  if (depot) push(*depot, true);
  return r;
}

void CheckRouteInvariants(const Route& route, const Cluster& cluster) {
  if (!std::isfinite(route.total_distance_miles) || route.total_distance_miles < 0.0) {
    Violation(route, "invalid total distance");
  }
  for (std::size_t i = 0; i < route.stops.size(); ++i) {
    if (route.stops[i].sequence_number != static_cast<int>(i)) {
      Violation(route, "sequence numbers are not contiguous from 0");
    }
  }

  std::size_t first = 0;
  std::size_t last = route.stops.size();
  if (cluster.anchor) {
    if (route.stops.size() < 2 || !route.stops.front().is_depot || !route.stops.back().is_depot) {
      Violation(route, "round trip must start and end at the depot");
    }
    first = 1;
    last = route.stops.size() - 1;
  }

  std::map<StopKey, int> expected;
  for (const auto& m : cluster.members) ++expected[KeyOf(m)];
  for (std::size_t i = first; i < last; ++i) {
    const auto& s = route.stops[i];
    if (s.is_depot) Violation(route, "depot visited mid-route");
    auto it = expected.find(KeyOf(s.location));
    if (it == expected.end() || it->second == 0) {
      Violation(route, "unexpected or repeated stop '" + s.location.query.Label() + "'");
    }
    --it->second;
  }
  for (const auto& [key, left] : expected) {
    if (left != 0) Violation(route, "stop '" + std::get<0>(key) + "' missing");
  }
}

} // namespace routeopt
