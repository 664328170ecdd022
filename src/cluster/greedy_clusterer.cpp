#include "cluster/clusterer.hpp"

#include <cstddef>
#include <limits>

#include <spdlog/spdlog.h>

#include "common/errors.hpp"
#include "geo/distance.hpp"

namespace routeopt {

namespace {

constexpr std::size_t kNone = std::numeric_limits<std::size_t>::max();

// 离 `from` 最近的未分配站点；距离相同取下标小的。
std::size_t NearestUnassigned(const std::vector<GeocodeResult>& stops,
                              const std::vector<bool>& assigned,
                              const Coordinate& from) {
  std::size_t best = kNone;
  double best_d = std::numeric_limits<double>::infinity();
  for (std::size_t i = 0; i < stops.size(); ++i) {
    if (assigned[i]) continue;
    const double d = geo::RoadMiles(from, stops[i].coord);
    if (d < best_d) {
      best_d = d;
      best = i;
    }
  }
  return best;
}

std::size_t FirstUnassigned(const std::vector<bool>& assigned) {
  for (std::size_t i = 0; i < assigned.size(); ++i) {
    if (!assigned[i]) return i;
  }
  return kNone;
}

} // namespace

void ValidateMaxStops(int max_stops) {
  if (max_stops < 1) {
    throw RouteOptError(ErrorCode::kClusterConfigInvalid,
                        "max_stops_per_route must be >= 1, got " + std::to_string(max_stops));
  }
}

std::vector<Cluster> GreedyProximityClusterer::Build(const std::vector<GeocodeResult>& stops,
                                                     const std::optional<Depot>& depot,
                                                     int max_stops) const {
  ValidateMaxStops(max_stops);

  std::vector<Cluster> clusters;
  std::vector<bool> assigned(stops.size(), false);
  std::size_t remaining = stops.size();
  std::size_t prev_last = kNone;

  const std::size_t cap = static_cast<std::size_t>(max_stops);

  while (remaining > 0) {
    // 1) 种子
    std::size_t seed = kNone;
    if (depot) {
      seed = NearestUnassigned(stops, assigned, depot->coord);
    } else if (prev_last == kNone) {
      seed = FirstUnassigned(assigned);
    } else {
      seed = NearestUnassigned(stops, assigned, stops[prev_last].coord);
    }

    Cluster c;
    c.id = static_cast<int>(clusters.size()) + 1;
    c.anchor = depot;
    std::vector<Coordinate> member_coords;

    auto take = [&](std::size_t i) {
      assigned[i] = true;
      --remaining;
      c.members.push_back(stops[i]);
      member_coords.push_back(stops[i].coord);
      prev_last = i;
    };
    take(seed);

    // 2) 朝已有成员的质心生长
    while (c.members.size() < cap && remaining > 0) {
      const Coordinate centroid = geo::Centroid(member_coords);
      take(NearestUnassigned(stops, assigned, centroid));
    }

    spdlog::debug("[cluster] cluster {} with {} stop(s)", c.id, c.members.size());
    clusters.push_back(std::move(c));
  }

  spdlog::info("[cluster] greedy: {} stop(s) -> {} cluster(s), max {} per route",
               stops.size(), clusters.size(), max_stops);
  return clusters;
}

} // namespace routeopt
