#include "cluster/clusterer.hpp"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <numeric>
#include <tuple>

#include <spdlog/spdlog.h>

#include "common/errors.hpp"
#include "geo/distance.hpp"

namespace routeopt {

namespace {

// 最远点播种：第一个种子取离 `ref` 最近的站点，之后每次取离已有种子最远的站点。
std::vector<Coordinate> SeedCentroids(const std::vector<GeocodeResult>& stops, const Coordinate& ref, std::size_t k) {
  std::vector<Coordinate> seeds;
  std::vector<double> min_d(stops.size(), std::numeric_limits<double>::infinity());

  std::size_t first = 0;
  double best = std::numeric_limits<double>::infinity();
  for (std::size_t i = 0; i < stops.size(); ++i) {
    const double d = geo::RoadMiles(ref, stops[i].coord);
    if (d < best) {
      best = d;
      first = i;
    }
  }
  seeds.push_back(stops[first].coord);

  while (seeds.size() < k) {
    std::size_t pick = 0;
    double far = -1.0;
    for (std::size_t i = 0; i < stops.size(); ++i) {
      min_d[i] = std::min(min_d[i], geo::RoadMiles(seeds.back(), stops[i].coord));
      if (min_d[i] > far) {
        far = min_d[i];
        pick = i;
      }
    }
    seeds.push_back(stops[pick].coord);
  }
  return seeds;
}

// 每个站点分给还有空位的最近中心；按 (距离, 站点下标, 中心下标) 排序遍历，结果确定。
// k * cap >= n 保证每个站点都有位置。
std::vector<std::size_t> AssignWithCapacity(const std::vector<GeocodeResult>& stops,
                                            const std::vector<Coordinate>& centroids,
                                            std::size_t cap) {
  std::vector<std::tuple<double, std::size_t, std::size_t>> pairs;
  pairs.reserve(stops.size() * centroids.size());
  for (std::size_t i = 0; i < stops.size(); ++i) {
    for (std::size_t c = 0; c < centroids.size(); ++c) {
      pairs.emplace_back(geo::RoadMiles(stops[i].coord, centroids[c]), i, c);
    }
  }
  std::sort(pairs.begin(), pairs.end());

  constexpr std::size_t kUnassigned = std::numeric_limits<std::size_t>::max();
  std::vector<std::size_t> label(stops.size(), kUnassigned);
  std::vector<std::size_t> load(centroids.size(), 0);
  std::size_t done = 0;
  for (const auto& p : pairs) {
    const std::size_t i = std::get<1>(p);
    const std::size_t c = std::get<2>(p);
    if (label[i] != kUnassigned || load[c] >= cap) continue;
    label[i] = c;
    ++load[c];
    if (++done == stops.size()) break;
  }
  return label;
}

} // namespace

std::vector<Cluster> CentroidClusterer::Build(const std::vector<GeocodeResult>& stops,
                                              const std::optional<Depot>& depot,
                                              int max_stops) const {
  ValidateMaxStops(max_stops);
  if (stops.empty()) return {};

  const std::size_t cap = static_cast<std::size_t>(max_stops);
  const std::size_t k = (stops.size() + cap - 1) / cap;
  const Coordinate ref = depot ? depot->coord : stops.front().coord;

  std::vector<Coordinate> centroids = SeedCentroids(stops, ref, k);
  std::vector<std::size_t> label;

  const int max_iter = std::max(1, max_iterations_);
  int iter = 0;
  for (; iter < max_iter; ++iter) {
    std::vector<std::size_t> next = AssignWithCapacity(stops, centroids, cap);
    if (next == label) break;
    label = std::move(next);

    for (std::size_t c = 0; c < k; ++c) {
      std::vector<Coordinate> pts;
      for (std::size_t i = 0; i < stops.size(); ++i) {
        if (label[i] == c) pts.push_back(stops[i].coord);
      }
      if (!pts.empty()) centroids[c] = geo::Centroid(pts);
    }
  }

  // 分组（成员保持输入顺序），丢掉空组
  std::vector<std::vector<std::size_t>> groups(k);
  for (std::size_t i = 0; i < stops.size(); ++i) groups[label[i]].push_back(i);
  groups.erase(std::remove_if(groups.begin(), groups.end(), [](const auto& g) { return g.empty(); }), groups.end());

  // 离参考点近的在前；相同时比较首个成员的下标
  std::vector<double> key(groups.size());
  for (std::size_t g = 0; g < groups.size(); ++g) {
    std::vector<Coordinate> pts;
    for (std::size_t i : groups[g]) pts.push_back(stops[i].coord);
    key[g] = geo::RoadMiles(ref, geo::Centroid(pts));
  }
  std::vector<std::size_t> order(groups.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
    if (key[a] != key[b]) return key[a] < key[b];
    return groups[a].front() < groups[b].front();
  });

  std::vector<Cluster> clusters;
  for (std::size_t g : order) {
    Cluster c;
    c.id = static_cast<int>(clusters.size()) + 1;
    c.anchor = depot;
    for (std::size_t i : groups[g]) c.members.push_back(stops[i]);
    clusters.push_back(std::move(c));
  }

  spdlog::info("[cluster] centroid: {} stop(s) -> {} cluster(s) after {} iteration(s)",
               stops.size(), clusters.size(), iter);
  return clusters;
}

std::unique_ptr<IClusterer> MakeClusterer(const std::string& algorithm) {
  if (algorithm == "greedy") return std::make_unique<GreedyProximityClusterer>();
  if (algorithm == "centroid") return std::make_unique<CentroidClusterer>();
  throw RouteOptError(ErrorCode::kConfigInvalid, "unknown clustering algorithm '" + algorithm + "'");
}

} // namespace routeopt
