#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "common/types.hpp"

namespace routeopt {

// ======================
// Clusterer：已编码站点 -> 有上限的分组
//
// 所有实现共同遵守的契约：
//   - stops 全部是 kMatched（由 StopFilterStage 保证）
//   - 每个站点恰好落在一个 cluster 里
//   - 1 <= cluster.members.size() <= max_stops
//   - 相同输入顺序得到相同输出
//   - cluster id 从 1 开始，与输出顺序一致
//   - max_stops < 1 时先抛 RouteOptError(kClusterConfigInvalid)，不做任何计算
// ======================
class IClusterer {
public:
  virtual ~IClusterer() = default;
  virtual const char* Name() const = 0;
  virtual std::vector<Cluster> Build(const std::vector<GeocodeResult>& stops,
                                     const std::optional<Depot>& depot,
                                     int max_stops) const = 0;
};

// 贪心锚定生长：
//   种子 = 离 depot 最近的站点（没有 depot 时先取第一个站点，之后取离上一个
//   cluster 最后成员最近的站点），再不断加入离当前质心最近的未分配站点。
// 距离用道路英里；距离相同取输入下标小的。
class GreedyProximityClusterer final : public IClusterer {
public:
  const char* Name() const override { return "greedy"; }
  std::vector<Cluster> Build(const std::vector<GeocodeResult>& stops,
                             const std::optional<Depot>& depot,
                             int max_stops) const override;
};

// 带容量上限的 k-means，k = ceil(n / max_stops)。
// 最远点播种，按距离从小到大做容量受限分配，迭代次数有上限。
// 输出时离 depot（或第一个站点）近的 cluster 在前。
class CentroidClusterer final : public IClusterer {
public:
  explicit CentroidClusterer(int max_iterations = 25) : max_iterations_(max_iterations) {}

  const char* Name() const override { return "centroid"; }
  std::vector<Cluster> Build(const std::vector<GeocodeResult>& stops,
                             const std::optional<Depot>& depot,
                             int max_stops) const override;

private:
  int max_iterations_;
};

// "greedy" | "centroid"；其他名字抛 RouteOptError(kConfigInvalid)。
std::unique_ptr<IClusterer> MakeClusterer(const std::string& algorithm);

// Throws RouteOptError(kClusterConfigInvalid) when max_stops < 1.
void ValidateMaxStops(int max_stops);

} // namespace routeopt
