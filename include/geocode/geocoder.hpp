#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/types.hpp"
#include "geocode/geocode_provider.hpp"
#include "geocode/rate_gate.hpp"

namespace routeopt {

// ======================
// Geocoder：地址字符串 -> 坐标
//
// 输入：
//   addresses     有序列表，允许重复（每条都单独查询）
//   depot_index   可选，指向 addresses 的下标；最先编码，
//                 其坐标作为半径过滤的原点
//   radius_miles  可选；与 depot 的大地线距离超过它的候选被拒绝
//
// 输出：
//   每个地址恰好一条 GeocodeResult，保持输入顺序。失败以值返回
//   （kNoMatch / kOutOfRadius / kError），单个坏地址不会抛异常。
//
// 所有 provider 调用都经过共享的 RateGate。
// ======================
class Geocoder {
public:
  Geocoder(std::shared_ptr<IGeocodeProvider> provider, std::shared_ptr<RateGate> gate, GeocoderConfig cfg);

  std::vector<GeocodeResult> Geocode(const std::vector<DeliveryAddress>& addresses,
                                     std::optional<int> depot_index,
                                     std::optional<double> radius_miles);

  // 单条查询。origin/radius_miles 含义同上，两者都给出时才做半径过滤。
  GeocodeResult GeocodeOne(const DeliveryAddress& address,
                           const std::optional<Coordinate>& origin,
                           std::optional<double> radius_miles);

private:
  struct SearchOutcome {
    std::vector<GeocodeCandidate> candidates;
    std::optional<std::string> error; // 所有尝试都失败时才有值
  };

  SearchOutcome SearchWithRetry(const std::string& query);

  std::shared_ptr<IGeocodeProvider> provider_;
  std::shared_ptr<RateGate> gate_;
  GeocoderConfig cfg_;
};

} // namespace routeopt
