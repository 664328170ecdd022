#pragma once
#include <memory>
#include <utility>
#include "geocode/geocoder.hpp"
#include "stages/stage_base.hpp"

namespace routeopt {

// ======================
// Stage：地理编码
//
// 输入：
//   ctx.request.addresses / depot_index / radius_miles
//
// 输出：
//   ctx.geocode_results （每个地址一条，顺序不变）
// ======================
class GeocodeStage final : public IStage {
public:
  explicit GeocodeStage(std::shared_ptr<Geocoder> geocoder) : geocoder_(std::move(geocoder)) {}

  const char* Name() const override { return "geocode"; }
  void Run(RoutingContext& ctx) override;

private:
  std::shared_ptr<Geocoder> geocoder_;
};

} // namespace routeopt
