#pragma once
#include "stages/stage_base.hpp"

namespace routeopt {

// ======================
// Stage：地理编码与聚类之间的分界
//
// 输入：
//   ctx.geocode_results + ctx.request.depot_index         （完整流程）
//   ctx.request.geocoded + ctx.request.geocoded_depot     （只做优化）
//
// 输出：
//   ctx.depot             命中的 depot（可能没有）
//   ctx.stops             命中的非 depot 地点（输入顺序）
//   ctx.geocode_failures  其余全部（NoMatch / OutOfRadius / Error）
//
// 超出半径的站点在这里剔除，也就是在聚类之前。
// 一个可用站点都没有 => RouteOptError(kNoRoutableStops)。
// ======================
class StopFilterStage final : public IStage {
public:
  const char* Name() const override { return "stop_filter"; }
  void Run(RoutingContext& ctx) override;
};

} // namespace routeopt
