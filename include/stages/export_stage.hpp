#pragma once
#include <utility>
#include "export/route_exporter.hpp"
#include "stages/stage_base.hpp"

namespace routeopt {

// ======================
// Stage：序列化导出
//
// 输入：
//   ctx.routes, ctx.depot, ctx.cluster_failures
//
// 输出：
//   ctx.exported （每条路线一个 GPX，清单文本 + JSON）
//
// depot 航点名：depot 自带 name 时用它，否则用配置里的默认值。
// ======================
class ExportStage final : public IStage {
public:
  explicit ExportStage(GpxOptions opts) : opts_(std::move(opts)) {}

  const char* Name() const override { return "export"; }
  void Run(RoutingContext& ctx) override;

private:
  GpxOptions opts_;
};

} // namespace routeopt
