#include "stages/export_stage.hpp"

namespace routeopt {

void ExportStage::Run(RoutingContext& ctx) {
  GpxOptions opts = opts_;
  // depot 有自己的名字（如 "Food Shelf"）时优先于配置里的通用名
  if (ctx.depot && !ctx.depot->query.name.empty()) opts.depot_name = ctx.depot->query.name;
  RouteExporter exporter(opts);
  ctx.exported = exporter.Export(ctx.routes, ctx.depot, ctx.cluster_failures);
}

} // namespace routeopt
