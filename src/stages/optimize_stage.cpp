#include "stages/optimize_stage.hpp"

namespace routeopt {

void OptimizeStage::Run(RoutingContext& ctx) {
  optimizer_->OptimizeAll(ctx.clusters, ctx.routes, ctx.cluster_failures);
}

} // namespace routeopt
