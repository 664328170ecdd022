#include "stages/cluster_stage.hpp"

namespace routeopt {

void ClusterStage::Run(RoutingContext& ctx) {
  ctx.clusters.clear();
  ValidateMaxStops(ctx.request.max_stops_per_route);
  ctx.clusters = clusterer_->Build(ctx.stops, ctx.depot, ctx.request.max_stops_per_route);
}

} // namespace routeopt
