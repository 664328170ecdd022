#include "stages/geocode_stage.hpp"

namespace routeopt {

void GeocodeStage::Run(RoutingContext& ctx) {
  const auto& req = ctx.request;
  ctx.geocode_results = geocoder_->Geocode(req.addresses, req.depot_index, req.radius_miles);
}

} // namespace routeopt
