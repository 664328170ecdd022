#include "stages/stop_filter_stage.hpp"

#include <cmath>
#include <cstddef>
#include <string>

#include <spdlog/spdlog.h>

#include "common/errors.hpp"

namespace routeopt {

namespace {

bool ValidCoord(const Coordinate& c) {
  return std::isfinite(c.lat_deg) && std::isfinite(c.lon_deg) &&
         std::fabs(c.lat_deg) <= 90.0 && std::fabs(c.lon_deg) <= 180.0;
}

} // namespace

void StopFilterStage::Run(RoutingContext& ctx) {
  ctx.depot.reset();
  ctx.stops.clear();
  ctx.geocode_failures.clear();

  const bool pre_geocoded = ctx.geocode_results.empty() && !ctx.request.geocoded.empty();
  const auto& source = pre_geocoded ? ctx.request.geocoded : ctx.geocode_results;

  // 1) depot
  std::optional<std::size_t> depot_slot;
  if (pre_geocoded) {
    if (ctx.request.geocoded_depot) {
      if (ctx.request.geocoded_depot->IsMatched() && ValidCoord(ctx.request.geocoded_depot->coord)) {
        ctx.depot = ctx.request.geocoded_depot;
      } else {
        spdlog::warn("[filter] depot has no usable coordinate; routes will not be round trips");
      }
    }
  } else if (ctx.request.depot_index && *ctx.request.depot_index >= 0 &&
             static_cast<std::size_t>(*ctx.request.depot_index) < source.size()) {
    depot_slot = static_cast<std::size_t>(*ctx.request.depot_index);
    const auto& d = source[*depot_slot];
    if (d.IsMatched()) {
      ctx.depot = d;
    } else {
      spdlog::warn("[filter] depot '{}' not geocoded ({}); routes will not be round trips",
                   d.query.Label(), ToString(d.status));
      ctx.geocode_failures.push_back(d);
    }
  }

  // 2) stops
  for (std::size_t i = 0; i < source.size(); ++i) {
    if (depot_slot && i == *depot_slot) continue;
    const auto& r = source[i];
    if (r.IsMatched() && ValidCoord(r.coord)) {
      ctx.stops.push_back(r);
      continue;
    }
    GeocodeResult failed = r;
    if (r.IsMatched()) {
      failed.status = GeocodeStatus::kError;
      failed.error_detail = "Invalid coordinate";
    }
    ctx.geocode_failures.push_back(std::move(failed));
  }

  spdlog::info("[filter] {} routable stop(s), {} failure(s){}", ctx.stops.size(), ctx.geocode_failures.size(),
               ctx.depot ? ", depot set" : "");

  if (ctx.stops.empty()) {
    throw RouteOptError(ErrorCode::kNoRoutableStops,
                        "no successfully geocoded delivery locations (" +
                            std::to_string(ctx.geocode_failures.size()) + " failed)");
  }
}

} // namespace routeopt
