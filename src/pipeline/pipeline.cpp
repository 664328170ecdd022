#include "pipeline/pipeline.hpp"

#include <spdlog/spdlog.h>

#include "geocode/nominatim_provider.hpp"

// Stages
#include "stages/geocode_stage.hpp"
#include "stages/stop_filter_stage.hpp"
#include "stages/cluster_stage.hpp"
#include "stages/optimize_stage.hpp"
#include "stages/export_stage.hpp"

namespace routeopt {

Services MakeServices(const RouterConfig& cfg,
                      std::shared_ptr<io::IHttpClient> http,
                      std::shared_ptr<RateGate> gate) {
  ValidateConfig(cfg);

  Services s;
  auto provider = std::make_shared<NominatimProvider>(http, cfg.geocoder);
  s.geocoder = std::make_shared<Geocoder>(provider, std::move(gate), cfg.geocoder);
  s.clusterer = MakeClusterer(cfg.clustering.algorithm);

  std::vector<std::shared_ptr<RouteSolver>> solvers;
  if (cfg.optimizer.use_trip_service) {
    solvers.push_back(std::make_shared<TripServiceSolver>(http, cfg.optimizer));
  }
  solvers.push_back(std::make_shared<NearestNeighborSolver>());
  s.optimizer = std::make_shared<RouteOptimizer>(std::move(solvers), cfg.optimizer.parallel,
                                                   cfg.optimizer.max_workers);

  s.gpx.creator = cfg.exporter.creator;
  s.gpx.depot_name = cfg.exporter.depot_name;
  return s;
}

Pipeline::Pipeline(PipelineMode mode, const Services& services) {
  if (mode != PipelineMode::kFromGeocoded) {
    stages_.emplace_back(std::make_unique<GeocodeStage>(services.geocoder));
  }
  if (mode == PipelineMode::kGeocodeOnly) return;

  stages_.emplace_back(std::make_unique<StopFilterStage>());
  stages_.emplace_back(std::make_unique<ClusterStage>(services.clusterer));
  stages_.emplace_back(std::make_unique<OptimizeStage>(services.optimizer));
  stages_.emplace_back(std::make_unique<ExportStage>(services.gpx));
}

void Pipeline::Run(RoutingContext& ctx) {
  for (auto& stage : stages_) {
    spdlog::debug("[pipeline] running stage '{}'", stage->Name());
    stage->Run(ctx);
  }
}

} // namespace routeopt
