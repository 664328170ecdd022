#pragma once
#include <memory>
#include <vector>
#include "common/config.hpp"
#include "common/types.hpp"
#include "export/gpx_writer.hpp"
#include "geocode/geocoder.hpp"
#include "cluster/clusterer.hpp"
#include "optimize/route_optimizer.hpp"
#include "stages/stage_base.hpp"

namespace routeopt {

// 请求需要跑流程的哪一段。
enum class PipelineMode {
  kGeocodeOnly,   // geocode
  kFromGeocoded,  // filter -> cluster -> optimize -> export
  kFull,          // geocode -> filter -> cluster -> optimize -> export
};

// 各 Stage 共享的长生命周期组件，每个进程构建一次（见 MakeServices）。
// geocoder 内部的 RateGate 与 Services 同生命周期。
struct Services {
  std::shared_ptr<Geocoder> geocoder;
  std::shared_ptr<IClusterer> clusterer;
  std::shared_ptr<RouteOptimizer> optimizer;
  GpxOptions gpx;
};

// 按配置装配 provider：
//   geocoder   NominatimProvider over `http`, gated by `gate`
//   optimizer  [TripServiceSolver （启用时）, NearestNeighborSolver]
// 配置非法时抛 RouteOptError(kConfigInvalid)。
Services MakeServices(const RouterConfig& cfg,
                      std::shared_ptr<io::IHttpClient> http,
                      std::shared_ptr<RateGate> gate);

// Pipeline 按流程顺序串起各个 Stage。
// Stage 之间互不依赖：只要遵守 ctx 契约，替换其中一个（比如换个 clusterer）不影响其他。
class Pipeline {
public:
  Pipeline(PipelineMode mode, const Services& services);
  void Run(RoutingContext& ctx);

private:
  std::vector<std::unique_ptr<IStage>> stages_;
};

} // namespace routeopt
