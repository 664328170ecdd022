#include "tests/test_framework.hpp"
#include "tests/test_fakes.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// =========================
// Stage 逐个测试 + 端到端 Pipeline
// =========================
//
// 目标：每个 Stage 都把输出写回 RoutingContext，这里检查
//   1) 写了该写的 ctx 字段
//   2) 写入的内容满足下一个 Stage 的输入契约
//   3) 失败时抛出约定的错误码

#include "common/errors.hpp"
#include "common/log.hpp"
#include "io/output_writer.hpp"
#include "io/request_io.hpp"
#include "pipeline/pipeline.hpp"
#include "stages/cluster_stage.hpp"
#include "stages/export_stage.hpp"
#include "stages/stop_filter_stage.hpp"

namespace {

using namespace routeopt;
using routeopt::test::Candidate;
using routeopt::test::FakeGeocodeProvider;
using routeopt::test::FakeHttpClient;
using routeopt::test::MatchedStop;
using json = nlohmann::json;

const std::string kDepot = "100 Depot Rd, Minneapolis, MN 55401";
const std::string kOak1 = "1 Oak St, Minneapolis, MN";
const std::string kOak2 = "2 Oak St, Minneapolis, MN";
const std::string kRice3 = "3 Rice St, St Paul, MN";
const std::string kRice4 = "4 Rice St, St Paul, MN";
const std::string kNowhere = "5 Nowhere Ln, Atlantis";
const std::string kChicago = "6 Wacker Dr, Chicago, IL";

bool Contains(const std::string& hay, const std::string& needle) { return hay.find(needle) != std::string::npos; }

// 地理编码走脚本化的 provider；trip service 连不上，所以每条路线都来自最近邻兜底。
struct World {
  std::shared_ptr<FakeGeocodeProvider> provider = std::make_shared<FakeGeocodeProvider>();
  std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>();
  Services services;

  World() {
    provider->answers[kDepot] = {Candidate("Depot", 44.9778, -93.2650)};
    provider->answers[kOak1] = {Candidate("1 Oak", 44.9800, -93.2700)};
    provider->answers[kOak2] = {Candidate("2 Oak", 44.9900, -93.2600)};
    provider->answers[kRice3] = {Candidate("3 Rice", 44.9500, -93.0900)};
    provider->answers[kRice4] = {Candidate("4 Rice", 44.9600, -93.1000)};
    provider->answers[kChicago] = {Candidate("Chicago", 41.8800, -87.6300)};

    GeocoderConfig gcfg;
    gcfg.min_interval_ms = 0;
    gcfg.backoff_base_ms = 0;
    auto gate = std::make_shared<RateGate>(std::chrono::milliseconds(0));
    services.geocoder = std::make_shared<Geocoder>(provider, gate, gcfg);
    services.clusterer = std::make_shared<GreedyProximityClusterer>();

    OptimizerConfig ocfg;
    ocfg.base_url = "http://osrm.test";
    services.optimizer = std::make_shared<RouteOptimizer>(
        std::vector<std::shared_ptr<RouteSolver>>{std::make_shared<TripServiceSolver>(http, ocfg),
                                                  std::make_shared<NearestNeighborSolver>()},
        true);
  }
};

RoutingRequest FullRequest() {
  RoutingRequest req;
  for (const auto& t : {kDepot, kOak1, kOak2, kRice3, kRice4, kNowhere, kChicago}) {
    DeliveryAddress a;
    a.text = t;
    req.addresses.push_back(a);
  }
  req.depot_index = 0;
  req.radius_miles = 50.0;
  req.max_stops_per_route = 2;
  return req;
}

// -------- individual stages --------

bool Test_StopFilterStage_SplitsDepotStopsFailures() {
  RoutingContext ctx;
  ctx.request.depot_index = 1;
  ctx.geocode_results = {MatchedStop("a", 44.98, -93.27), MatchedStop("depot", 44.9778, -93.265),
                         MatchedStop("b", 44.95, -93.09), MatchedStop("bad-coord", 120.0, 0.0)};
  GeocodeResult miss;
  miss.query.text = "missing";
  miss.status = GeocodeStatus::kNoMatch;
  ctx.geocode_results.push_back(miss);

  StopFilterStage().Run(ctx);
  ROUTEOPT_EXPECT_TRUE(ctx.depot.has_value());
  ROUTEOPT_EXPECT_EQ(ctx.depot->query.text, std::string("depot"));
  ROUTEOPT_EXPECT_EQ(ctx.stops.size(), 2u);
  ROUTEOPT_EXPECT_EQ(ctx.stops[0].query.text, std::string("a"));
  ROUTEOPT_EXPECT_EQ(ctx.stops[1].query.text, std::string("b"));
  ROUTEOPT_EXPECT_EQ(ctx.geocode_failures.size(), 2u);
  ROUTEOPT_EXPECT_TRUE(ctx.geocode_failures[0].status == GeocodeStatus::kError);
  ROUTEOPT_EXPECT_EQ(*ctx.geocode_failures[0].error_detail, std::string("Invalid coordinate"));

  // 重复执行不累加
  StopFilterStage().Run(ctx);
  ROUTEOPT_EXPECT_EQ(ctx.stops.size(), 2u);
  ROUTEOPT_EXPECT_EQ(ctx.geocode_failures.size(), 2u);
  return true;
}

bool Test_StopFilterStage_FailedDepot() {
  RoutingContext ctx;
  ctx.request.depot_index = 0;
  GeocodeResult depot;
  depot.query.text = "depot";
  depot.status = GeocodeStatus::kNoMatch;
  ctx.geocode_results = {depot, MatchedStop("a", 44.98, -93.27)};

  StopFilterStage().Run(ctx);
  ROUTEOPT_EXPECT_TRUE(!ctx.depot.has_value());
  ROUTEOPT_EXPECT_EQ(ctx.stops.size(), 1u);
  ROUTEOPT_EXPECT_EQ(ctx.geocode_failures.size(), 1u);
  return true;
}

bool Test_StopFilterStage_NoRoutableStops() {
  RoutingContext ctx;
  GeocodeResult miss;
  miss.status = GeocodeStatus::kOutOfRadius;
  ctx.geocode_results = {miss, miss};
  ROUTEOPT_EXPECT_THROWS_CODE(ErrorCode::kNoRoutableStops, StopFilterStage().Run(ctx));
  ROUTEOPT_EXPECT_EQ(ctx.geocode_failures.size(), 2u);
  return true;
}

bool Test_ClusterStage_RejectsBadMaxStops() {
  RoutingContext ctx;
  ctx.stops = {MatchedStop("a", 44.98, -93.27)};
  ctx.request.max_stops_per_route = 0;
  ClusterStage stage(std::make_shared<GreedyProximityClusterer>());
  ROUTEOPT_EXPECT_THROWS_CODE(ErrorCode::kClusterConfigInvalid, stage.Run(ctx));
  ROUTEOPT_EXPECT_TRUE(ctx.clusters.empty());
  return true;
}

bool Test_ExportStage_UsesDepotName() {
  RoutingContext ctx;
  Depot depot = MatchedStop("100 Depot Rd", 44.9778, -93.265);
  depot.query.name = "Food Shelf";
  ctx.depot = depot;
  ctx.routes.push_back(NearestNeighborSolver().Solve(Cluster{1, {MatchedStop("a", 44.98, -93.27)}, depot}));

  ExportStage(GpxOptions{}).Run(ctx);
  ROUTEOPT_EXPECT_EQ(ctx.exported.gpx_files.size(), 1u);
  ROUTEOPT_EXPECT_TRUE(Contains(ctx.exported.gpx_files[0].content, "<name>START: Food Shelf</name>"));

  ctx.depot->query.name.clear();
  ExportStage(GpxOptions{}).Run(ctx);
  ROUTEOPT_EXPECT_TRUE(Contains(ctx.exported.gpx_files[0].content, "<name>START: Depot</name>"));
  return true;
}

// -------- pipeline --------

bool Test_Pipeline_EndToEnd() {
  World w;
  RoutingContext ctx;
  ctx.request = FullRequest();
  Pipeline(PipelineMode::kFull, w.services).Run(ctx);

  ROUTEOPT_EXPECT_EQ(ctx.geocode_results.size(), 7u);
  ROUTEOPT_EXPECT_TRUE(ctx.depot.has_value());
  ROUTEOPT_EXPECT_EQ(ctx.stops.size(), 4u);
  ROUTEOPT_EXPECT_EQ(ctx.geocode_failures.size(), 2u);
  ROUTEOPT_EXPECT_TRUE(ctx.geocode_failures[0].status == GeocodeStatus::kNoMatch);
  ROUTEOPT_EXPECT_TRUE(ctx.geocode_failures[1].status == GeocodeStatus::kOutOfRadius);

  ROUTEOPT_EXPECT_EQ(ctx.clusters.size(), 2u);
  ROUTEOPT_EXPECT_EQ(ctx.clusters[0].members[0].query.text, kOak1);
  ROUTEOPT_EXPECT_EQ(ctx.routes.size(), 2u);
  ROUTEOPT_EXPECT_TRUE(ctx.cluster_failures.empty());
  for (const auto& r : ctx.routes) {
    ROUTEOPT_EXPECT_TRUE(r.degraded);
    ROUTEOPT_EXPECT_TRUE(r.total_distance_miles > 0.0);
    ROUTEOPT_EXPECT_TRUE(r.stops.front().is_depot && r.stops.back().is_depot);
  }

  ROUTEOPT_EXPECT_EQ(ctx.exported.gpx_files.size(), 2u);
  ROUTEOPT_EXPECT_EQ(ctx.exported.gpx_files[0].file_name, std::string("route_01.gpx"));
  ROUTEOPT_EXPECT_EQ(ctx.exported.manifest_json.at("total_stops").get<int>(), 4);
  ROUTEOPT_EXPECT_TRUE(Contains(ctx.exported.manifest_text, "Solver: nearest_neighbor (fallback)"));

  // 每个 cluster 只请求一次 trip service
  ROUTEOPT_EXPECT_EQ(w.http->urls().size(), 2u);
  return true;
}

bool Test_Pipeline_GeocodeOnly() {
  World w;
  RoutingContext ctx;
  ctx.request = FullRequest();
  Pipeline(PipelineMode::kGeocodeOnly, w.services).Run(ctx);

  ROUTEOPT_EXPECT_EQ(ctx.geocode_results.size(), 7u);
  ROUTEOPT_EXPECT_TRUE(ctx.stops.empty());
  ROUTEOPT_EXPECT_TRUE(ctx.routes.empty());

  const json out = io::RequestIO::GeocodeResponse(ctx.geocode_results);
  ROUTEOPT_EXPECT_EQ(out.size(), 7u);
  ROUTEOPT_EXPECT_NEAR(out[1].at("lat").get<double>(), 44.98, 1e-12);
  ROUTEOPT_EXPECT_TRUE(out[1].contains("distanceFromStart"));
  ROUTEOPT_EXPECT_EQ(out[5].at("status").get<std::string>(), std::string("NoMatch"));
  ROUTEOPT_EXPECT_EQ(out[6].at("status").get<std::string>(), std::string("OutOfRadius"));
  return true;
}

bool Test_Pipeline_FromGeocoded() {
  World w;
  const json j = json::parse(R"({
    "locations": [
      {"address": "1 Oak St", "lat": 44.98, "lon": -93.27, "name": "Ann", "phone": "6125550100", "household_size": 3},
      {"address": "no coordinates"},
      {"address": "3 Rice St", "lat": 44.95, "lon": -93.09}
    ],
    "depot": {"address": "100 Depot Rd", "lat": 44.9778, "lon": -93.2650},
    "maxStops": 1
  })");
  RoutingContext ctx;
  ctx.request = io::RequestIO::ParseRequest(j, 4);
  ROUTEOPT_EXPECT_EQ(ctx.request.max_stops_per_route, 1);

  Pipeline(PipelineMode::kFromGeocoded, w.services).Run(ctx);
  ROUTEOPT_EXPECT_TRUE(w.provider->calls().empty());
  ROUTEOPT_EXPECT_TRUE(ctx.depot.has_value());
  ROUTEOPT_EXPECT_EQ(ctx.stops.size(), 2u);
  ROUTEOPT_EXPECT_EQ(ctx.geocode_failures.size(), 1u);
  ROUTEOPT_EXPECT_EQ(ctx.routes.size(), 2u);
  ROUTEOPT_EXPECT_EQ(ctx.stops[0].query.household_size, std::string("3"));

  const auto& stop = ctx.exported.manifest_json.at("routes").at(0).at("stops").at(0);
  ROUTEOPT_EXPECT_EQ(stop.at("name").get<std::string>(), std::string("Ann"));
  return true;
}

bool Test_Pipeline_NothingRoutable() {
  World w;
  RoutingContext ctx;
  DeliveryAddress a;
  a.text = kNowhere;
  ctx.request.addresses = {a, a};
  ROUTEOPT_EXPECT_THROWS_CODE(ErrorCode::kNoRoutableStops, Pipeline(PipelineMode::kFull, w.services).Run(ctx));
  ROUTEOPT_EXPECT_TRUE(ctx.routes.empty());
  ROUTEOPT_EXPECT_TRUE(ctx.exported.gpx_files.empty());
  return true;
}

bool Test_MakeServices() {
  RouterConfig cfg;
  cfg.clustering.algorithm = "centroid";
  cfg.optimizer.use_trip_service = false;
  auto http = std::make_shared<FakeHttpClient>();
  auto gate = std::make_shared<RateGate>(std::chrono::milliseconds(0));

  const Services s = MakeServices(cfg, http, gate);
  ROUTEOPT_EXPECT_EQ(std::string(s.clusterer->Name()), std::string("centroid"));
  ROUTEOPT_EXPECT_TRUE(s.geocoder != nullptr && s.optimizer != nullptr);

  Cluster c{1, {MatchedStop("a", 44.98, -93.27), MatchedStop("b", 44.95, -93.09)}, std::nullopt};
  const Route r = s.optimizer->Optimize(c);
  ROUTEOPT_EXPECT_EQ(r.solver, std::string("nearest_neighbor"));
  ROUTEOPT_EXPECT_TRUE(!r.degraded);
  ROUTEOPT_EXPECT_TRUE(http->urls().empty());

  cfg.geocoder.worker_threads = 0;
  ROUTEOPT_EXPECT_THROWS_CODE(ErrorCode::kConfigInvalid, MakeServices(cfg, http, gate));
  return true;
}

// -------- request / config IO --------

bool Test_RequestIO_ParseConfig() {
  const RouterConfig defaults = io::RequestIO::ParseConfig(json());
  ROUTEOPT_EXPECT_EQ(defaults.geocoder.min_interval_ms, 1100);
  ROUTEOPT_EXPECT_EQ(defaults.clustering.max_stops_per_route, 4);

  const RouterConfig cfg = io::RequestIO::ParseConfig(json::parse(R"({
    "log_level": "debug",
    "geocoder": {"min_interval_ms": 1500, "worker_threads": 2},
    "clustering": {"algorithm": "centroid", "max_stops_per_route": 6},
    "optimizer": {"use_trip_service": false, "profile": "bike", "max_workers": 2},
    "export": {"creator": "Food Shelf Routing"}
  })"));
  ROUTEOPT_EXPECT_EQ(cfg.log_level, std::string("debug"));
  ROUTEOPT_EXPECT_EQ(cfg.geocoder.min_interval_ms, 1500);
  ROUTEOPT_EXPECT_EQ(cfg.geocoder.worker_threads, 2);
  ROUTEOPT_EXPECT_EQ(cfg.clustering.algorithm, std::string("centroid"));
  ROUTEOPT_EXPECT_EQ(cfg.clustering.max_stops_per_route, 6);
  ROUTEOPT_EXPECT_TRUE(!cfg.optimizer.use_trip_service);
  ROUTEOPT_EXPECT_EQ(cfg.optimizer.profile, std::string("bike"));
  ROUTEOPT_EXPECT_EQ(cfg.optimizer.max_workers, 2);
  ROUTEOPT_EXPECT_EQ(cfg.exporter.creator, std::string("Food Shelf Routing"));

  ROUTEOPT_EXPECT_THROWS_CODE(ErrorCode::kConfigInvalid,
                              io::RequestIO::ParseConfig(json::parse(R"({"geocoder":{"min_interval_ms":"fast"}})")));
  ROUTEOPT_EXPECT_THROWS_CODE(ErrorCode::kConfigInvalid,
                              io::RequestIO::ParseConfig(json::parse(R"({"clustering":{"algorithm":"kmeans"}})")));
  ROUTEOPT_EXPECT_THROWS_CODE(ErrorCode::kConfigInvalid, io::RequestIO::ParseConfig(json::parse("[1]")));
  ROUTEOPT_EXPECT_THROWS_CODE(ErrorCode::kConfigInvalid,
                              io::RequestIO::ParseConfig(json::parse(R"({"optimizer":{"max_workers":0}})")));
  return true;
}

bool Test_RequestIO_ParseRequest() {
  const RoutingRequest req = io::RequestIO::ParseRequest(json::parse(R"json({
    "addresses": ["100 Depot Rd", {"address": "1 Oak St", "name": "Ann", "notes": "Ring bell"}],
    "originalAddresses": ["Depot (front)", "1 Oak Street"],
    "depot_index": 0,
    "radiusMiles": 25
  })json"), 4);
  ROUTEOPT_EXPECT_EQ(req.addresses.size(), 2u);
  ROUTEOPT_EXPECT_EQ(req.addresses[0].text, std::string("100 Depot Rd"));
  ROUTEOPT_EXPECT_EQ(req.addresses[0].Label(), std::string("Depot (front)"));
  ROUTEOPT_EXPECT_EQ(req.addresses[1].name, std::string("Ann"));
  ROUTEOPT_EXPECT_EQ(req.addresses[1].notes, std::string("Ring bell"));
  ROUTEOPT_EXPECT_EQ(*req.depot_index, 0);
  ROUTEOPT_EXPECT_NEAR(*req.radius_miles, 25.0, 1e-12);
  ROUTEOPT_EXPECT_EQ(req.max_stops_per_route, 4);

  const RoutingRequest empty = io::RequestIO::ParseRequest(json::parse(R"({"addresses": []})"), 4);
  ROUTEOPT_EXPECT_TRUE(empty.addresses.empty());
  ROUTEOPT_EXPECT_TRUE(!empty.depot_index.has_value());
  ROUTEOPT_EXPECT_TRUE(!empty.radius_miles.has_value());

  ROUTEOPT_EXPECT_THROWS_CODE(ErrorCode::kConfigInvalid, io::RequestIO::ParseRequest(json::parse("{}"), 4));
  ROUTEOPT_EXPECT_THROWS_CODE(ErrorCode::kConfigInvalid, io::RequestIO::ParseRequest(json::parse(R"({"addresses": "x"})"), 4));
  ROUTEOPT_EXPECT_THROWS_CODE(ErrorCode::kConfigInvalid, io::RequestIO::ParseRequest(json::parse(R"({"addresses": [1]})"), 4));
  return true;
}

bool Test_OutputWriter_WritesArtifacts() {
  World w;
  RoutingContext ctx;
  ctx.request = FullRequest();
  Pipeline(PipelineMode::kFull, w.services).Run(ctx);

  const auto dir = std::filesystem::temp_directory_path() / "routeopt_stages_tests_out";
  std::filesystem::remove_all(dir);
  io::OutputWriter::WriteAll(ctx, dir.string());

  ROUTEOPT_EXPECT_TRUE(std::filesystem::exists(dir / "route_01.gpx"));
  ROUTEOPT_EXPECT_TRUE(std::filesystem::exists(dir / "route_02.gpx"));
  ROUTEOPT_EXPECT_TRUE(std::filesystem::exists(dir / "manifest.txt"));
  ROUTEOPT_EXPECT_TRUE(std::filesystem::exists(dir / "failed_geocodes.csv"));

  std::ifstream ifs(dir / "route_manifest.json");
  std::stringstream ss;
  ss << ifs.rdbuf();
  const json m = json::parse(ss.str());
  ROUTEOPT_EXPECT_EQ(m.at("total_routes").get<int>(), 2);

  std::filesystem::remove_all(dir);
  return true;
}

} // namespace

int main() {
  using routeopt::test::TestCase;
  routeopt::InitLogging("warn");

  std::vector<TestCase> cases = {
      {"StopFilterStage: depot / stops / failures", Test_StopFilterStage_SplitsDepotStopsFailures},
      {"StopFilterStage: failed depot", Test_StopFilterStage_FailedDepot},
      {"StopFilterStage: no routable stops", Test_StopFilterStage_NoRoutableStops},
      {"ClusterStage: max_stops < 1 rejected", Test_ClusterStage_RejectsBadMaxStops},
      {"ExportStage: depot waypoint name", Test_ExportStage_UsesDepotName},
      {"Pipeline: end-to-end with fallback routing", Test_Pipeline_EndToEnd},
      {"Pipeline: geocode only", Test_Pipeline_GeocodeOnly},
      {"Pipeline: from geocoded locations", Test_Pipeline_FromGeocoded},
      {"Pipeline: nothing routable", Test_Pipeline_NothingRoutable},
      {"MakeServices: wiring from config", Test_MakeServices},
      {"RequestIO: config", Test_RequestIO_ParseConfig},
      {"RequestIO: request", Test_RequestIO_ParseRequest},
      {"OutputWriter: artifacts on disk", Test_OutputWriter_WritesArtifacts},
  };

  return routeopt::test::RunAll(cases);
}
