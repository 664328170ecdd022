#include "optimize/route_solver.hpp"

#include <cmath>
#include <cstddef>
#include <iomanip>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "common/errors.hpp"
#include "geo/distance.hpp"

namespace routeopt {

namespace {

[[noreturn]] void ProviderError(int cluster_id, const std::string& what) {
  throw RouteOptError(ErrorCode::kOptimizeProviderError,
                      "trip service, cluster " + std::to_string(cluster_id) + ": " + what);
}

} // namespace

TripServiceSolver::TripServiceSolver(std::shared_ptr<io::IHttpClient> http, OptimizerConfig cfg)
    : http_(std::move(http)), cfg_(std::move(cfg)) {}

std::string TripServiceSolver::BuildUrl(const Cluster& cluster) const {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(6);
  oss << cfg_.base_url << "/trip/v1/" << cfg_.profile << "/";

  bool first = true;
  auto add = [&](const Coordinate& c) {
    if (!first) oss << ";";
    first = false;
    oss << c.lon_deg << "," << c.lat_deg; // OSRM 要求 lon,lat
  };
  if (cluster.anchor) add(cluster.anchor->coord);
  for (const auto& m : cluster.members) add(m.coord);

  if (cluster.anchor) {
    oss << "?roundtrip=true&source=first";
  } else {
    oss << "?roundtrip=false&source=first&destination=any";
  }
  oss << "&overview=false";
  return oss.str();
}

Route TripServiceSolver::Solve(const Cluster& cluster) const {
  const auto& members = cluster.members;
  if (members.empty()) ProviderError(cluster.id, "cluster has no members");

  // 没有 depot 且只有一个站点，不用排序
  if (!cluster.anchor && members.size() == 1) {
    Route r = AssembleRoute(cluster.id, members, std::nullopt);
    r.solver = Name();
    r.estimated_duration_minutes = 0.0;
    return r;
  }

  const std::string url = BuildUrl(cluster);
  io::HttpResponse resp;
  try {
    resp = http_->Get(url, cfg_.timeout_s);
  } catch (const io::HttpError& e) {
    if (e.timed_out()) {
      throw RouteOptError(ErrorCode::kOptimizeProviderTimeout,
                          "trip service, cluster " + std::to_string(cluster.id) + ": " + e.what());
    }
    ProviderError(cluster.id, e.what());
  }

  nlohmann::json j;
  try {
    j = nlohmann::json::parse(resp.body);
  } catch (const std::exception& e) {
    ProviderError(cluster.id, "HTTP " + std::to_string(resp.status) + ", unparsable body: " + e.what());
  }

  const std::string code = j.is_object() ? j.value("code", std::string()) : std::string();
  if (resp.status != 200 || code != "Ok") {
    const std::string msg = j.is_object() ? j.value("message", std::string()) : std::string();
    ProviderError(cluster.id, "HTTP " + std::to_string(resp.status) + " code='" + code + "' " + msg);
  }

  const std::size_t offset = cluster.anchor ? 1 : 0;
  const std::size_t n = members.size() + offset;

  // waypoints[i] 对应第 i 个输入坐标；waypoint_index 是它在行程中的位置
  std::vector<long> slot(n, -1);
  try {
    const auto& wps = j.at("waypoints");
    if (!wps.is_array() || wps.size() != n) {
      ProviderError(cluster.id, "expected " + std::to_string(n) + " waypoints");
    }
    for (std::size_t i = 0; i < n; ++i) {
      const auto pos = wps[i].at("waypoint_index").get<long>();
      if (pos < 0 || static_cast<std::size_t>(pos) >= n || slot[static_cast<std::size_t>(pos)] != -1) {
        ProviderError(cluster.id, "waypoint order is not a permutation");
      }
      slot[static_cast<std::size_t>(pos)] = static_cast<long>(i);
    }
  } catch (const nlohmann::json::exception& e) {
    ProviderError(cluster.id, std::string("malformed waypoints: ") + e.what());
  }
  if (cluster.anchor && slot[0] != 0) {
    ProviderError(cluster.id, "trip does not start at the depot");
  }

  std::vector<GeocodeResult> ordered;
  ordered.reserve(members.size());
  for (std::size_t p = offset; p < n; ++p) {
    ordered.push_back(members[static_cast<std::size_t>(slot[p]) - offset]);
  }

  double distance_m = 0.0;
  double duration_s = 0.0;
  try {
    const auto& trip = j.at("trips").at(0);
    distance_m = trip.at("distance").get<double>();
    duration_s = trip.at("duration").get<double>();
  } catch (const nlohmann::json::exception& e) {
    ProviderError(cluster.id, std::string("malformed trips: ") + e.what());
  }
  if (!std::isfinite(distance_m) || distance_m < 0.0) ProviderError(cluster.id, "negative trip distance");

  Route r = AssembleRoute(cluster.id, ordered, cluster.anchor);
  r.total_distance_miles = distance_m / geo::kMetersPerMile;
  r.estimated_duration_minutes = duration_s / 60.0;
  r.solver = Name();

  spdlog::debug("[optimize] trip service cluster {}: {:.2f} mi, {:.1f} min", cluster.id,
                r.total_distance_miles, *r.estimated_duration_minutes);
  return r;
}

} // namespace routeopt
