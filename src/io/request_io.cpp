#include "io/request_io.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "common/errors.hpp"

namespace fs = std::filesystem;

namespace routeopt::io {

using json = nlohmann::json;

static std::string ReadAllText(const fs::path& p) {
  std::ifstream ifs(p, std::ios::in | std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("Failed to open file: " + p.string());
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

static json ParseJson(const std::string& text, const std::string& hint) {
  try {
    return json::parse(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("JSON parse failed for " + hint + ": " + std::string(e.what()));
  }
}

// j[key] 存在时拷到 out；类型不对算配置错误。
template <typename T>
static void ReadOpt(const json& j, const char* key, T& out, const char* section) {
  if (!j.is_object() || !j.contains(key) || j.at(key).is_null()) return;
  try {
    out = j.at(key).get<T>();
  } catch (const json::exception& e) {
    throw RouteOptError(ErrorCode::kConfigInvalid,
                        std::string(section) + "." + key + ": " + e.what());
  }
}

static std::string Str(const json& j, const char* key) {
  if (!j.contains(key) || !j.at(key).is_string()) return {};
  return j.at(key).get<std::string>();
}

// 自由文本字段（导出文件里 household size 经常是数字）。
static std::string Text(const json& j, const char* key) {
  if (!j.contains(key) || j.at(key).is_null()) return {};
  const auto& v = j.at(key);
  if (v.is_string()) return v.get<std::string>();
  return v.dump();
}

static DeliveryAddress ParseAddress(const json& j) {
  DeliveryAddress a;
  if (j.is_string()) {
    a.text = j.get<std::string>();
    return a;
  }
  if (!j.is_object()) {
    throw RouteOptError(ErrorCode::kConfigInvalid, "address entries must be strings or objects");
  }
  a.text = Str(j, "address");
  a.original_address = Str(j, "original_address");
  if (a.original_address.empty()) a.original_address = Str(j, "originalAddress");
  a.name = Text(j, "name");
  a.phone = Text(j, "phone");
  a.household_size = Text(j, "household_size");
  a.special_items = Text(j, "special_items");
  a.notes = Text(j, "notes");
  return a;
}

static GeocodeResult ParseLocation(const json& j) {
  GeocodeResult r;
  r.query = ParseAddress(j);
  r.display_name = Str(j, "display_name");
  if (r.display_name.empty()) r.display_name = Str(j, "displayName");
  if (!j.contains("lat") || !j.contains("lon") || !j.at("lat").is_number() || !j.at("lon").is_number()) {
    r.status = GeocodeStatus::kError;
    r.error_detail = "Missing lat/lon";
    return r;
  }
  r.coord.lat_deg = j.at("lat").get<double>();
  r.coord.lon_deg = j.at("lon").get<double>();
  r.status = GeocodeStatus::kMatched;
  if (j.contains("distanceFromStart") && j.at("distanceFromStart").is_number()) {
    r.distance_from_depot_miles = j.at("distanceFromStart").get<double>();
  }
  return r;
}

RouterConfig RequestIO::ParseConfig(const json& j) {
  RouterConfig cfg;
  if (j.is_null()) return cfg;
  if (!j.is_object()) throw RouteOptError(ErrorCode::kConfigInvalid, "config root must be an object");

  ReadOpt(j, "log_level", cfg.log_level, "config");

  if (j.contains("geocoder")) {
    const auto& g = j.at("geocoder");
    ReadOpt(g, "base_url", cfg.geocoder.base_url, "geocoder");
    ReadOpt(g, "user_agent", cfg.geocoder.user_agent, "geocoder");
    ReadOpt(g, "timeout_s", cfg.geocoder.timeout_s, "geocoder");
    ReadOpt(g, "max_retries", cfg.geocoder.max_retries, "geocoder");
    ReadOpt(g, "backoff_base_ms", cfg.geocoder.backoff_base_ms, "geocoder");
    ReadOpt(g, "min_interval_ms", cfg.geocoder.min_interval_ms, "geocoder");
    ReadOpt(g, "max_variations", cfg.geocoder.max_variations, "geocoder");
    ReadOpt(g, "candidate_limit", cfg.geocoder.candidate_limit, "geocoder");
    ReadOpt(g, "worker_threads", cfg.geocoder.worker_threads, "geocoder");
  }
  if (j.contains("clustering")) {
    const auto& c = j.at("clustering");
    ReadOpt(c, "algorithm", cfg.clustering.algorithm, "clustering");
    ReadOpt(c, "max_stops_per_route", cfg.clustering.max_stops_per_route, "clustering");
  }
  if (j.contains("optimizer")) {
    const auto& o = j.at("optimizer");
    ReadOpt(o, "use_trip_service", cfg.optimizer.use_trip_service, "optimizer");
    ReadOpt(o, "base_url", cfg.optimizer.base_url, "optimizer");
    ReadOpt(o, "profile", cfg.optimizer.profile, "optimizer");
    ReadOpt(o, "timeout_s", cfg.optimizer.timeout_s, "optimizer");
    ReadOpt(o, "parallel", cfg.optimizer.parallel, "optimizer");
    ReadOpt(o, "max_workers", cfg.optimizer.max_workers, "optimizer");
  }
  if (j.contains("export")) {
    const auto& e = j.at("export");
    ReadOpt(e, "creator", cfg.exporter.creator, "export");
    ReadOpt(e, "depot_name", cfg.exporter.depot_name, "export");
  }

  ValidateConfig(cfg);
  return cfg;
}

RouterConfig RequestIO::LoadConfig(const std::string& path) {
  return ParseConfig(ParseJson(ReadAllText(path), path));
}

RoutingRequest RequestIO::ParseRequest(const json& j, int max_stops_default) {
  if (!j.is_object()) throw RouteOptError(ErrorCode::kConfigInvalid, "request root must be an object");

  RoutingRequest req;
  req.max_stops_per_route = max_stops_default;
  ReadOpt(j, "max_stops_per_route", req.max_stops_per_route, "request");
  ReadOpt(j, "maxStops", req.max_stops_per_route, "request");

  if (j.contains("addresses")) {
    const auto& arr = j.at("addresses");
    if (!arr.is_array()) throw RouteOptError(ErrorCode::kConfigInvalid, "request.addresses must be an array");
    for (const auto& a : arr) req.addresses.push_back(ParseAddress(a));

    if (j.contains("originalAddresses") && j.at("originalAddresses").is_array()) {
      const auto& labels = j.at("originalAddresses");
      for (std::size_t i = 0; i < labels.size() && i < req.addresses.size(); ++i) {
        if (labels[i].is_string() && req.addresses[i].original_address.empty()) {
          req.addresses[i].original_address = labels[i].get<std::string>();
        }
      }
    }

    int depot_index = -1;
    ReadOpt(j, "depot_index", depot_index, "request");
    if (depot_index >= 0) req.depot_index = depot_index;

    double radius = -1.0;
    ReadOpt(j, "radius_miles", radius, "request");
    ReadOpt(j, "radiusMiles", radius, "request");
    if (radius >= 0.0) req.radius_miles = radius;
  }

  if (j.contains("locations")) {
    const auto& arr = j.at("locations");
    if (!arr.is_array()) throw RouteOptError(ErrorCode::kConfigInvalid, "request.locations must be an array");
    for (const auto& l : arr) req.geocoded.push_back(ParseLocation(l));

    const char* depot_key = j.contains("depot") ? "depot" : "start";
    if (j.contains(depot_key) && j.at(depot_key).is_object()) {
      req.geocoded_depot = ParseLocation(j.at(depot_key));
    }
  }

  if (!j.contains("addresses") && !j.contains("locations")) {
    throw RouteOptError(ErrorCode::kConfigInvalid, "request has neither 'addresses' nor 'locations'");
  }
  return req;
}

RoutingRequest RequestIO::LoadRequest(const std::string& path, int max_stops_default) {
  return ParseRequest(ParseJson(ReadAllText(path), path), max_stops_default);
}

json RequestIO::GeocodeResponse(const std::vector<GeocodeResult>& results) {
  json out = json::array();
  for (const auto& r : results) {
    json e;
    e["address"] = r.query.text;
    e["originalAddress"] = r.query.Label();
    if (r.IsMatched()) {
      e["displayName"] = r.display_name;
      e["lat"] = r.coord.lat_deg;
      e["lon"] = r.coord.lon_deg;
      if (r.distance_from_depot_miles) e["distanceFromStart"] = *r.distance_from_depot_miles;
    } else {
      e["status"] = ToString(r.status);
      e["error"] = r.error_detail.value_or("Unknown error");
    }
    out.push_back(std::move(e));
  }
  return out;
}

} // namespace routeopt::io
