#include "geocode/nominatim_provider.hpp"

#include <cmath>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace routeopt {

namespace {

// Nominatim sends coordinates as strings; accept numbers too.
double ReadCoord(const nlohmann::json& j, const char* key) {
  const auto& v = j.at(key);
  if (v.is_string()) return std::stod(v.get<std::string>());
  return v.get<double>();
}

} // namespace

NominatimProvider::NominatimProvider(std::shared_ptr<io::IHttpClient> http, GeocoderConfig cfg)
    : http_(std::move(http)), cfg_(std::move(cfg)) {}

std::vector<GeocodeCandidate> NominatimProvider::Search(const std::string& query, int limit) {
  const std::string url = cfg_.base_url + "/search?q=" + io::UrlEncode(query) +
                          "&format=jsonv2&addressdetails=1&limit=" + std::to_string(limit);

  io::HttpResponse resp;
  try {
    resp = http_->Get(url, cfg_.timeout_s);
  } catch (const io::HttpError& e) {
    throw GeocodeProviderError(e.timed_out() ? "Geocoding timed out" : std::string("Geocoding service unavailable: ") + e.what(),
                               true);
  }

  if (resp.status == 429 || resp.status == 503 || resp.status == 502 || resp.status == 504) {
    throw GeocodeProviderError("Geocoding service unavailable (HTTP " + std::to_string(resp.status) + ")", true);
  }
  if (resp.status != 200) {
    throw GeocodeProviderError("Geocoding service error (HTTP " + std::to_string(resp.status) + ")", false);
  }
  return ParseSearchResponse(resp.body);
}

std::vector<GeocodeCandidate> NominatimProvider::ParseSearchResponse(const std::string& body) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(body);
  } catch (const std::exception& e) {
    throw GeocodeProviderError(std::string("Geocoding service error: bad JSON: ") + e.what(), false);
  }
  if (!j.is_array()) {
    throw GeocodeProviderError("Geocoding service error: expected a JSON array", false);
  }

  std::vector<GeocodeCandidate> out;
  for (const auto& item : j) {
    try {
      GeocodeCandidate c;
      c.coord.lat_deg = ReadCoord(item, "lat");
      c.coord.lon_deg = ReadCoord(item, "lon");
      c.display_name = item.value("display_name", std::string());
      if (!std::isfinite(c.coord.lat_deg) || !std::isfinite(c.coord.lon_deg) ||
          std::fabs(c.coord.lat_deg) > 90.0 || std::fabs(c.coord.lon_deg) > 180.0) {
        spdlog::warn("[geocode] skipping candidate with invalid coordinates: {}", c.display_name);
        continue;
      }
      out.push_back(std::move(c));
    } catch (const std::exception& e) {
      spdlog::warn("[geocode] skipping malformed candidate: {}", e.what());
    }
  }
  return out;
}

} // namespace routeopt
