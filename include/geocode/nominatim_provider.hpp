#pragma once
#include <memory>
#include <string>
#include "common/config.hpp"
#include "geocode/geocode_provider.hpp"
#include "io/http_client.hpp"

namespace routeopt {

// Nominatim /search endpoint (OpenStreetMap).
//   GET {base_url}/search?q=<query>&format=jsonv2&limit=N&addressdetails=1
// Response: array of { "lat": "44.97", "lon": "-93.26", "display_name": "..." }
class NominatimProvider final : public IGeocodeProvider {
public:
  NominatimProvider(std::shared_ptr<io::IHttpClient> http, GeocoderConfig cfg);

  std::vector<GeocodeCandidate> Search(const std::string& query, int limit) override;

  // Exposed for tests: parse a /search response body.
  static std::vector<GeocodeCandidate> ParseSearchResponse(const std::string& body);

private:
  std::shared_ptr<io::IHttpClient> http_;
  GeocoderConfig cfg_;
};

} // namespace routeopt
