#include "common/types.hpp"
#include "common/errors.hpp"

namespace routeopt {

const char* ToString(GeocodeStatus s) {
  switch (s) {
    case GeocodeStatus::kMatched:     return "Matched";
    case GeocodeStatus::kNoMatch:     return "NoMatch";
    case GeocodeStatus::kOutOfRadius: return "OutOfRadius";
    case GeocodeStatus::kError:       return "Error";
  }
  return "Unknown";
}

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kGeocodeNotFound:           return "GeocodeNotFound";
    case ErrorCode::kGeocodeOutOfRadius:        return "GeocodeOutOfRadius";
    case ErrorCode::kGeocodeProviderError:      return "GeocodeProviderError";
    case ErrorCode::kClusterConfigInvalid:      return "ClusterConfigInvalid";
    case ErrorCode::kOptimizeProviderTimeout:   return "OptimizeProviderTimeout";
    case ErrorCode::kOptimizeProviderError:     return "OptimizeProviderError";
    case ErrorCode::kExportSerializationError:  return "ExportSerializationError";
    case ErrorCode::kNoRoutableStops:           return "NoRoutableStops";
    case ErrorCode::kConfigInvalid:             return "ConfigInvalid";
  }
  return "Unknown";
}

std::size_t Route::DeliveryCount() const {
  std::size_t n = 0;
  for (const auto& s : stops) {
    if (!s.is_depot) ++n;
  }
  return n;
}

} // namespace routeopt
