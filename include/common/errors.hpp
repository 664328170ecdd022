#pragma once
#include <stdexcept>
#include <string>

namespace routeopt {

// Error taxonomy shared by every component.
// Per-address geocoding failures are reported as GeocodeResult values;
// the codes below are raised only where a failure ends a unit of work
// (a request, a cluster, an export).
enum class ErrorCode {
  kGeocodeNotFound,
  kGeocodeOutOfRadius,
  kGeocodeProviderError,
  kClusterConfigInvalid,
  kOptimizeProviderTimeout,
  kOptimizeProviderError,
  kExportSerializationError,
  kNoRoutableStops,
  kConfigInvalid,
};

const char* ToString(ErrorCode code);

class RouteOptError : public std::runtime_error {
public:
  RouteOptError(ErrorCode code, const std::string& message)
      : std::runtime_error(std::string(ToString(code)) + ": " + message), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

private:
  ErrorCode code_;
};

} // namespace routeopt
