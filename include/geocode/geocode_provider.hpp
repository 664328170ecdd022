#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include "common/types.hpp"

namespace routeopt {

struct GeocodeCandidate {
  std::string display_name;
  Coordinate coord;
};

// provider 抛出的错误。超时或服务不可用时 transient == true，Geocoder 会退避重试；
// 其他错误直接结束当前地址变体的尝试。
class GeocodeProviderError : public std::runtime_error {
public:
  GeocodeProviderError(const std::string& msg, bool transient)
      : std::runtime_error(msg), transient_(transient) {}

  bool transient() const noexcept { return transient_; }

private:
  bool transient_;
};

// External geocoding service: query -> zero or more candidates, best first.
// Rate limiting is not the provider's job; the Geocoder gates every call.
class IGeocodeProvider {
public:
  virtual ~IGeocodeProvider() = default;
  virtual std::vector<GeocodeCandidate> Search(const std::string& query, int limit) = 0;
};

} // namespace routeopt
