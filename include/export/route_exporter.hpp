#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/types.hpp"
#include "export/gpx_writer.hpp"

namespace routeopt {

// RouteSet -> GPX documents + manifests, all in memory.
class RouteExporter {
public:
  explicit RouteExporter(GpxOptions opts) : opts_(std::move(opts)) {}

  ExportBundle Export(const RouteSet& routes,
                      const std::optional<Depot>& depot,
                      const std::vector<ClusterFailure>& failures) const;

  // 编码失败地址（status != kMatched）的 CSV，附原因。
  static std::string FailedGeocodeCsv(const std::vector<GeocodeResult>& failures);

private:
  GpxOptions opts_;
};

} // namespace routeopt
