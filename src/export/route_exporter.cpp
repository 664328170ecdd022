#include "export/route_exporter.hpp"

#include <sstream>

#include <spdlog/spdlog.h>

#include "export/manifest_writer.hpp"
#include "export/text_format.hpp"

namespace routeopt {

ExportBundle RouteExporter::Export(const RouteSet& routes,
                                   const std::optional<Depot>& depot,
                                   const std::vector<ClusterFailure>& failures) const {
  ExportBundle b;
  b.gpx_files.reserve(routes.size());
  for (const auto& r : routes) {
    b.gpx_files.push_back({GpxWriter::FileName(r), GpxWriter::Write(r, opts_)});
  }
  b.manifest_text = ManifestWriter::Text(routes, depot, failures);
  b.manifest_json = ManifestWriter::Json(routes, depot, failures);
  spdlog::info("[export] {} GPX file(s) + manifest", b.gpx_files.size());
  return b;
}

std::string RouteExporter::FailedGeocodeCsv(const std::vector<GeocodeResult>& failures) {
  std::ostringstream os;
  os << "address,name,phone,household_size,special_items,notes,status,geocode_error\n";
  for (const auto& r : failures) {
    const auto& a = r.query;
    os << CsvField(a.Label()) << ',' << CsvField(a.name) << ',' << CsvField(a.phone) << ','
       << CsvField(a.household_size) << ',' << CsvField(a.special_items) << ',' << CsvField(a.notes) << ','
       << ToString(r.status) << ',' << CsvField(r.error_detail.value_or("Unknown error")) << "\n";
  }
  return os.str();
}

} // namespace routeopt
