#include "export/manifest_writer.hpp"

#include <cmath>
#include <sstream>

#include "export/gpx_writer.hpp"
#include "export/text_format.hpp"

namespace routeopt {

namespace {

const std::string kRule(70, '=');
const std::string kThinRule(70, '-');

std::size_t TotalStops(const RouteSet& routes) {
  std::size_t n = 0;
  for (const auto& r : routes) n += r.DeliveryCount();
  return n;
}

double TotalMiles(const RouteSet& routes) {
  double d = 0.0;
  for (const auto& r : routes) d += r.total_distance_miles;
  return d;
}

} // namespace

std::string ManifestWriter::Text(const RouteSet& routes,
                                 const std::optional<Depot>& depot,
                                 const std::vector<ClusterFailure>& failures) {
  std::ostringstream os;
  os << kRule << "\n";
  os << "DELIVERY ROUTE MANIFEST\n";
  os << kRule << "\n\n";

  if (depot) os << "Depot: " << depot->query.Label() << "\n\n";

  os << "Total Routes: " << routes.size() << "\n";
  os << "Total Stops: " << TotalStops(routes) << "\n";
  os << "Total Distance: " << FormatFixed(TotalMiles(routes), 1) << " miles\n";
  if (!failures.empty()) os << "Failed Clusters: " << failures.size() << "\n";
  os << "\n" << kThinRule << "\n\n";

  for (const auto& r : routes) {
    os << "ROUTE " << r.index << "\n";
    os << "Stops: " << r.DeliveryCount() << "\n";
    os << "Distance: " << FormatFixed(r.total_distance_miles, 1) << " miles\n";
    if (r.estimated_duration_minutes && *r.estimated_duration_minutes > 0.0) {
      os << "Est. Duration: " << FormatFixed(*r.estimated_duration_minutes, 0) << " min\n";
    }
    os << "Solver: " << r.solver << (r.degraded ? " (fallback)" : "") << "\n\n";

    int no = 0;
    for (const auto& s : r.stops) {
      if (s.is_depot) continue;
      const auto& a = s.location.query;
      os << "  " << ++no << ". " << (a.name.empty() ? a.Label() : a.name) << "\n";
      os << "     " << a.Label() << "\n";
      os << "     Phone: " << FormatPhone(a.phone) << "\n";
      if (!a.special_items.empty()) os << "     Special: " << a.special_items << "\n";
      os << "\n";
    }
    os << kThinRule << "\n\n";
  }

  for (const auto& f : failures) {
    os << "FAILED CLUSTER " << f.cluster_id << " [" << f.code << "]: " << f.message << "\n";
  }
  return os.str();
}

nlohmann::json ManifestWriter::Json(const RouteSet& routes,
                                    const std::optional<Depot>& depot,
                                    const std::vector<ClusterFailure>& failures) {
  using json = nlohmann::json;

  json m;
  m["depot_address"] = depot ? json(depot->query.Label()) : json(nullptr);
  m["total_routes"] = routes.size();
  m["total_stops"] = TotalStops(routes);
  m["total_distance_miles"] = TotalMiles(routes);

  json jr = json::array();
  for (const auto& r : routes) {
    json route;
    route["route_number"] = r.index;
    route["file"] = GpxWriter::FileName(r);
    route["stop_count"] = r.DeliveryCount();
    route["total_distance_miles"] = r.total_distance_miles;
    route["estimated_duration_minutes"] =
        r.estimated_duration_minutes ? json(*r.estimated_duration_minutes) : json(nullptr);
    route["solver"] = r.solver;
    route["degraded"] = r.degraded;

    json stops = json::array();
    int no = 0;
    for (const auto& s : r.stops) {
      if (s.is_depot) continue;
      const auto& loc = s.location;
      json js;
      js["sequence"] = ++no;
      js["name"] = loc.query.name;
      js["phone"] = loc.query.phone;
      js["address"] = loc.query.Label();
      js["display_name"] = loc.display_name;
      js["lat"] = loc.coord.lat_deg;
      js["lon"] = loc.coord.lon_deg;
      js["household_size"] = loc.query.household_size;
      js["special_items"] = loc.query.special_items;
      js["notes"] = loc.query.notes;
      js["distance_from_depot_miles"] =
          loc.distance_from_depot_miles ? json(*loc.distance_from_depot_miles) : json(nullptr);
      stops.push_back(std::move(js));
    }
    route["stops"] = std::move(stops);
    jr.push_back(std::move(route));
  }
  m["routes"] = std::move(jr);

  json jf = json::array();
  for (const auto& f : failures) {
    jf.push_back({{"cluster_id", f.cluster_id}, {"code", f.code}, {"message", f.message}});
  }
  m["failed_clusters"] = std::move(jf);
  return m;
}

} // namespace routeopt
