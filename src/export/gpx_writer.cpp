#include "export/gpx_writer.hpp"

#include <cmath>
#include <cstdio>
#include <sstream>

#include "common/errors.hpp"
#include "export/text_format.hpp"

namespace routeopt {

namespace {

constexpr int kCoordDecimals = 7;

void CheckCoord(const Route& route, const Stop& s) {
  const auto& c = s.location.coord;
  if (!std::isfinite(c.lat_deg) || !std::isfinite(c.lon_deg) ||
      std::fabs(c.lat_deg) > 90.0 || std::fabs(c.lon_deg) > 180.0) {
    throw RouteOptError(ErrorCode::kExportSerializationError,
                        "route " + std::to_string(route.index) + " stop " + std::to_string(s.sequence_number) +
                            " has an invalid coordinate");
  }
}

std::string LatLonAttrs(const Coordinate& c) {
  return "lat=\"" + FormatFixed(c.lat_deg, kCoordDecimals) + "\" lon=\"" + FormatFixed(c.lon_deg, kCoordDecimals) + "\"";
}

std::string DeliveryDescription(const DeliveryAddress& a) {
  std::string d = a.Label();
  d += "\nPhone: " + FormatPhone(a.phone);
  if (!a.household_size.empty()) d += "\nHousehold: " + a.household_size;
  if (!a.special_items.empty()) d += "\nSpecial: " + a.special_items;
  if (!a.notes.empty()) d += "\nNotes: " + a.notes;
  return d;
}

void WriteWaypoint(std::ostringstream& os, const Coordinate& c, const std::string& name,
                   const std::string& desc, const char* sym) {
  os << "  <wpt " << LatLonAttrs(c) << ">\n";
  os << "    <name>" << XmlEscape(name) << "</name>\n";
  os << "    <desc>" << XmlEscape(desc) << "</desc>\n";
  os << "    <sym>" << sym << "</sym>\n";
  os << "  </wpt>\n";
}

} // namespace

std::string GpxWriter::FileName(const Route& route) {
  char name[64];
  std::snprintf(name, sizeof(name), "route_%02d.gpx", route.index);
  return name;
}

std::string GpxWriter::Write(const Route& route, const GpxOptions& opts) {
  if (route.stops.empty()) {
    throw RouteOptError(ErrorCode::kExportSerializationError,
                        "route " + std::to_string(route.index) + " has no stops");
  }
  for (const auto& s : route.stops) CheckCoord(route, s);

  std::ostringstream os;
  os << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
  os << "<gpx version=\"1.1\" creator=\"" << XmlEscape(opts.creator)
     << "\" xmlns=\"http://www.topografix.com/GPX/1/1\">\n";

  // metadata
  const std::size_t n_stops = route.DeliveryCount();
  os << "  <metadata>\n";
  os << "    <name>Delivery Route " << route.index << "</name>\n";
  os << "    <desc>" << XmlEscape("Route with " + std::to_string(n_stops) + (n_stops == 1 ? " stop" : " stops") +
                                  ", " + FormatFixed(route.total_distance_miles, 1) + " miles")
     << "</desc>\n";
  os << "  </metadata>\n";

  // waypoints
  int delivery_no = 0;
  bool seen_depot = false;
  for (const auto& s : route.stops) {
    if (s.is_depot) {
      const bool start = !seen_depot;
      seen_depot = true;
      WriteWaypoint(os, s.location.coord, (start ? "START: " : "END: ") + opts.depot_name,
                    start ? "Departure point: " + s.location.query.Label()
                          : "Return point: " + s.location.query.Label(),
                    "Flag, Blue");
      continue;
    }
    ++delivery_no;
    const auto& a = s.location.query;
    const std::string who = a.name.empty() ? a.Label() : a.name;
    WriteWaypoint(os, s.location.coord, std::to_string(delivery_no) + ". " + who, DeliveryDescription(a),
                  "Flag, Green");
  }

  // track
  os << "  <trk>\n";
  os << "    <name>Route " << route.index << " Track</name>\n";
  os << "    <trkseg>\n";
  for (const auto& s : route.stops) {
    os << "      <trkpt " << LatLonAttrs(s.location.coord) << "/>\n";
  }
  os << "    </trkseg>\n";
  os << "  </trk>\n";
  os << "</gpx>\n";
  return os.str();
}

} // namespace routeopt
