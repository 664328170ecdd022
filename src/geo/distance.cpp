#include "geo/distance.hpp"

#include <cmath>

namespace routeopt::geo {

namespace {

constexpr double kPi = 3.14159265358979323846;

// WGS-84
constexpr double kA = 6378137.0;
constexpr double kF = 1.0 / 298.257223563;
constexpr double kB = kA * (1.0 - kF);
constexpr double kMeanRadiusM = 6371008.8;

constexpr int kMaxIterations = 200;
constexpr double kConvergence = 1e-12;

inline double Deg2Rad(double deg) { return deg * kPi / 180.0; }

double GreatCircleMeters(const Coordinate& p, const Coordinate& q) {
  const double phi1 = Deg2Rad(p.lat_deg);
  const double phi2 = Deg2Rad(q.lat_deg);
  const double dphi = phi2 - phi1;
  const double dlam = Deg2Rad(q.lon_deg - p.lon_deg);
  const double h = std::sin(dphi / 2) * std::sin(dphi / 2) +
                   std::cos(phi1) * std::cos(phi2) * std::sin(dlam / 2) * std::sin(dlam / 2);
  return 2.0 * kMeanRadiusM * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
}

// Vincenty inverse formula. Returns false when the iteration does not converge
// (nearly antipodal points).
bool VincentyMeters(const Coordinate& p, const Coordinate& q, double& out_m) {
  const double L = Deg2Rad(q.lon_deg - p.lon_deg);
  const double U1 = std::atan((1.0 - kF) * std::tan(Deg2Rad(p.lat_deg)));
  const double U2 = std::atan((1.0 - kF) * std::tan(Deg2Rad(q.lat_deg)));
  const double sinU1 = std::sin(U1), cosU1 = std::cos(U1);
  const double sinU2 = std::sin(U2), cosU2 = std::cos(U2);

  double lambda = L;
  double sinSigma = 0.0, cosSigma = 0.0, sigma = 0.0;
  double cosSqAlpha = 0.0, cos2SigmaM = 0.0;

  for (int iter = 0; iter < kMaxIterations; ++iter) {
    const double sinLambda = std::sin(lambda);
    const double cosLambda = std::cos(lambda);
    const double t1 = cosU2 * sinLambda;
    const double t2 = cosU1 * sinU2 - sinU1 * cosU2 * cosLambda;
    sinSigma = std::sqrt(t1 * t1 + t2 * t2);
    if (sinSigma == 0.0) {
      out_m = 0.0; // coincident points
      return true;
    }
    cosSigma = sinU1 * sinU2 + cosU1 * cosU2 * cosLambda;
    sigma = std::atan2(sinSigma, cosSigma);
    const double sinAlpha = cosU1 * cosU2 * sinLambda / sinSigma;
    cosSqAlpha = 1.0 - sinAlpha * sinAlpha;
    // equatorial line: cosSqAlpha == 0
    cos2SigmaM = (cosSqAlpha != 0.0) ? cosSigma - 2.0 * sinU1 * sinU2 / cosSqAlpha : 0.0;
    const double C = kF / 16.0 * cosSqAlpha * (4.0 + kF * (4.0 - 3.0 * cosSqAlpha));
    const double prev = lambda;
    lambda = L + (1.0 - C) * kF * sinAlpha *
                     (sigma + C * sinSigma * (cos2SigmaM + C * cosSigma * (-1.0 + 2.0 * cos2SigmaM * cos2SigmaM)));
    if (std::fabs(lambda - prev) < kConvergence) {
      const double uSq = cosSqAlpha * (kA * kA - kB * kB) / (kB * kB);
      const double A = 1.0 + uSq / 16384.0 * (4096.0 + uSq * (-768.0 + uSq * (320.0 - 175.0 * uSq)));
      const double B = uSq / 1024.0 * (256.0 + uSq * (-128.0 + uSq * (74.0 - 47.0 * uSq)));
      const double deltaSigma =
          B * sinSigma *
          (cos2SigmaM + B / 4.0 *
                            (cosSigma * (-1.0 + 2.0 * cos2SigmaM * cos2SigmaM) -
                             B / 6.0 * cos2SigmaM * (-3.0 + 4.0 * sinSigma * sinSigma) *
                                 (-3.0 + 4.0 * cos2SigmaM * cos2SigmaM)));
      out_m = kB * A * (sigma - deltaSigma);
      return true;
    }
  }
  return false;
}

} // namespace

double GeodesicMiles(const Coordinate& a, const Coordinate& b) {
  if (a.lat_deg == b.lat_deg && a.lon_deg == b.lon_deg) return 0.0;
  // evaluate in a canonical argument order so d(a,b) and d(b,a) are bit-identical
  const bool swap = (a.lat_deg > b.lat_deg) || (a.lat_deg == b.lat_deg && a.lon_deg > b.lon_deg);
  const Coordinate& p = swap ? b : a;
  const Coordinate& q = swap ? a : b;
  double m = 0.0;
  if (!VincentyMeters(p, q, m)) {
    m = GreatCircleMeters(p, q);
  }
  return m / kMetersPerMile;
}

double RoadMiles(const Coordinate& a, const Coordinate& b) {
  return GeodesicMiles(a, b) * kRoadDistanceFactor;
}

Coordinate Centroid(const std::vector<Coordinate>& pts) {
  Coordinate c;
  if (pts.empty()) return c;
  for (const auto& p : pts) {
    c.lat_deg += p.lat_deg;
    c.lon_deg += p.lon_deg;
  }
  c.lat_deg /= static_cast<double>(pts.size());
  c.lon_deg /= static_cast<double>(pts.size());
  return c;
}

double PathRoadMiles(const std::vector<Coordinate>& path) {
  double total = 0.0;
  for (std::size_t i = 1; i < path.size(); ++i) {
    total += RoadMiles(path[i - 1], path[i]);
  }
  return total;
}

} // namespace routeopt::geo
