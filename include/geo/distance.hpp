#pragma once
#include <vector>
#include "common/types.hpp"

namespace routeopt::geo {

// 直线距离换算成道路距离的经验系数。
constexpr double kRoadDistanceFactor = 1.35;
constexpr double kMetersPerMile = 1609.344;

// 椭球面（WGS-84，Vincenty 反解）距离，单位英里。
// 只用于半径过滤。
double GeodesicMiles(const Coordinate& a, const Coordinate& b);

// GeodesicMiles * kRoadDistanceFactor.
// 聚类、最近邻选择、本地路线长度都用它。
double RoadMiles(const Coordinate& a, const Coordinate& b);

// Arithmetic mean of lat/lon. Empty input => {0,0}.
Coordinate Centroid(const std::vector<Coordinate>& pts);

// Sum of RoadMiles along the polyline.
double PathRoadMiles(const std::vector<Coordinate>& path);

} // namespace routeopt::geo
