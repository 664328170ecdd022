#pragma once
#include <string>
#include "common/types.hpp"

namespace routeopt {

struct GpxOptions {
  std::string creator{"Delivery Route Optimizer"};
  std::string depot_name{"Depot"};
};

// 一条路线对应的 GPX 1.1 文档：
//   <metadata>  name 为 "Delivery Route N"，描述里有站点数和里程
//   <wpt>       每个站点一个："START: <depot>", "1. <name>", ..., "END: <depot>"
//   <trk>       一个 segment，按访问顺序每站一个 <trkpt>
// 输出只取决于 route 和 options（不含时间戳），相同输入得到相同字节。坐标保留 7 位小数。
// 空路线或坐标非有限值/越界时抛 RouteOptError(kExportSerializationError)。
class GpxWriter {
public:
  static std::string Write(const Route& route, const GpxOptions& opts);

  // "route_01.gpx"
  static std::string FileName(const Route& route);
};

} // namespace routeopt
