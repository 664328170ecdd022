#pragma once
#include <string>
#include "common/types.hpp"

namespace routeopt::io {

// OutputWriter 把一次运行的最终产物写到磁盘：
//   route_01.gpx, route_02.gpx, ...   每条路线一个
//   manifest.txt                      给司机看的汇总
//   route_manifest.json               机器可读的汇总
//   failed_geocodes.csv               只有存在失败地址时才写
class OutputWriter {
public:
  static void WriteAll(const RoutingContext& ctx, const std::string& output_dir);

  static void WriteFile(const std::string& path, const std::string& content);
};

} // namespace routeopt::io
