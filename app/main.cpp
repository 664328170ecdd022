#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "common/log.hpp"
#include "geocode/rate_gate.hpp"
#include "io/curl_http_client.hpp"
#include "io/output_writer.hpp"
#include "io/request_io.hpp"
#include "pipeline/pipeline.hpp"

namespace {

void PrintUsage(const char* argv0) {
  std::cerr << "Usage:\n"
            << "  " << argv0 << " geocode  <request.json> [output_dir] [--config config.json]\n"
            << "  " << argv0 << " optimize <request.json> <output_dir> [--config config.json]\n"
            << "  " << argv0 << " run      <request.json> <output_dir> [--config config.json]\n";
}

} // namespace

int main(int argc, char** argv) {
  std::vector<std::string> positional;
  std::string config_path;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.size() < 2) {
    PrintUsage(argv[0]);
    return 2;
  }
  const std::string& command = positional[0];
  const std::string& request_path = positional[1];
  const std::string output_dir = positional.size() >= 3 ? positional[2] : std::string();

  routeopt::PipelineMode mode;
  if (command == "geocode") {
    mode = routeopt::PipelineMode::kGeocodeOnly;
  } else if (command == "optimize") {
    mode = routeopt::PipelineMode::kFromGeocoded;
  } else if (command == "run") {
    mode = routeopt::PipelineMode::kFull;
  } else {
    PrintUsage(argv[0]);
    return 2;
  }
  if (mode != routeopt::PipelineMode::kGeocodeOnly && output_dir.empty()) {
    PrintUsage(argv[0]);
    return 2;
  }

  try {
    // 1) 配置 + 日志
    routeopt::RouterConfig cfg;
    if (!config_path.empty()) cfg = routeopt::io::RequestIO::LoadConfig(config_path);
    routeopt::InitLogging(cfg.log_level);

    // 2) 进程级组件：一个 HTTP 客户端，一个 provider 限速闸门
    auto http = std::make_shared<routeopt::io::CurlHttpClient>(cfg.geocoder.user_agent);
    auto gate = std::make_shared<routeopt::RateGate>(std::chrono::milliseconds(cfg.geocoder.min_interval_ms));
    const routeopt::Services services = routeopt::MakeServices(cfg, http, gate);

    // 3) 读取请求
    routeopt::RoutingContext ctx;
    ctx.request = routeopt::io::RequestIO::LoadRequest(request_path, cfg.clustering.max_stops_per_route);

    // 4) 跑流程
    routeopt::Pipeline pipe(mode, services);
    pipe.Run(ctx);

    // 5) 输出
    if (mode == routeopt::PipelineMode::kGeocodeOnly) {
      const std::string body = routeopt::io::RequestIO::GeocodeResponse(ctx.geocode_results).dump(2) + "\n";
      if (output_dir.empty()) {
        std::cout << body;
      } else {
        std::filesystem::create_directories(output_dir);
        routeopt::io::OutputWriter::WriteFile(output_dir + "/geocode_results.json", body);
        std::cout << "Done. Output written to: " << output_dir << "\n";
      }
      return 0;
    }

    routeopt::io::OutputWriter::WriteAll(ctx, output_dir);
    std::cout << "Done. " << ctx.routes.size() << " route(s) written to: " << output_dir << "\n";
    if (!ctx.geocode_failures.empty()) {
      std::cout << ctx.geocode_failures.size() << " address(es) could not be routed, see failed_geocodes.csv\n";
    }
    // 有 cluster 失败时其他路线照样落盘，但退出码不为 0
    return ctx.cluster_failures.empty() ? 0 : 3;
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 1;
  }
}
