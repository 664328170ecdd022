#include "io/output_writer.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "export/route_exporter.hpp"

namespace fs = std::filesystem;

namespace routeopt::io {

static void EnsureDir(const fs::path& p) {
  if (!fs::exists(p)) {
    fs::create_directories(p);
  }
}

void OutputWriter::WriteFile(const std::string& path, const std::string& content) {
  std::ofstream ofs(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!ofs) throw std::runtime_error("Failed to write: " + path);
  ofs << content;
  if (!ofs) throw std::runtime_error("Failed to write: " + path);
}

void OutputWriter::WriteAll(const RoutingContext& ctx, const std::string& output_dir) {
  const fs::path outdir(output_dir);
  EnsureDir(outdir);

  for (const auto& f : ctx.exported.gpx_files) {
    WriteFile((outdir / f.file_name).string(), f.content);
  }
  WriteFile((outdir / "manifest.txt").string(), ctx.exported.manifest_text);
  WriteFile((outdir / "route_manifest.json").string(), ctx.exported.manifest_json.dump(2) + "\n");

  if (!ctx.geocode_failures.empty()) {
    WriteFile((outdir / "failed_geocodes.csv").string(), RouteExporter::FailedGeocodeCsv(ctx.geocode_failures));
  }
  spdlog::info("[export] wrote {} file(s) to {}",
               ctx.exported.gpx_files.size() + 2 + (ctx.geocode_failures.empty() ? 0 : 1), outdir.string());
}

} // namespace routeopt::io
