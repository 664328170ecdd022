#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace routeopt {

// ========================
// 1) 基础几何
// ========================

// WGS-84 latitude/longitude in degrees.
struct Coordinate {
  double lat_deg{0.0};
  double lon_deg{0.0};
};

// ========================
// 2) 请求输入
// ========================

// 调用方给出的一条配送地址。
// text 原样发给地理编码服务，不会被改写；
// 其余字段只是透传的展示标签（GPX 描述、清单）。
struct DeliveryAddress {
  std::string text;
  std::string original_address; // 展示用标签，为空时退回 text
  std::string name;
  std::string phone;
  std::string household_size;
  std::string special_items;
  std::string notes;

  const std::string& Label() const { return original_address.empty() ? text : original_address; }
};

// ========================
// 3) 地理编码输出
// ========================

enum class GeocodeStatus {
  kMatched,
  kNoMatch,
  kOutOfRadius,
  kError,
};

const char* ToString(GeocodeStatus s);

// 每个输入地址对应一条结果，保持输入顺序。
// kOutOfRadius 时 coord/display_name 存的是被拒绝的最近候选。
struct GeocodeResult {
  DeliveryAddress query;
  std::string display_name;
  Coordinate coord;
  GeocodeStatus status{GeocodeStatus::kNoMatch};
  std::optional<std::string> error_detail;
  std::optional<double> distance_from_depot_miles; // geodesic, unadjusted
  std::string matched_query;                       // 命中的那个地址变体

  bool IsMatched() const { return status == GeocodeStatus::kMatched; }
};

// The start/end location of round-trip routes.
using Depot = GeocodeResult;

// ========================
// 4) 聚类 / 路线
// ========================

struct Cluster {
  int id{0};
  std::vector<GeocodeResult> members;
  std::optional<Depot> anchor;
};

struct Stop {
  GeocodeResult location;
  int sequence_number{0};
  bool is_depot{false};
};

struct Route {
  int index{0};
  std::vector<Stop> stops;
  double total_distance_miles{0.0};
  std::optional<double> estimated_duration_minutes;
  std::string solver;   // 给出这个顺序的 solver 名
  bool degraded{false}; // 用了低优先级的兜底策略时为 true

  // Number of delivery stops (depot visits excluded).
  std::size_t DeliveryCount() const;
};

using RouteSet = std::vector<Route>;

// 所有路线策略都失败的 cluster。
struct ClusterFailure {
  int cluster_id{0};
  std::string code;
  std::string message;
};

// ========================
// 5) 导出结果
// ========================

struct ExportedFile {
  std::string file_name;
  std::string content;
};

struct ExportBundle {
  std::vector<ExportedFile> gpx_files;
  std::string manifest_text;
  nlohmann::json manifest_json;
};

// ========================
// 6) 在各 Stage 之间传递的请求级上下文
// ========================

struct RoutingRequest {
  std::vector<DeliveryAddress> addresses;
  std::optional<int> depot_index;
  std::optional<double> radius_miles;
  int max_stops_per_route{4};

  // 只做优化的请求自带坐标。
  std::vector<GeocodeResult> geocoded;
  std::optional<Depot> geocoded_depot;
};

struct RoutingContext {
  // === 输入 ===
  RoutingRequest request;

  // === GeocodeStage 输出 ===
  std::vector<GeocodeResult> geocode_results;

  // === StopFilterStage 输出 ===
  std::optional<Depot> depot;
  std::vector<GeocodeResult> stops;
  std::vector<GeocodeResult> geocode_failures;

  // === ClusterStage 输出 ===
  std::vector<Cluster> clusters;

  // === OptimizeStage 输出 ===
  RouteSet routes;
  std::vector<ClusterFailure> cluster_failures;

  // === ExportStage 输出 ===
  ExportBundle exported;
};

} // namespace routeopt
