#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "common/errors.hpp"

namespace fuelroute {

class StationCatalog;

// ========================
// 1) 基础几何类型
// ========================

// WGS84 经纬度（十进制度），不可变值类型
struct Coordinate {
  double lat_deg{0.0};
  double lon_deg{0.0};
};

inline bool operator==(const Coordinate& a, const Coordinate& b) {
  return a.lat_deg == b.lat_deg && a.lon_deg == b.lon_deg;
}
inline bool operator!=(const Coordinate& a, const Coordinate& b) { return !(a == b); }

// 路线折线：来自外部路径服务（只读输入）
// - points 按行驶顺序排列，至少 2 个点才是有效路线
// - 允许相邻重复点（零长度 segment 在累计距离里自动忽略）
struct RoutePolyline {
  std::vector<Coordinate> points;
  double total_distance_miles{0.0}; // 路径服务给出的道路距离
  double duration_hours{0.0};
};

// ========================
// 2) 加油站目录（输入，进程启动时加载一次）
// ========================

// 站点坐标在目录加载时就确定（不会按请求重新 geocode），
// 同一份目录文件两次加载得到的同 id 站点坐标完全一致。
struct StationRecord {
  std::string id;           // OPIS Truckstop ID
  std::string name;
  std::string address;
  std::string city;
  std::string state;
  double price_per_gallon{0.0}; // > 0
  Coordinate coordinate;
};

// ========================
// 3) 管线中间量
// ========================

// CorridorFilter 输出：站点 + 到路线的真实大地线距离（km）
struct CorridorCandidate {
  StationRecord station;
  double perpendicular_distance_km{0.0};
};

// RouteProjector 输出：再加上沿路线的估计里程（英里）
// 不变量：0 <= distance_from_start_miles <= total_route_distance
struct ProjectedStation {
  StationRecord station;
  double perpendicular_distance_km{0.0};
  double distance_from_start_miles{0.0};
};

// ========================
// 4) 车辆 / 参数配置
// ========================

struct VehicleProfile {
  double range_miles{500.0}; // 满箱续航
  double mpg{10.0};          // miles per gallon
};

struct CorridorParams {
  double bbox_padding_km{80.0};  // 包围盒粗筛外扩
  double max_corridor_km{80.0};  // 精筛：到路线的最大距离
};

struct GeocodeParams {
  std::size_t cache_capacity{1000};
  std::string country_suffix{", USA"};
};

struct OutputParams {
  std::size_t polyline_sample_step{10}; // encoded_polyline 每 N 个点取一个
};

struct PlannerConfig {
  VehicleProfile vehicle;
  CorridorParams corridor;
  GeocodeParams geocode;
  OutputParams output;
};

// ========================
// 5) 输出
// ========================

struct FuelStop {
  StationRecord station;
  double distance_from_start_miles{0.0};
  double price_per_gallon{0.0};
  double gallons_purchased{0.0};
  double cost{0.0};
};

// 单次规划的最终结果，构造后不再修改
struct PlanResult {
  std::vector<FuelStop> stops;   // distance_from_start_miles 严格递增
  double total_gallons{0.0};
  double total_cost{0.0};
  VehicleProfile vehicle;
};

// ========================
// 6) 一次完整运行的上下文（各 Stage 之间传递的接口载体）
// ========================

// 起终点信息：只用于输出（路线本身已由外部路径服务解算）
struct RouteEndpoints {
  std::string start_label;
  std::string end_label;
  std::optional<Coordinate> start_coord;
  std::optional<Coordinate> end_coord;
};

struct PlanningContext {
  // === 输入 ===
  const StationCatalog* catalog{nullptr}; // 不拥有；生命周期覆盖整个进程
  RoutePolyline route;
  RouteEndpoints endpoints;
  VehicleProfile vehicle;
  CorridorParams corridor;

  // === 中间结果 ===
  std::vector<CorridorCandidate> candidates;
  std::vector<ProjectedStation> projected;

  // === 输出 ===
  PlanResult plan;
  std::optional<PlanFailure> failure;
};

} // namespace fuelroute
