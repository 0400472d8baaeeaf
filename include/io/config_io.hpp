#pragma once
#include <string>
#include "common/types.hpp"

namespace fuelroute::io {

// 规划参数：input_dir/config.json，所有字段可选
//
//   {
//     "vehicle":  { "range_miles": 500, "mpg": 10 },
//     "corridor": { "max_distance_km": 80, "bbox_padding_km": 80 },
//     "geocode":  { "cache_capacity": 1000, "country_suffix": ", USA" },
//     "output":   { "polyline_sample_step": 10 }
//   }
//
// 文件不存在 -> 全部默认值。类型不对抛 std::runtime_error（带 key）。
// 车辆参数的正负不在这里检查，交给 Pipeline 报 kInvalidVehicleProfile。
class ConfigIO {
public:
  static PlannerConfig Load(const std::string& path);
  static PlannerConfig Parse(const std::string& text, const std::string& hint);
};

} // namespace fuelroute::io
