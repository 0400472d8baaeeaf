#include "io/config_io.hpp"

#include <cmath>
#include <stdexcept>

#include "io/json_util.hpp"

namespace fuelroute::io {

namespace {

// 计数类参数：必须是 >= min_value 的整数
std::size_t GetCount(const nlohmann::json& obj, const char* key, std::size_t fallback,
                     std::size_t min_value, const std::string& hint) {
  const double v = GetNumber(obj, key, static_cast<double>(fallback), hint);
  if (!std::isfinite(v) || v < static_cast<double>(min_value) || std::floor(v) != v) {
    throw std::runtime_error(hint + ": \"" + key + "\" must be an integer >= " + std::to_string(min_value));
  }
  return static_cast<std::size_t>(v);
}

} // namespace

PlannerConfig ConfigIO::Load(const std::string& path) {
  const std::string text = ReadAllTextIfExists(path);
  if (text.empty()) return PlannerConfig{};
  return Parse(text, path);
}

PlannerConfig ConfigIO::Parse(const std::string& text, const std::string& hint) {
  PlannerConfig cfg;
  const nlohmann::json root = ParseJson(text, hint);
  if (!root.is_object()) {
    throw std::runtime_error(hint + ": config root must be an object");
  }

  const nlohmann::json vehicle = GetObject(root, "vehicle", hint);
  cfg.vehicle.range_miles = GetNumber(vehicle, "range_miles", cfg.vehicle.range_miles, hint + ".vehicle");
  cfg.vehicle.mpg = GetNumber(vehicle, "mpg", cfg.vehicle.mpg, hint + ".vehicle");

  const nlohmann::json corridor = GetObject(root, "corridor", hint);
  cfg.corridor.max_corridor_km =
      GetNumber(corridor, "max_distance_km", cfg.corridor.max_corridor_km, hint + ".corridor");
  // 未显式给出时，粗筛外扩与精筛半径一致
  cfg.corridor.bbox_padding_km =
      GetNumber(corridor, "bbox_padding_km", cfg.corridor.max_corridor_km, hint + ".corridor");
  if (cfg.corridor.max_corridor_km < 0.0 || cfg.corridor.bbox_padding_km < 0.0) {
    throw std::runtime_error(hint + ".corridor: distances must be >= 0");
  }

  const nlohmann::json geocode = GetObject(root, "geocode", hint);
  cfg.geocode.cache_capacity =
      GetCount(geocode, "cache_capacity", cfg.geocode.cache_capacity, 1, hint + ".geocode");
  cfg.geocode.country_suffix =
      GetString(geocode, "country_suffix", cfg.geocode.country_suffix, hint + ".geocode");

  const nlohmann::json output = GetObject(root, "output", hint);
  cfg.output.polyline_sample_step =
      GetCount(output, "polyline_sample_step", cfg.output.polyline_sample_step, 1, hint + ".output");

  return cfg;
}

} // namespace fuelroute::io
