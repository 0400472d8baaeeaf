#include "io/request_io.hpp"

#include <stdexcept>

#include "geo/geodesy.hpp"
#include "geo/polyline_codec.hpp"
#include "io/json_util.hpp"

namespace fuelroute::io {

namespace {

using json = nlohmann::json;

std::string Trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

// [[lon, lat], ...] -> Coordinate{lat, lon}
std::vector<Coordinate> ParseLonLatArray(const json& arr, const std::string& hint) {
  if (!arr.is_array()) throw std::runtime_error(hint + ": coordinates must be an array");

  std::vector<Coordinate> pts;
  pts.reserve(arr.size());
  for (const auto& v : arr) {
    if (!v.is_array() || v.size() < 2 || !v.at(0).is_number() || !v.at(1).is_number()) {
      throw std::runtime_error(hint + ": each coordinate must be [lon, lat]");
    }
    pts.push_back(Coordinate{v.at(1).get<double>(), v.at(0).get<double>()});
  }
  return pts;
}

} // namespace

RouteRequest RequestIO::Load(const std::string& path) {
  return Parse(ReadAllText(path), path);
}

RouteRequest RequestIO::Parse(const std::string& text, const std::string& hint) {
  const json root = ParseJson(text, hint);
  if (!root.is_object()) throw std::runtime_error(hint + ": request root must be an object");

  RouteRequest req;
  req.start = Trim(GetString(root, "start", "", hint));
  req.end = Trim(GetString(root, "end", "", hint));
  if (req.start.empty() || req.end.empty()) {
    throw std::runtime_error(hint + ": both start and end locations are required");
  }

  const json route = GetObject(root, "route", hint);
  if (route.empty()) throw std::runtime_error(hint + ": missing route");

  // geometry：编码串，或 GeoJSON 风格的 { "coordinates": [...] }
  if (route.contains("geometry")) {
    const json& g = route.at("geometry");
    if (g.is_string()) {
      try {
        req.route.points = geo::DecodePolyline(g.get<std::string>());
      } catch (const std::invalid_argument& e) {
        throw std::runtime_error(hint + ": bad encoded geometry: " + e.what());
      }
    } else if (g.is_object() && g.contains("coordinates")) {
      req.route.points = ParseLonLatArray(g.at("coordinates"), hint + ".route.geometry");
    } else {
      throw std::runtime_error(hint + ": route.geometry must be a string or an object with coordinates");
    }
  } else if (route.contains("coordinates")) {
    req.route.points = ParseLonLatArray(route.at("coordinates"), hint + ".route");
  }

  // 总里程以服务商给的路面距离为准，缺失时不能按 0 处理
  const json summary = GetObject(route, "summary", hint + ".route");
  if (!summary.contains("distance") || summary.at("distance").is_null()) {
    throw std::runtime_error(hint + ": route.summary.distance is required");
  }
  const double distance_m = GetNumber(summary, "distance", 0.0, hint + ".route.summary");
  const double duration_s = GetNumber(summary, "duration", 0.0, hint + ".route.summary");
  if (distance_m < 0.0) {
    throw std::runtime_error(hint + ": route.summary.distance must be >= 0");
  }
  req.route.total_distance_miles = distance_m / 1000.0 / geo::kKmPerMile;
  req.route.duration_hours = duration_s / 3600.0;

  return req;
}

} // namespace fuelroute::io
