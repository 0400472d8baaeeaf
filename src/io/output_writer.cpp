#include "io/output_writer.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "geo/geodesy.hpp"
#include "geo/polyline_codec.hpp"

namespace fs = std::filesystem;

namespace fuelroute::io {

namespace {

using ojson = nlohmann::ordered_json;

double Round2(double v) { return std::round(v * 100.0) / 100.0; }

void EnsureDir(const fs::path& p) {
  if (!fs::exists(p)) {
    fs::create_directories(p);
  }
}

void WriteText(const fs::path& p, const std::string& text) {
  std::ofstream ofs(p, std::ios::out | std::ios::binary);
  if (!ofs) throw std::runtime_error("Failed to write: " + p.string());
  ofs << text;
}

ojson CoordJson(const Coordinate& c) {
  return ojson::array({c.lat_deg, c.lon_deg});
}

// 地图显示用：每 step 个点取一个，终点总保留
std::vector<Coordinate> SamplePoints(const std::vector<Coordinate>& pts, std::size_t step) {
  std::vector<Coordinate> out;
  if (pts.empty()) return out;
  if (step == 0) step = 1;
  for (std::size_t i = 0; i < pts.size(); i += step) out.push_back(pts[i]);
  if ((pts.size() - 1) % step != 0) out.push_back(pts.back());
  return out;
}

std::string FullAddress(const StationRecord& s) {
  return s.address + ", " + s.city + ", " + s.state;
}

// CSV 字段含逗号/引号时加引号
std::string CsvField(const std::string& s) {
  if (s.find_first_of(",\"\n") == std::string::npos) return s;
  std::string out = "\"";
  for (char ch : s) {
    if (ch == '"') out.push_back('"');
    out.push_back(ch);
  }
  out.push_back('"');
  return out;
}

} // namespace

std::string OutputWriter::BuildPlanJson(const PlanningContext& ctx, const OutputParams& params) {
  const PlanResult& plan = ctx.plan;
  const double distance_miles = ctx.route.total_distance_miles;

  ojson route;
  route["start"] = ctx.endpoints.start_label;
  route["end"] = ctx.endpoints.end_label;
  route["start_coords"] = ctx.endpoints.start_coord ? CoordJson(*ctx.endpoints.start_coord) : ojson();
  route["end_coords"] = ctx.endpoints.end_coord ? CoordJson(*ctx.endpoints.end_coord) : ojson();
  route["distance_miles"] = Round2(distance_miles);
  route["distance_km"] = Round2(distance_miles * geo::kKmPerMile);
  route["duration_hours"] = Round2(ctx.route.duration_hours);
  route["encoded_polyline"] = geo::EncodePolyline(SamplePoints(ctx.route.points, params.polyline_sample_step));
  route["corridor_station_count"] = ctx.candidates.size();

  ojson stops = ojson::array();
  for (const auto& s : plan.stops) {
    ojson j;
    j["station_id"] = s.station.id;
    j["station_name"] = s.station.name;
    j["address"] = FullAddress(s.station);
    j["city"] = s.station.city;
    j["state"] = s.station.state;
    j["coordinates"] = CoordJson(s.station.coordinate);
    j["distance_from_start_miles"] = Round2(s.distance_from_start_miles);
    j["price_per_gallon"] = Round2(s.price_per_gallon);
    j["gallons"] = Round2(s.gallons_purchased);
    j["cost"] = Round2(s.cost);
    stops.push_back(std::move(j));
  }

  ojson root;
  root["route"] = std::move(route);
  root["fuel_stops"] = std::move(stops);
  root["total_fuel_gallons"] = Round2(plan.total_gallons);
  root["total_fuel_cost"] = Round2(plan.total_cost);
  // 全程耗油（含出发时油箱里的那一箱），仅供参考
  root["trip_fuel_burn_gallons"] =
      plan.vehicle.mpg > 0.0 ? Round2(distance_miles / plan.vehicle.mpg) : 0.0;
  root["vehicle_specs"] = {{"mpg", plan.vehicle.mpg}, {"range_miles", plan.vehicle.range_miles}};
  return root.dump(2) + "\n";
}

std::string OutputWriter::BuildFailureJson(const PlanFailure& failure) {
  ojson root;
  root["error"] = failure.message;
  root["status"] = ToString(failure.status);
  if (failure.status == PlanStatus::kUnreachableDestination) {
    root["gap_start_miles"] = Round2(failure.gap_start_miles);
    root["gap_end_miles"] = Round2(failure.gap_end_miles);
  }
  root["fuel_stops"] = ojson::array();
  root["total_fuel_cost"] = 0;
  return root.dump(2) + "\n";
}

void OutputWriter::WriteAll(const PlanningContext& ctx, const OutputParams& params, const std::string& output_dir) {
  EnsureDir(output_dir);
  WriteText(fs::path(output_dir) / "plan.json", BuildPlanJson(ctx, params));
  WriteStopsCsv(ctx.plan, (fs::path(output_dir) / "fuel_stops.csv").string());
}

void OutputWriter::WriteFailure(const PlanFailure& failure, const std::string& output_dir) {
  EnsureDir(output_dir);
  WriteText(fs::path(output_dir) / "error.json", BuildFailureJson(failure));
}

void OutputWriter::WriteStopsCsv(const PlanResult& plan, const std::string& output_path) {
  std::ofstream ofs(output_path);
  if (!ofs) throw std::runtime_error("Failed to write: " + output_path);
  ofs << "station_id,station_name,address,mile,price_per_gallon,gallons,cost\n";
  ofs << std::fixed << std::setprecision(2);
  for (const auto& s : plan.stops) {
    ofs << CsvField(s.station.id) << "," << CsvField(s.station.name) << ","
        << CsvField(FullAddress(s.station)) << "," << s.distance_from_start_miles << ","
        << s.price_per_gallon << "," << s.gallons_purchased << "," << s.cost << "\n";
  }
}

} // namespace fuelroute::io
