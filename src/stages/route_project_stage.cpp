#include "stages/route_project_stage.hpp"

#include <algorithm>
#include <utility>

#include "catalog/station_catalog.hpp"
#include "geo/geodesy.hpp"

namespace fuelroute {

namespace {

inline double Clamp(double v, double lo, double hi) {
  if (v < lo) return lo;
  if (v > hi) return hi;
  return v;
}

bool ProjectedLess(const ProjectedStation& a, const ProjectedStation& b) {
  if (a.distance_from_start_miles != b.distance_from_start_miles) {
    return a.distance_from_start_miles < b.distance_from_start_miles;
  }
  if (a.station.price_per_gallon != b.station.price_per_gallon) {
    return a.station.price_per_gallon < b.station.price_per_gallon;
  }
  return StationIdLess(a.station.id, b.station.id);
}

} // namespace

std::vector<ProjectedStation> RouteProjector::Project(const std::vector<CorridorCandidate>& candidates,
                                                      const RoutePolyline& route) {
  std::vector<ProjectedStation> out;
  if (candidates.empty() || route.points.size() < 2) return out;

  const std::vector<double> cum_km = geo::CumulativeDistancesKm(route.points);
  const double polyline_km = cum_km.back();
  const double total_miles = std::max(route.total_distance_miles, 0.0);
  // 折线长度 -> 道路里程 的缩放；折线退化时所有站点落在起点
  const double miles_per_km = (polyline_km > 0.0) ? total_miles / polyline_km : 0.0;

  out.reserve(candidates.size());
  for (const auto& c : candidates) {
    const geo::PolylineLocation loc = geo::LocateOnPolyline(route.points, c.station.coordinate);

    double along_km = 0.0;
    if (loc.found()) {
      const std::size_t i = loc.segment_index;
      along_km = cum_km[i] + (cum_km[i + 1] - cum_km[i]) * loc.fraction;
    }

    ProjectedStation p;
    p.station = c.station;
    p.perpendicular_distance_km = c.perpendicular_distance_km;
    p.distance_from_start_miles = Clamp(along_km * miles_per_km, 0.0, total_miles);
    out.push_back(std::move(p));
  }

  std::stable_sort(out.begin(), out.end(), ProjectedLess);
  return out;
}

void RouteProjectStage::Run(PlanningContext& ctx) {
  ctx.projected = RouteProjector::Project(ctx.candidates, ctx.route);
}

} // namespace fuelroute
