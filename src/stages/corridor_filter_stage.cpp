#include "stages/corridor_filter_stage.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "geo/geodesy.hpp"

namespace fuelroute {

std::vector<CorridorCandidate> CorridorFilter::Filter(const StationCatalog& catalog,
                                                      const RoutePolyline& route,
                                                      double bbox_padding_km,
                                                      double max_corridor_km) {
  return Filter(catalog.Records(), route, bbox_padding_km, max_corridor_km);
}

std::vector<CorridorCandidate> CorridorFilter::Filter(const std::vector<StationRecord>& stations,
                                                      const RoutePolyline& route,
                                                      double bbox_padding_km,
                                                      double max_corridor_km) {
  std::vector<CorridorCandidate> out;
  if (route.points.size() < 2 || stations.empty()) return out;

  const geo::BoundingBox box = geo::ComputeBoundingBox(route.points, bbox_padding_km);

  for (const auto& s : stations) {
    if (!box.Contains(s.coordinate)) continue;

    const geo::PolylineLocation loc = geo::LocateOnPolyline(route.points, s.coordinate, max_corridor_km);
    if (!loc.found() || loc.distance_km > max_corridor_km) continue;

    CorridorCandidate c;
    c.station = s;
    c.perpendicular_distance_km = loc.distance_km;
    out.push_back(std::move(c));
  }
  return out;
}

void CorridorFilterStage::Run(PlanningContext& ctx) {
  ctx.candidates.clear();
  if (ctx.catalog == nullptr) {
    throw std::invalid_argument("CorridorFilterStage: station catalog not set on context");
  }

  ctx.candidates = CorridorFilter::Filter(*ctx.catalog, ctx.route,
                                          ctx.corridor.bbox_padding_km,
                                          ctx.corridor.max_corridor_km);

  if (ctx.candidates.empty()) {
    PlanFailure f;
    f.status = PlanStatus::kNoStationsInCorridor;
    f.message = "no fuel stations within " + std::to_string(ctx.corridor.max_corridor_km) +
                " km of the route (catalog size " + std::to_string(ctx.catalog->Size()) + ")";
    throw PlanningError(f);
  }
}

} // namespace fuelroute
