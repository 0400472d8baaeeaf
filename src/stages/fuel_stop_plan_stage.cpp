#include "stages/fuel_stop_plan_stage.hpp"

#include <algorithm>
#include <cstdio>
#include <string>
#include <utility>

#include "catalog/station_catalog.hpp"
#include "stages/route_validate_stage.hpp"

namespace fuelroute {

namespace {

bool ByMileMarker(const ProjectedStation& a, const ProjectedStation& b) {
  return a.distance_from_start_miles < b.distance_from_start_miles;
}

// a 是否比 b 更适合作为本窗口的加油点
bool BetterStop(const ProjectedStation& a, const ProjectedStation& b) {
  if (a.station.price_per_gallon != b.station.price_per_gallon) {
    return a.station.price_per_gallon < b.station.price_per_gallon;
  }
  if (a.distance_from_start_miles != b.distance_from_start_miles) {
    return a.distance_from_start_miles > b.distance_from_start_miles;
  }
  return StationIdLess(a.station.id, b.station.id);
}

std::string FormatMiles(double v) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.2f", v);
  return buf;
}

} // namespace

PlanResult FuelStopPlanner::Plan(const std::vector<ProjectedStation>& projected,
                                 double total_route_distance_miles,
                                 const VehicleProfile& vehicle) {
  RouteValidateStage::ValidateVehicle(vehicle);

  // 输入约定是已排序；不是的话排一份副本，不改调用方数据
  std::vector<ProjectedStation> sorted_copy;
  const std::vector<ProjectedStation>* stations = &projected;
  if (!std::is_sorted(projected.begin(), projected.end(), ByMileMarker)) {
    sorted_copy = projected;
    std::stable_sort(sorted_copy.begin(), sorted_copy.end(), ByMileMarker);
    stations = &sorted_copy;
  }
  const std::vector<ProjectedStation>& st = *stations;

  const double total = std::max(total_route_distance_miles, 0.0);

  PlanResult result;
  result.vehicle = vehicle;

  double position = 0.0;
  double range_left = vehicle.range_miles; // 出发满箱
  std::size_t cursor = 0;                  // 第一个里程 > position 的站点

  while (position + range_left < total) {
    const double limit = position + range_left;

    while (cursor < st.size() && st[cursor].distance_from_start_miles <= position) ++cursor;

    const ProjectedStation* best = nullptr;
    for (std::size_t i = cursor; i < st.size() && st[i].distance_from_start_miles <= limit; ++i) {
      if (best == nullptr || BetterStop(st[i], *best)) best = &st[i];
    }

    if (best == nullptr) {
      PlanFailure f;
      f.status = PlanStatus::kUnreachableDestination;
      f.gap_start_miles = position;
      f.gap_end_miles = std::min(limit, total);
      f.message = "no reachable fuel station between mile " + FormatMiles(f.gap_start_miles) +
                  " and mile " + FormatMiles(f.gap_end_miles);
      throw PlanningError(f);
    }

    // 加满：补回自上次加满以来消耗的里程
    const double advanced = best->distance_from_start_miles - position;

    FuelStop stop;
    stop.station = best->station;
    stop.distance_from_start_miles = best->distance_from_start_miles;
    stop.price_per_gallon = best->station.price_per_gallon;
    stop.gallons_purchased = advanced / vehicle.mpg;
    stop.cost = stop.gallons_purchased * stop.price_per_gallon;

    result.total_gallons += stop.gallons_purchased;
    result.total_cost += stop.cost;
    result.stops.push_back(std::move(stop));

    position = best->distance_from_start_miles;
    range_left = vehicle.range_miles;
  }

  return result;
}

void FuelStopPlanStage::Run(PlanningContext& ctx) {
  ctx.plan = PlanResult{};
  ctx.plan = FuelStopPlanner::Plan(ctx.projected, ctx.route.total_distance_miles, ctx.vehicle);
}

} // namespace fuelroute
