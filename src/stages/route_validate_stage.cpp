#include "stages/route_validate_stage.hpp"

#include <cmath>
#include <string>
#include <vector>

namespace fuelroute {

namespace {

bool IsPositiveFinite(double v) { return std::isfinite(v) && v > 0.0; }

// 折线是否不止一个位置（所有点都重合时长度为 0）
bool HasExtent(const std::vector<Coordinate>& points) {
  for (const auto& p : points) {
    if (!(p == points.front())) return true;
  }
  return false;
}

} // namespace

void RouteValidateStage::ValidateVehicle(const VehicleProfile& vehicle) {
  if (!IsPositiveFinite(vehicle.range_miles) || !IsPositiveFinite(vehicle.mpg)) {
    PlanFailure f;
    f.status = PlanStatus::kInvalidVehicleProfile;
    f.message = "vehicle range_miles and mpg must be positive (got range_miles=" +
                std::to_string(vehicle.range_miles) + ", mpg=" + std::to_string(vehicle.mpg) + ")";
    throw PlanningError(f);
  }
}

void RouteValidateStage::Run(PlanningContext& ctx) {
  if (ctx.route.points.size() < 2) {
    PlanFailure f;
    f.status = PlanStatus::kEmptyRoute;
    f.message = "route polyline needs at least 2 points (got " +
                std::to_string(ctx.route.points.size()) + ")";
    throw PlanningError(f);
  }
  if (!std::isfinite(ctx.route.total_distance_miles) || ctx.route.total_distance_miles < 0.0) {
    PlanFailure f;
    f.status = PlanStatus::kEmptyRoute;
    f.message = "route distance is not a valid non-negative number";
    throw PlanningError(f);
  }
  if (ctx.route.total_distance_miles <= 0.0 && HasExtent(ctx.route.points)) {
    PlanFailure f;
    f.status = PlanStatus::kEmptyRoute;
    f.message = "route distance must be positive for a polyline with nonzero length";
    throw PlanningError(f);
  }

  ValidateVehicle(ctx.vehicle);
}

} // namespace fuelroute
