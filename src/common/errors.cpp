#include "common/errors.hpp"

#include <utility>

namespace fuelroute {

const char* ToString(PlanStatus status) {
  switch (status) {
    case PlanStatus::kOk:                     return "ok";
    case PlanStatus::kEmptyRoute:             return "empty_route";
    case PlanStatus::kNoStationsInCorridor:   return "no_stations_in_corridor";
    case PlanStatus::kUnreachableDestination: return "unreachable_destination";
    case PlanStatus::kInvalidVehicleProfile:  return "invalid_vehicle_profile";
  }
  return "unknown";
}

PlanningError::PlanningError(PlanFailure failure)
    : std::runtime_error(failure.message), failure_(std::move(failure)) {}

} // namespace fuelroute
