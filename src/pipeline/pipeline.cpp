#include "pipeline/pipeline.hpp"

// 具体 Stage
#include "stages/route_validate_stage.hpp"
#include "stages/corridor_filter_stage.hpp"
#include "stages/route_project_stage.hpp"
#include "stages/fuel_stop_plan_stage.hpp"

namespace fuelroute {

Pipeline::Pipeline() {
  stages_.emplace_back(std::make_unique<RouteValidateStage>());
  stages_.emplace_back(std::make_unique<CorridorFilterStage>());
  stages_.emplace_back(std::make_unique<RouteProjectStage>());
  stages_.emplace_back(std::make_unique<FuelStopPlanStage>());
}

PlanStatus Pipeline::Run(PlanningContext& ctx) {
  ctx.failure.reset();
  ctx.candidates.clear();
  ctx.projected.clear();
  ctx.plan = PlanResult{};

  try {
    for (auto& stage : stages_) {
      stage->Run(ctx);
    }
  } catch (const PlanningError& e) {
    ctx.plan = PlanResult{};
    ctx.failure = e.failure();
    return e.status();
  }
  return PlanStatus::kOk;
}

} // namespace fuelroute
