#pragma once
#include "stages/stage_base.hpp"

namespace fuelroute {

// ======================
// 环节：输入校验
// 流程位置：读取输入 -> 输入校验 -> 走廊筛选
//
// 输入：
//   ctx.route（折线点数、总里程）
//   ctx.vehicle（range_miles / mpg）
//
// 输出：无（只做快速失败）
//   - 折线少于 2 个点，或总里程非有限值/为负 -> kEmptyRoute
//   - 折线有长度但总里程 <= 0                 -> kEmptyRoute
//   - range / mpg 非正或非有限值                -> kInvalidVehicleProfile
// ======================
class RouteValidateStage final : public IStage {
public:
  void Run(PlanningContext& ctx) override;

  // 供 FuelStopPlanner 复用
  static void ValidateVehicle(const VehicleProfile& vehicle);
};

} // namespace fuelroute
