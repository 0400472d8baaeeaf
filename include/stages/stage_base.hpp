#pragma once
#include "common/types.hpp"

namespace fuelroute {

// 每个“环节”都实现一个 Stage，输入输出都通过 PlanningContext 传递。
// Stage 失败时抛 PlanningError（带 PlanStatus），由 Pipeline 统一收口成类型化结果。
// Run 必须可重复调用：本次 Run 覆盖旧输出，不留残留。
class IStage {
public:
  virtual ~IStage() = default;
  virtual void Run(PlanningContext& ctx) = 0;
};

} // namespace fuelroute
