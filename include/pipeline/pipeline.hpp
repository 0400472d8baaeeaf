#pragma once
#include <memory>
#include <vector>
#include "common/types.hpp"
#include "stages/stage_base.hpp"

namespace fuelroute {

// Pipeline 负责把各 Stage 按顺序串起来：
//   输入校验 -> 走廊筛选 -> 路线投影 -> 加油点规划
// 整个过程同步执行、纯内存计算，不做任何阻塞调用。
// 同一输入（目录快照、折线、车辆参数）多次运行结果完全一致。
class Pipeline {
public:
  Pipeline();

  // 成功返回 kOk，ctx.plan 为最终结果；
  // 失败返回对应 PlanStatus，ctx.failure 记录原因，ctx.plan 清空（不返回部分结果）。
  // 只收口 PlanningError，其它异常照常抛出。
  PlanStatus Run(PlanningContext& ctx);

private:
  std::vector<std::unique_ptr<IStage>> stages_;
};

} // namespace fuelroute
