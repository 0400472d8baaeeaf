#pragma once
#include <vector>

#include "stages/stage_base.hpp"

namespace fuelroute {

// ======================
// 加油点选择（贪心续航窗口模拟，单次前向扫描）
//
// 状态：position = 0，出发时满箱（起点本身不产生加油点）
//
// 循环：只要 position + range < total（剩余油量到不了终点）
//   1) 续航窗口 = 里程在 (position, position + range] 内的站点
//   2) 窗口为空 -> kUnreachableDestination，报告 [position, position + range] 这段缺口
//   3) 窗口内选油价最低的；同价取更靠后的（留更多余地），再按 id 定序
//   4) 在该站加满：加油量 = 自上次加满以来行驶的里程 / mpg，花费 = 加油量 * 油价
//   5) position 前进到该站，重新满箱
// 终点可达即结束，不会为了“到达前补满”再加一站。
//
// 这是贪心策略，不保证全局最优（最优解可能需要越过当前窗口往后看）；
// 油价在一次运行内是静态的，这个策略简单且可解释。
// 若以后需要严格最优，可在同一 Plan() 接口后换成“站点可达图 + 最短路”。
//
// 数值：规划全程用英里和浮点，不做中间取整（只在输出时保留 2 位小数）。
// ======================
class FuelStopPlanner {
public:
  /// projected 应按 distance_from_start_miles 升序（RouteProjector 的输出即如此）；
  /// 不满足时内部先排序一份副本。
  /// 失败：kInvalidVehicleProfile / kUnreachableDestination（抛 PlanningError）
  static PlanResult Plan(const std::vector<ProjectedStation>& projected,
                         double total_route_distance_miles,
                         const VehicleProfile& vehicle);
};

// ======================
// 环节：加油点规划
//
// 输入：
//   ctx.projected / ctx.route.total_distance_miles / ctx.vehicle
//
// 输出：
//   ctx.plan
// ======================
class FuelStopPlanStage final : public IStage {
public:
  void Run(PlanningContext& ctx) override;
};

} // namespace fuelroute
