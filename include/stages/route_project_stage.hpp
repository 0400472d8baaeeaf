#pragma once
#include <vector>

#include "stages/stage_base.hpp"

namespace fuelroute {

// ======================
// 路线投影：估计每个候选站点的“里程桩”（沿路线距起点的英里数）
//
// 做法：
//   - 找折线上离站点最近的点（segment 上插值，折线采样稀疏时比只吸附顶点准得多）
//   - 从起点沿折线累计到该点的大地线长度
//   - 按 total_distance_miles / 折线长度 缩放到路径服务的道路里程
//   - clamp 到 [0, total_distance_miles]；折线长度为 0 时全部记为 0
//
// 输出按里程升序；同里程按油价升序，再按站点 id 升序。
// 这是近似（不是路网最短路投影），误差受走廊半径约束。
// ======================
class RouteProjector {
public:
  static std::vector<ProjectedStation> Project(const std::vector<CorridorCandidate>& candidates,
                                               const RoutePolyline& route);
};

// ======================
// 环节：路线投影
//
// 输入：
//   ctx.candidates / ctx.route
//
// 输出：
//   ctx.projected（已排序，供 FuelStopPlanStage 直接使用）
// ======================
class RouteProjectStage final : public IStage {
public:
  void Run(PlanningContext& ctx) override;
};

} // namespace fuelroute
