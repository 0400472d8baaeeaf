#pragma once
#include <vector>

#include "catalog/station_catalog.hpp"
#include "stages/stage_base.hpp"

namespace fuelroute {

// ======================
// 走廊筛选：把整份目录缩到“路线附近”的站点
//
// 1) 粗筛：折线全部点的包围盒，外扩 bbox_padding_km，盒外的站点直接丢弃。
//    目录有几千条记录，大地线距离又贵，这一步决定了整体耗时。
// 2) 精筛：对盒内站点求到折线（segment 插值）的最小大地线距离，
//    <= max_corridor_km 才保留，并写入 perpendicular_distance_km。
//
// 输出顺序 = 目录原始顺序（稳定筛选，只保留/丢弃，不重排）。
// 折线为空或只有 1 个点时返回空列表，不报错。
// ======================
class CorridorFilter {
public:
  static std::vector<CorridorCandidate> Filter(const StationCatalog& catalog,
                                               const RoutePolyline& route,
                                               double bbox_padding_km,
                                               double max_corridor_km);

  static std::vector<CorridorCandidate> Filter(const std::vector<StationRecord>& stations,
                                               const RoutePolyline& route,
                                               double bbox_padding_km,
                                               double max_corridor_km);
};

// ======================
// 环节：走廊筛选
//
// 输入：
//   ctx.catalog / ctx.route / ctx.corridor
//
// 输出：
//   ctx.candidates
//   候选为空 -> kNoStationsInCorridor（与 kUnreachableDestination 区分：这是目录覆盖问题）
// ======================
class CorridorFilterStage final : public IStage {
public:
  void Run(PlanningContext& ctx) override;
};

} // namespace fuelroute
