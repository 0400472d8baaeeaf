#pragma once
#include <string>
#include "common/types.hpp"

namespace fuelroute::io {

// OutputWriter 负责把 ctx 中的“最终产物”写到 output_dir：
// 1) plan.json：route 概要 / fuel_stops / 合计 / vehicle_specs
// 2) fuel_stops.csv：每个加油点一行
// 3) error.json：规划失败时代替 plan.json
//
// 所有数值只在这里保留 2 位小数，规划过程中不取整。
class OutputWriter {
public:
  static void WriteAll(const PlanningContext& ctx, const OutputParams& params, const std::string& output_dir);

  // 分开暴露接口，方便只写某一种输出进行调试
  static std::string BuildPlanJson(const PlanningContext& ctx, const OutputParams& params);
  static std::string BuildFailureJson(const PlanFailure& failure);

  static void WriteFailure(const PlanFailure& failure, const std::string& output_dir);
  static void WriteStopsCsv(const PlanResult& plan, const std::string& output_path);
};

} // namespace fuelroute::io
