#pragma once
#include <stdexcept>
#include <string>

namespace fuelroute {

// 规划核心对外暴露的失败种类。
// 全部是“调用方可恢复”的局部错误：核心不重试，只返回带类型的失败结果，
// 由边界层（CLI / 输出）翻译成用户可见的响应。
enum class PlanStatus {
  kOk,
  kEmptyRoute,              // 折线少于 2 个点
  kNoStationsInCorridor,    // 走廊内没有任何站点（目录覆盖问题）
  kUnreachableDestination,  // 当前续航窗口内没有站点（续航问题）
  kInvalidVehicleProfile    // range / mpg 非正
};

const char* ToString(PlanStatus status);

struct PlanFailure {
  PlanStatus status{PlanStatus::kOk};
  std::string message;
  // 仅 kUnreachableDestination 有意义：“mile X 到 mile Y 之间无可达站点”
  double gap_start_miles{0.0};
  double gap_end_miles{0.0};
};

class PlanningError : public std::runtime_error {
public:
  explicit PlanningError(PlanFailure failure);

  const PlanFailure& failure() const { return failure_; }
  PlanStatus status() const { return failure_.status; }

private:
  PlanFailure failure_;
};

// 外部 geocoder 无结果时抛出；失败结果不会写入缓存
class GeocodeError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace fuelroute
