#pragma once
#include <optional>
#include <string>

#include "common/types.hpp"

namespace fuelroute {

// 外部 geocoding 服务的接口边界（地址 -> 坐标）。
// 实现可以是在线服务、离线地名表或测试替身；只通过 GeocodeCache 使用。
class IGeocoder {
public:
  virtual ~IGeocoder() = default;

  // 查不到返回 std::nullopt；网络等传输错误由实现自己抛异常
  virtual std::optional<Coordinate> Geocode(const std::string& address) = 0;
};

} // namespace fuelroute
