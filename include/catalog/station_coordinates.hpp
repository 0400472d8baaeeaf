#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "common/types.hpp"

namespace fuelroute {

// ======================
// 目录加载时的站点坐标预计算
//
// 目录文件里大部分站点没有经纬度，也不允许按请求逐个 geocode。
// 做法：州中心点 + 由 "<city>-<state>-<id>" 哈希出来的固定偏移，
// 纬度偏移 [-2, +2) 度，经度偏移 [-3, +3) 度。
// 同一条记录无论加载多少次，坐标都完全一样。
// ======================

/// 31 乘子、32 位截断的字符串哈希。
/// 按 Unicode 码点累加（UTF-8 先解码），非法字节按原值参与
std::uint32_t StableStringHash(const std::string& s);

/// 两字母州代码 -> 州中心点；未知州返回 std::nullopt
std::optional<Coordinate> StateCentroid(const std::string& state_code);

/// 本土中心点，未知州时使用
Coordinate ContiguousUsCentroid();

Coordinate AssignDeterministicCoordinate(const std::string& city,
                                         const std::string& state,
                                         const std::string& station_id);

} // namespace fuelroute
