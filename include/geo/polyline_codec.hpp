#pragma once
#include <string>
#include <vector>

#include "common/types.hpp"

namespace fuelroute::geo {

// Google encoded polyline（默认精度 1e-5）。
// 路径服务的 geometry 可能直接给编码串；输出里也带一份供地图显示。

/// 解码；串被截断或含非法字符时抛 std::invalid_argument
std::vector<Coordinate> DecodePolyline(const std::string& encoded, int precision = 5);

std::string EncodePolyline(const std::vector<Coordinate>& points, int precision = 5);

} // namespace fuelroute::geo
