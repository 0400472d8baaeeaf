#pragma once
#include <cstddef>
#include <limits>
#include <vector>

#include "common/types.hpp"

namespace fuelroute::geo {

// ============================================================
// 大地测量工具（WGS84）
//
// 约定：
//   - 距离单位 km，规划阶段再换算英里（kKmPerMile）
//   - 经度不处理跨 180° 的情况（目录与路线都在北美本土）
// ============================================================

constexpr double kKmPerMile = 1.609344;
// 粗筛用：1 度纬度约 111 km
constexpr double kKmPerDegree = 111.0;

/// WGS84 椭球上的大地线距离（Vincenty 反算）。
/// 近对跖点不收敛时退化为球面大圆距离。
double GeodesicDistanceKm(const Coordinate& a, const Coordinate& b);

/// 平均半径球面上的大圆距离（haversine）
double GreatCircleDistanceKm(const Coordinate& a, const Coordinate& b);

/// 经纬度线性插值，t∈[0,1]
Coordinate Interpolate(const Coordinate& a, const Coordinate& b, double t);

struct BoundingBox {
  double min_lat_deg{0.0};
  double max_lat_deg{0.0};
  double min_lon_deg{0.0};
  double max_lon_deg{0.0};

  bool Contains(const Coordinate& c) const {
    return c.lat_deg >= min_lat_deg && c.lat_deg <= max_lat_deg &&
           c.lon_deg >= min_lon_deg && c.lon_deg <= max_lon_deg;
  }
};

/// 折线所有点的轴对齐包围盒，再按 padding_km 外扩。
/// 度数按最短的 1 度纬度弧长（110.574 km）换算：距折线 <= padding_km 的点一定在盒内。
/// 经度方向按纬度缩放（取包围盒内绝对值最大的纬度，外扩只会更宽）。
/// points 为空时返回一个不包含任何点的盒子。
BoundingBox ComputeBoundingBox(const std::vector<Coordinate>& points, double padding_km);

/// 点到折线的最近位置
struct PolylineLocation {
  std::size_t segment_index{0};  // 最近的 segment [i, i+1]
  double fraction{0.0};          // segment 内插值参数 t∈[0,1]
  double distance_km{std::numeric_limits<double>::infinity()};

  bool found() const { return distance_km != std::numeric_limits<double>::infinity(); }
};

/// 在折线上找离 p 最近的点（segment 上插值，不只吸附到顶点）。
/// - segment 内的投影参数用局部等距平面近似求得，距离本身用大地线距离
/// - search_radius_km 有限时，包围盒（含余量）不覆盖 p 的 segment 直接跳过；
///   跳过的 segment 距离一定大于 search_radius_km
/// - 距离相同取靠前的 segment，保证结果确定
/// - 少于 2 个点时返回 found()==false
PolylineLocation LocateOnPolyline(const std::vector<Coordinate>& points,
                                  const Coordinate& p,
                                  double search_radius_km = std::numeric_limits<double>::infinity());

/// 累计大地线距离：result[i] = 起点到 points[i] 的折线长度（km），result[0]=0
std::vector<double> CumulativeDistancesKm(const std::vector<Coordinate>& points);

} // namespace fuelroute::geo
