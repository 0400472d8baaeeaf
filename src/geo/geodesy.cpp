#include "geo/geodesy.hpp"

#include <algorithm>
#include <cmath>

namespace fuelroute::geo {

namespace {

constexpr double kPi = 3.14159265358979323846;

// WGS84
constexpr double kSemiMajorM  = 6378137.0;
constexpr double kFlattening  = 1.0 / 298.257223563;
constexpr double kSemiMinorM  = (1.0 - kFlattening) * kSemiMajorM;
constexpr double kMeanRadiusKm = 6371.0088;

constexpr int    kVincentyMaxIter = 200;
constexpr double kVincentyEps     = 1e-12;

// segment 级跳过时的包围盒余量：kKmPerDegree 是近似值，
// 赤道附近 1 度纬度只有 ~110.57 km，留 10% 保证不会误跳
constexpr double kSegmentBoxSlack = 1.10;

// WGS84 子午线上 1 度纬度的最短弧长（赤道处）。
// 粗筛外扩按它换算，盒子只会偏宽，不会漏掉走廊内的站点
constexpr double kMinKmPerDegreeLat = 110.574;

inline double Deg2Rad(double deg) { return deg * kPi / 180.0; }

inline double Clamp(double v, double lo, double hi) {
  if (v < lo) return lo;
  if (v > hi) return hi;
  return v;
}

// 纬度 lat 处 1 度经度对应的“度数缩放”，极区做下限保护
inline double LonScale(double abs_lat_deg) {
  return std::max(std::cos(Deg2Rad(std::min(abs_lat_deg, 89.0))), 0.01);
}

} // namespace

double GreatCircleDistanceKm(const Coordinate& a, const Coordinate& b) {
  const double lat1 = Deg2Rad(a.lat_deg);
  const double lat2 = Deg2Rad(b.lat_deg);
  const double dlat = lat2 - lat1;
  const double dlon = Deg2Rad(b.lon_deg - a.lon_deg);

  const double s1 = std::sin(dlat / 2.0);
  const double s2 = std::sin(dlon / 2.0);
  const double h = s1 * s1 + std::cos(lat1) * std::cos(lat2) * s2 * s2;
  return 2.0 * kMeanRadiusKm * std::asin(std::sqrt(Clamp(h, 0.0, 1.0)));
}

double GeodesicDistanceKm(const Coordinate& a, const Coordinate& b) {
  if (a == b) return 0.0;

  const double L  = Deg2Rad(b.lon_deg - a.lon_deg);
  const double U1 = std::atan((1.0 - kFlattening) * std::tan(Deg2Rad(a.lat_deg)));
  const double U2 = std::atan((1.0 - kFlattening) * std::tan(Deg2Rad(b.lat_deg)));
  const double sinU1 = std::sin(U1), cosU1 = std::cos(U1);
  const double sinU2 = std::sin(U2), cosU2 = std::cos(U2);

  double lambda = L;
  double sin_sigma = 0.0, cos_sigma = 0.0, sigma = 0.0;
  double cos_sq_alpha = 0.0, cos2_sigma_m = 0.0;
  bool converged = false;

  for (int iter = 0; iter < kVincentyMaxIter; ++iter) {
    const double sin_lambda = std::sin(lambda);
    const double cos_lambda = std::cos(lambda);
    const double t1 = cosU2 * sin_lambda;
    const double t2 = cosU1 * sinU2 - sinU1 * cosU2 * cos_lambda;
    sin_sigma = std::sqrt(t1 * t1 + t2 * t2);
    if (sin_sigma == 0.0) return 0.0; // 重合点

    cos_sigma = sinU1 * sinU2 + cosU1 * cosU2 * cos_lambda;
    sigma = std::atan2(sin_sigma, cos_sigma);
    const double sin_alpha = cosU1 * cosU2 * sin_lambda / sin_sigma;
    cos_sq_alpha = 1.0 - sin_alpha * sin_alpha;
    // 赤道上的线：cos_sq_alpha = 0
    cos2_sigma_m = (cos_sq_alpha != 0.0) ? cos_sigma - 2.0 * sinU1 * sinU2 / cos_sq_alpha : 0.0;

    const double C = kFlattening / 16.0 * cos_sq_alpha * (4.0 + kFlattening * (4.0 - 3.0 * cos_sq_alpha));
    const double prev = lambda;
    lambda = L + (1.0 - C) * kFlattening * sin_alpha *
                     (sigma + C * sin_sigma *
                                  (cos2_sigma_m + C * cos_sigma * (-1.0 + 2.0 * cos2_sigma_m * cos2_sigma_m)));
    if (std::fabs(lambda - prev) < kVincentyEps) {
      converged = true;
      break;
    }
  }

  if (!converged) return GreatCircleDistanceKm(a, b);

  const double u_sq = cos_sq_alpha * (kSemiMajorM * kSemiMajorM - kSemiMinorM * kSemiMinorM) /
                      (kSemiMinorM * kSemiMinorM);
  const double A = 1.0 + u_sq / 16384.0 * (4096.0 + u_sq * (-768.0 + u_sq * (320.0 - 175.0 * u_sq)));
  const double B = u_sq / 1024.0 * (256.0 + u_sq * (-128.0 + u_sq * (74.0 - 47.0 * u_sq)));
  const double delta_sigma =
      B * sin_sigma *
      (cos2_sigma_m + B / 4.0 *
                          (cos_sigma * (-1.0 + 2.0 * cos2_sigma_m * cos2_sigma_m) -
                           B / 6.0 * cos2_sigma_m * (-3.0 + 4.0 * sin_sigma * sin_sigma) *
                               (-3.0 + 4.0 * cos2_sigma_m * cos2_sigma_m)));

  const double s_m = kSemiMinorM * A * (sigma - delta_sigma);
  return s_m / 1000.0;
}

Coordinate Interpolate(const Coordinate& a, const Coordinate& b, double t) {
  return Coordinate{a.lat_deg + (b.lat_deg - a.lat_deg) * t,
                    a.lon_deg + (b.lon_deg - a.lon_deg) * t};
}

BoundingBox ComputeBoundingBox(const std::vector<Coordinate>& points, double padding_km) {
  BoundingBox box;
  if (points.empty()) {
    // 空盒：min > max，Contains 恒为 false
    box.min_lat_deg = box.min_lon_deg = 1.0;
    box.max_lat_deg = box.max_lon_deg = -1.0;
    return box;
  }

  box.min_lat_deg = box.max_lat_deg = points.front().lat_deg;
  box.min_lon_deg = box.max_lon_deg = points.front().lon_deg;
  for (const auto& p : points) {
    box.min_lat_deg = std::min(box.min_lat_deg, p.lat_deg);
    box.max_lat_deg = std::max(box.max_lat_deg, p.lat_deg);
    box.min_lon_deg = std::min(box.min_lon_deg, p.lon_deg);
    box.max_lon_deg = std::max(box.max_lon_deg, p.lon_deg);
  }

  const double pad = std::max(padding_km, 0.0);
  const double lat_pad = pad / kMinKmPerDegreeLat;
  box.min_lat_deg = std::max(box.min_lat_deg - lat_pad, -90.0);
  box.max_lat_deg = std::min(box.max_lat_deg + lat_pad, 90.0);

  const double abs_lat = std::max(std::fabs(box.min_lat_deg), std::fabs(box.max_lat_deg));
  const double lon_pad = lat_pad / LonScale(abs_lat);
  box.min_lon_deg -= lon_pad;
  box.max_lon_deg += lon_pad;
  return box;
}

PolylineLocation LocateOnPolyline(const std::vector<Coordinate>& points,
                                  const Coordinate& p,
                                  double search_radius_km) {
  PolylineLocation best;
  if (points.size() < 2) return best;

  const bool bounded = std::isfinite(search_radius_km);
  const double lat_pad = bounded ? search_radius_km * kSegmentBoxSlack / kKmPerDegree : 0.0;

  for (std::size_t i = 0; i + 1 < points.size(); ++i) {
    const Coordinate& a = points[i];
    const Coordinate& b = points[i + 1];

    if (bounded) {
      const double lo_lat = std::min(a.lat_deg, b.lat_deg) - lat_pad;
      const double hi_lat = std::max(a.lat_deg, b.lat_deg) + lat_pad;
      if (p.lat_deg < lo_lat || p.lat_deg > hi_lat) continue;
      const double abs_lat = std::max(std::fabs(lo_lat), std::fabs(hi_lat));
      const double lon_pad = lat_pad / LonScale(abs_lat);
      if (p.lon_deg < std::min(a.lon_deg, b.lon_deg) - lon_pad ||
          p.lon_deg > std::max(a.lon_deg, b.lon_deg) + lon_pad) {
        continue;
      }
    }

    // 以 a 为原点的局部等距平面（单位：度，经度乘 cos(中纬度)）
    const double coslat = std::cos(Deg2Rad((a.lat_deg + b.lat_deg) / 2.0));
    const double bx = (b.lon_deg - a.lon_deg) * coslat;
    const double by = b.lat_deg - a.lat_deg;
    const double px = (p.lon_deg - a.lon_deg) * coslat;
    const double py = p.lat_deg - a.lat_deg;
    const double len2 = bx * bx + by * by;

    // 零长度 segment 退化为顶点
    const double t = (len2 > 0.0) ? Clamp((px * bx + py * by) / len2, 0.0, 1.0) : 0.0;
    const double d = GeodesicDistanceKm(p, Interpolate(a, b, t));

    if (d < best.distance_km) {
      best.segment_index = i;
      best.fraction = t;
      best.distance_km = d;
    }
  }
  return best;
}

std::vector<double> CumulativeDistancesKm(const std::vector<Coordinate>& points) {
  std::vector<double> cum(points.size(), 0.0);
  for (std::size_t i = 1; i < points.size(); ++i) {
    cum[i] = cum[i - 1] + GeodesicDistanceKm(points[i - 1], points[i]);
  }
  return cum;
}

} // namespace fuelroute::geo
