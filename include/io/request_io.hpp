#pragma once
#include <string>
#include "common/types.hpp"

namespace fuelroute::io {

// 一次路线请求：起终点文本 + 路径服务已经算好的路线
//
// input_dir/request.json：
//   {
//     "start": "Chicago, IL",
//     "end":   "Denver, CO",
//     "route": {                        // 路径服务原样返回的一条 route
//       "geometry": "<encoded polyline>"        // 或 { "coordinates": [[lon, lat], ...] }
//       "summary":  { "distance": 1610000.0,    // 米
//                     "duration": 54000.0 }     // 秒
//     }
//   }
//
// 路径服务的坐标顺序是 [lon, lat]，这里统一转成 Coordinate{lat, lon}，
// 距离换算成英里，时长换算成小时。
struct RouteRequest {
  std::string start;
  std::string end;
  RoutePolyline route;
};

class RequestIO {
public:
  // 缺 start/end、JSON 结构不对时抛 std::runtime_error。
  // 折线点数不足不在这里报错（由 Pipeline 报 kEmptyRoute）。
  static RouteRequest Load(const std::string& path);
  static RouteRequest Parse(const std::string& text, const std::string& hint);
};

} // namespace fuelroute::io
