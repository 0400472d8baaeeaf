#pragma once
#include <cstddef>
#include <istream>
#include <string>

#include "catalog/station_catalog.hpp"

namespace fuelroute::io {

// 加油站目录 CSV（OPIS 导出格式）：
//   OPIS Truckstop ID, Truckstop Name, Address, City, State, Rack ID, Retail Price
// 可选列 Latitude / Longitude：有且能解析时直接使用，否则按 AssignDeterministicCoordinate 计算。
//
// - 支持双引号字段（"" 转义）；不支持字段内换行
// - 缺列 / 价格无法解析 / 价格 <= 0 的行跳过并计数，不中断加载
// - 缺少必需的表头列时抛 std::runtime_error
struct CatalogLoadReport {
  std::size_t rows_read{0};
  std::size_t rows_skipped{0};
  std::size_t duplicates_dropped{0};
  std::size_t explicit_coordinates{0};
};

class CatalogLoader {
public:
  static StationCatalog LoadCsv(const std::string& path, CatalogLoadReport* report = nullptr);
  static StationCatalog ParseCsv(std::istream& in, const std::string& hint,
                                 CatalogLoadReport* report = nullptr);
};

} // namespace fuelroute::io
