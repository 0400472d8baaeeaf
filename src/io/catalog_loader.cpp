#include "io/catalog_loader.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <map>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include "catalog/station_coordinates.hpp"

namespace fuelroute::io {

namespace {

const char* const kColId      = "OPIS Truckstop ID";
const char* const kColName    = "Truckstop Name";
const char* const kColAddress = "Address";
const char* const kColCity    = "City";
const char* const kColState   = "State";
const char* const kColPrice   = "Retail Price";
const char* const kColLat     = "Latitude";
const char* const kColLon     = "Longitude";

std::string Trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

std::vector<std::string> SplitCsvLine(const std::string& line) {
  std::vector<std::string> fields;
  std::string cur;
  bool in_quotes = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (in_quotes) {
      if (ch == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          cur.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        cur.push_back(ch);
      }
    } else if (ch == '"') {
      in_quotes = true;
    } else if (ch == ',') {
      fields.push_back(std::move(cur));
      cur.clear();
    } else {
      cur.push_back(ch);
    }
  }
  fields.push_back(std::move(cur));
  return fields;
}

// 引号个数为奇数：有带引号的字段跨行（"" 转义成对出现，不影响奇偶）
bool HasOpenQuote(const std::string& line) {
  return std::count(line.begin(), line.end(), '"') % 2 != 0;
}

// 整个字段都必须是数字
std::optional<double> ParseDouble(const std::string& text) {
  const std::string t = Trim(text);
  if (t.empty()) return std::nullopt;
  try {
    std::size_t used = 0;
    const double v = std::stod(t, &used);
    if (used != t.size() || !std::isfinite(v)) return std::nullopt;
    return v;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

} // namespace

StationCatalog CatalogLoader::LoadCsv(const std::string& path, CatalogLoadReport* report) {
  std::ifstream ifs(path);
  if (!ifs) throw std::runtime_error("Failed to open station catalog: " + path);
  return ParseCsv(ifs, path, report);
}

StationCatalog CatalogLoader::ParseCsv(std::istream& in, const std::string& hint, CatalogLoadReport* report) {
  CatalogLoadReport rep;

  std::string line;
  if (!std::getline(in, line)) {
    throw std::runtime_error("Station catalog is empty: " + hint);
  }
  // UTF-8 BOM
  if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);

  std::map<std::string, std::size_t> col;
  const auto header = SplitCsvLine(line);
  for (std::size_t i = 0; i < header.size(); ++i) col[Trim(header[i])] = i;

  for (const char* required : {kColId, kColName, kColAddress, kColCity, kColState, kColPrice}) {
    if (!col.count(required)) {
      throw std::runtime_error("Station catalog " + hint + " is missing column: " + required);
    }
  }
  const std::size_t i_id = col[kColId];
  const std::size_t i_name = col[kColName];
  const std::size_t i_addr = col[kColAddress];
  const std::size_t i_city = col[kColCity];
  const std::size_t i_state = col[kColState];
  const std::size_t i_price = col[kColPrice];
  const bool has_latlon = col.count(kColLat) && col.count(kColLon);
  const std::size_t i_lat = has_latlon ? col[kColLat] : 0;
  const std::size_t i_lon = has_latlon ? col[kColLon] : 0;

  // 只要求必需列齐全；经纬度列缺失按无坐标处理
  const std::size_t needed = 1 + std::max({i_id, i_name, i_addr, i_city, i_state, i_price});

  std::vector<StationRecord> records;
  while (std::getline(in, line)) {
    if (Trim(line).empty()) continue;
    std::string next;
    while (HasOpenQuote(line) && std::getline(in, next)) line += "\n" + next;
    ++rep.rows_read;

    const auto f = SplitCsvLine(line);
    if (f.size() < needed) {
      ++rep.rows_skipped;
      continue;
    }

    const std::optional<double> price = ParseDouble(f[i_price]);
    const std::string id = Trim(f[i_id]);
    if (!price || *price <= 0.0 || id.empty()) {
      ++rep.rows_skipped;
      continue;
    }

    StationRecord r;
    r.id = id;
    r.name = Trim(f[i_name]);
    r.address = Trim(f[i_addr]);
    r.city = Trim(f[i_city]);
    r.state = Trim(f[i_state]);
    r.price_per_gallon = *price;

    std::optional<double> lat, lon;
    if (has_latlon && i_lat < f.size() && i_lon < f.size()) {
      lat = ParseDouble(f[i_lat]);
      lon = ParseDouble(f[i_lon]);
    }
    if (lat && lon && std::fabs(*lat) <= 90.0 && std::fabs(*lon) <= 180.0) {
      r.coordinate = Coordinate{*lat, *lon};
      ++rep.explicit_coordinates;
    } else {
      r.coordinate = AssignDeterministicCoordinate(r.city, r.state, r.id);
    }

    records.push_back(std::move(r));
  }

  StationCatalog catalog(std::move(records));
  rep.duplicates_dropped = catalog.DroppedDuplicates();
  if (report != nullptr) *report = rep;
  return catalog;
}

} // namespace fuelroute::io
