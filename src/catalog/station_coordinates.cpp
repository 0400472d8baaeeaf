#include "catalog/station_coordinates.hpp"

#include <cctype>
#include <map>

namespace fuelroute {

namespace {

const std::map<std::string, Coordinate>& StateTable() {
  static const std::map<std::string, Coordinate> kTable = {
      {"AL", {32.3182, -86.9023}},  {"AK", {63.5888, -154.4931}}, {"AZ", {34.0489, -111.0937}},
      {"AR", {35.2010, -91.8318}},  {"CA", {36.7783, -119.4179}}, {"CO", {39.5501, -105.7821}},
      {"CT", {41.6032, -73.0877}},  {"DE", {38.9108, -75.5277}},  {"FL", {27.9944, -81.7603}},
      {"GA", {32.1656, -82.9001}},  {"HI", {19.8968, -155.5828}}, {"ID", {44.0682, -114.7420}},
      {"IL", {40.6331, -89.3985}},  {"IN", {40.2672, -86.1349}},  {"IA", {41.8780, -93.0977}},
      {"KS", {39.0119, -98.4842}},  {"KY", {37.8393, -84.2700}},  {"LA", {30.9843, -91.9623}},
      {"ME", {45.2538, -69.4455}},  {"MD", {39.0458, -76.6413}},  {"MA", {42.4072, -71.3824}},
      {"MI", {44.3148, -85.6024}},  {"MN", {46.7296, -94.6859}},  {"MS", {32.3547, -89.3985}},
      {"MO", {37.9643, -91.8318}},  {"MT", {46.8797, -110.3626}}, {"NE", {41.4925, -99.9018}},
      {"NV", {38.8026, -116.4194}}, {"NH", {43.1939, -71.5724}},  {"NJ", {40.0583, -74.4057}},
      {"NM", {34.5199, -105.8701}}, {"NY", {42.1657, -74.9481}},  {"NC", {35.7596, -79.0193}},
      {"ND", {47.5515, -101.0020}}, {"OH", {40.4173, -82.9071}},  {"OK", {35.4676, -97.5164}},
      {"OR", {43.8041, -120.5542}}, {"PA", {41.2033, -77.1945}},  {"RI", {41.5801, -71.4774}},
      {"SC", {33.8361, -81.1637}},  {"SD", {43.9695, -99.9018}},  {"TN", {35.5175, -86.5804}},
      {"TX", {31.9686, -99.9018}},  {"UT", {39.3210, -111.0937}}, {"VT", {44.5588, -72.5778}},
      {"VA", {37.4316, -78.6569}},  {"WA", {47.7511, -120.7401}}, {"WV", {38.5976, -80.4549}},
      {"WI", {43.7844, -88.7879}},  {"WY", {43.0760, -107.2903}}, {"DC", {38.9072, -77.0369}},
  };
  return kTable;
}

// 从 s[i] 开始解一个 UTF-8 码点，i 前进到下一个字符。
// 非法序列（截断、缺续字节、超长编码）按单个字节取值
std::uint32_t NextCodePoint(const std::string& s, std::size_t& i) {
  const auto lead = static_cast<unsigned char>(s[i]);
  std::size_t len = 1;
  std::uint32_t cp = lead;
  std::uint32_t min_cp = 0;
  if (lead >= 0xF0 && lead <= 0xF4) {
    len = 4; cp = lead & 0x07u; min_cp = 0x10000;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    len = 3; cp = lead & 0x0Fu; min_cp = 0x800;
  } else if (lead >= 0xC2 && lead <= 0xDF) {
    len = 2; cp = lead & 0x1Fu; min_cp = 0x80;
  }
  if (len == 1 || i + len > s.size()) {
    ++i;
    return lead;
  }
  for (std::size_t k = 1; k < len; ++k) {
    const auto c = static_cast<unsigned char>(s[i + k]);
    if ((c & 0xC0u) != 0x80u) {
      ++i;
      return lead;
    }
    cp = (cp << 6) | (c & 0x3Fu);
  }
  if (cp < min_cp || cp > 0x10FFFF) {
    ++i;
    return lead;
  }
  i += len;
  return cp;
}

} // namespace

std::uint32_t StableStringHash(const std::string& s) {
  std::uint32_t h = 0;
  for (std::size_t i = 0; i < s.size();) {
    h = h * 31u + NextCodePoint(s, i); // 无符号溢出即 & 0xFFFFFFFF
  }
  return h;
}

std::optional<Coordinate> StateCentroid(const std::string& state_code) {
  std::string key;
  key.reserve(state_code.size());
  for (unsigned char ch : state_code) key.push_back(static_cast<char>(std::toupper(ch)));

  const auto& table = StateTable();
  const auto it = table.find(key);
  if (it == table.end()) return std::nullopt;
  return it->second;
}

Coordinate ContiguousUsCentroid() { return Coordinate{39.8283, -98.5795}; }

Coordinate AssignDeterministicCoordinate(const std::string& city,
                                         const std::string& state,
                                         const std::string& station_id) {
  const Coordinate base = StateCentroid(state).value_or(ContiguousUsCentroid());
  const std::uint32_t h = StableStringHash(city + "-" + state + "-" + station_id);

  const double lat_offset = (static_cast<double>(h % 400u) - 200.0) / 100.0;
  const double lon_offset = (static_cast<double>((h >> 8) % 600u) - 300.0) / 100.0;
  return Coordinate{base.lat_deg + lat_offset, base.lon_deg + lon_offset};
}

} // namespace fuelroute
