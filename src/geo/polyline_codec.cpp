#include "geo/polyline_codec.hpp"

#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace fuelroute::geo {

namespace {

double PrecisionFactor(int precision) {
  if (precision < 0 || precision > 10) {
    throw std::invalid_argument("polyline precision out of range: " + std::to_string(precision));
  }
  return std::pow(10.0, precision);
}

// 读一个 zigzag 编码的有符号增量；pos 前移
std::int64_t ReadValue(const std::string& s, std::size_t& pos) {
  std::uint64_t result = 0;
  int shift = 0;
  while (true) {
    if (pos >= s.size()) {
      throw std::invalid_argument("truncated polyline at offset " + std::to_string(pos));
    }
    const int c = static_cast<unsigned char>(s[pos]) - 63;
    if (c < 0 || c > 63) {
      throw std::invalid_argument("invalid polyline character at offset " + std::to_string(pos));
    }
    ++pos;
    result |= static_cast<std::uint64_t>(c & 0x1F) << shift;
    shift += 5;
    if (c < 0x20) break;
    if (shift > 60) throw std::invalid_argument("polyline value overflow");
  }
  const std::int64_t v = static_cast<std::int64_t>(result >> 1);
  return (result & 1) ? ~v : v;
}

void WriteValue(std::int64_t v, std::string& out) {
  std::uint64_t u = static_cast<std::uint64_t>(v) << 1;
  if (v < 0) u = ~u;
  while (u >= 0x20) {
    out.push_back(static_cast<char>((0x20 | (u & 0x1F)) + 63));
    u >>= 5;
  }
  out.push_back(static_cast<char>(u + 63));
}

} // namespace

std::vector<Coordinate> DecodePolyline(const std::string& encoded, int precision) {
  const double factor = PrecisionFactor(precision);

  std::vector<Coordinate> out;
  std::size_t pos = 0;
  std::int64_t lat = 0;
  std::int64_t lon = 0;
  while (pos < encoded.size()) {
    lat += ReadValue(encoded, pos);
    lon += ReadValue(encoded, pos);
    out.push_back(Coordinate{static_cast<double>(lat) / factor, static_cast<double>(lon) / factor});
  }
  return out;
}

std::string EncodePolyline(const std::vector<Coordinate>& points, int precision) {
  const double factor = PrecisionFactor(precision);

  std::string out;
  std::int64_t prev_lat = 0;
  std::int64_t prev_lon = 0;
  for (const auto& p : points) {
    const std::int64_t lat = std::llround(p.lat_deg * factor);
    const std::int64_t lon = std::llround(p.lon_deg * factor);
    WriteValue(lat - prev_lat, out);
    WriteValue(lon - prev_lon, out);
    prev_lat = lat;
    prev_lon = lon;
  }
  return out;
}

} // namespace fuelroute::geo
