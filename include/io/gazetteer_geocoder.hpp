#pragma once
#include <atomic>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>

#include "geocode/geocoder.hpp"

namespace fuelroute::io {

// 离线地名表 geocoder：input_dir/gazetteer.json
//   { "Chicago, IL, USA": [41.8781, -87.6298], ... }
// key 按 GeocodeCache::NormalizeKey 规范化后匹配。
// 在线 geocoding 服务不在本工程范围内，demo 与测试用它代替。
class GazetteerGeocoder final : public IGeocoder {
public:
  GazetteerGeocoder() = default;

  static GazetteerGeocoder Load(const std::string& path);
  static GazetteerGeocoder Parse(const std::string& text, const std::string& hint);

  void Add(const std::string& address, const Coordinate& c);

  std::optional<Coordinate> Geocode(const std::string& address) override;

  std::size_t Size() const { return entries_.size(); }
  // 被调用的次数（命中与否都算）
  std::size_t CallCount() const { return calls_.load(); }

  GazetteerGeocoder(GazetteerGeocoder&& other) noexcept
      : entries_(std::move(other.entries_)), calls_(other.calls_.load()) {}

private:
  std::unordered_map<std::string, Coordinate> entries_;
  std::atomic<std::size_t> calls_{0};
};

} // namespace fuelroute::io
