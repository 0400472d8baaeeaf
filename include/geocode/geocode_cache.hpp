#pragma once
#include <cstddef>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "common/types.hpp"
#include "geocode/geocoder.hpp"

namespace fuelroute {

// ======================
// 地址 -> 坐标 的有界 LRU 缓存，挡在外部 geocoder 前面
//
// - key：规范化地址（ASCII 小写、连续空白压成一个空格、去首尾空白）
// - 容量在构造时固定；超出时淘汰最久未使用的条目；命中会把条目提到最新
// - 未命中恰好触发一次外部调用；外部调用期间不持锁
// - 已知限制：同一 key 的并发未命中不去重，两个调用方会各自调一次外部服务，
//   先写入的条目保留（条目创建后不再修改）。需要去重的话由调用方负责
// - geocoder 查不到时抛 GeocodeError，失败结果不缓存
// ======================
class GeocodeCache {
public:
  struct Stats {
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    std::uint64_t evictions{0};
  };

  // geocoder 不拥有，需比缓存活得久；capacity 必须 > 0
  GeocodeCache(IGeocoder* geocoder, std::size_t capacity);

  GeocodeCache(const GeocodeCache&) = delete;
  GeocodeCache& operator=(const GeocodeCache&) = delete;

  Coordinate Resolve(const std::string& address);

  // 只查缓存，不调外部服务，也不改变 LRU 顺序
  std::optional<Coordinate> Peek(const std::string& address) const;

  std::size_t Size() const;
  std::size_t Capacity() const { return capacity_; }
  Stats GetStats() const;

  static std::string NormalizeKey(const std::string& address);

private:
  struct Entry {
    std::string key;
    Coordinate coordinate;
  };
  using EntryList = std::list<Entry>; // front = 最近使用

  void InsertLocked(const std::string& key, const Coordinate& c);

  IGeocoder* geocoder_;
  const std::size_t capacity_;

  mutable std::mutex mu_;
  EntryList lru_;
  std::unordered_map<std::string, EntryList::iterator> index_;
  Stats stats_;
};

} // namespace fuelroute
