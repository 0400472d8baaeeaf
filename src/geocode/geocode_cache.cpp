#include "geocode/geocode_cache.hpp"

#include <cctype>
#include <stdexcept>

namespace fuelroute {

GeocodeCache::GeocodeCache(IGeocoder* geocoder, std::size_t capacity)
    : geocoder_(geocoder), capacity_(capacity) {
  if (geocoder_ == nullptr) throw std::invalid_argument("GeocodeCache: geocoder is null");
  if (capacity_ == 0) throw std::invalid_argument("GeocodeCache: capacity must be > 0");
}

std::string GeocodeCache::NormalizeKey(const std::string& address) {
  std::string out;
  out.reserve(address.size());
  bool pending_space = false;
  for (unsigned char ch : address) {
    if (std::isspace(ch)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(static_cast<char>(std::tolower(ch)));
  }
  return out;
}

Coordinate GeocodeCache::Resolve(const std::string& address) {
  const std::string key = NormalizeKey(address);
  if (key.empty()) throw std::invalid_argument("GeocodeCache: empty address");

  {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = index_.find(key);
    if (it != index_.end()) {
      lru_.splice(lru_.begin(), lru_, it->second);
      ++stats_.hits;
      return it->second->coordinate;
    }
    ++stats_.misses;
  }

  // 外部调用不持锁
  const std::optional<Coordinate> found = geocoder_->Geocode(address);
  if (!found) throw GeocodeError("could not geocode location: " + address);

  std::lock_guard<std::mutex> lock(mu_);
  const auto it = index_.find(key);
  if (it != index_.end()) {
    // 并发未命中时另一个调用方已写入：保留已有条目
    lru_.splice(lru_.begin(), lru_, it->second);
    return it->second->coordinate;
  }
  InsertLocked(key, *found);
  return *found;
}

void GeocodeCache::InsertLocked(const std::string& key, const Coordinate& c) {
  lru_.push_front(Entry{key, c});
  index_[key] = lru_.begin();

  while (lru_.size() > capacity_) {
    index_.erase(lru_.back().key);
    lru_.pop_back();
    ++stats_.evictions;
  }
}

std::optional<Coordinate> GeocodeCache::Peek(const std::string& address) const {
  const std::string key = NormalizeKey(address);
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = index_.find(key);
  if (it == index_.end()) return std::nullopt;
  return it->second->coordinate;
}

std::size_t GeocodeCache::Size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return lru_.size();
}

GeocodeCache::Stats GeocodeCache::GetStats() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stats_;
}

} // namespace fuelroute
