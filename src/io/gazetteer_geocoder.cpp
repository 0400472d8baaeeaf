#include "io/gazetteer_geocoder.hpp"

#include <stdexcept>

#include "geocode/geocode_cache.hpp"
#include "io/json_util.hpp"

namespace fuelroute::io {

GazetteerGeocoder GazetteerGeocoder::Load(const std::string& path) {
  return Parse(ReadAllText(path), path);
}

GazetteerGeocoder GazetteerGeocoder::Parse(const std::string& text, const std::string& hint) {
  const nlohmann::json root = ParseJson(text, hint);
  if (!root.is_object()) throw std::runtime_error(hint + ": gazetteer root must be an object");

  GazetteerGeocoder g;
  for (auto it = root.begin(); it != root.end(); ++it) {
    const auto& v = it.value();
    if (!v.is_array() || v.size() < 2 || !v.at(0).is_number() || !v.at(1).is_number()) {
      throw std::runtime_error(hint + ": entry \"" + it.key() + "\" must be [lat, lon]");
    }
    g.Add(it.key(), Coordinate{v.at(0).get<double>(), v.at(1).get<double>()});
  }
  return g;
}

void GazetteerGeocoder::Add(const std::string& address, const Coordinate& c) {
  entries_[GeocodeCache::NormalizeKey(address)] = c;
}

std::optional<Coordinate> GazetteerGeocoder::Geocode(const std::string& address) {
  ++calls_;
  const auto it = entries_.find(GeocodeCache::NormalizeKey(address));
  if (it == entries_.end()) return std::nullopt;
  return it->second;
}

} // namespace fuelroute::io
