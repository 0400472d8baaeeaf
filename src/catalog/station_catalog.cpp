#include "catalog/station_catalog.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace fuelroute {

namespace {

bool IsAllDigits(const std::string& s) {
  return !s.empty() &&
         std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string StripLeadingZeros(const std::string& s) {
  const auto pos = s.find_first_not_of('0');
  return pos == std::string::npos ? std::string("0") : s.substr(pos);
}

} // namespace

bool StationIdLess(const std::string& a, const std::string& b) {
  const bool da = IsAllDigits(a);
  const bool db = IsAllDigits(b);
  if (da != db) return da; // 纯数字 id 排在前面
  if (da) {
    const std::string na = StripLeadingZeros(a);
    const std::string nb = StripLeadingZeros(b);
    if (na.size() != nb.size()) return na.size() < nb.size();
    if (na != nb) return na < nb;
    // 数值相同（前导零不同）：退回原串比较
  }
  return a < b;
}

StationCatalog::StationCatalog(std::vector<StationRecord> records) {
  records_.reserve(records.size());
  index_by_id_.reserve(records.size());

  for (auto& r : records) {
    if (index_by_id_.count(r.id)) {
      ++dropped_duplicates_;
      continue;
    }
    index_by_id_.emplace(r.id, records_.size());
    records_.push_back(std::move(r));
  }
}

const StationRecord* StationCatalog::FindById(const std::string& id) const {
  const auto it = index_by_id_.find(id);
  if (it == index_by_id_.end()) return nullptr;
  return &records_[it->second];
}

} // namespace fuelroute
