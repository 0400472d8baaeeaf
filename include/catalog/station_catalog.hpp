#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/types.hpp"

namespace fuelroute {

// 站点 id 的确定性排序：纯数字 id 在前且按数值比较（"99" < "100"），
// 其余按字典序。用于投影和选站的平局裁决。
bool StationIdLess(const std::string& a, const std::string& b);

// 加油站目录：进程启动时构造一次，之后只读。
// 记录按加载顺序存放在连续数组里，另建 id -> 下标索引。
// 多个规划请求可以并发读同一个目录（无可变状态）。
class StationCatalog {
public:
  StationCatalog() = default;

  // 重复 id 只保留第一条；被丢弃的条数见 DroppedDuplicates()
  explicit StationCatalog(std::vector<StationRecord> records);

  const std::vector<StationRecord>& Records() const { return records_; }
  std::size_t Size() const { return records_.size(); }
  bool Empty() const { return records_.empty(); }

  // 找不到返回 nullptr
  const StationRecord* FindById(const std::string& id) const;

  std::size_t DroppedDuplicates() const { return dropped_duplicates_; }

private:
  std::vector<StationRecord> records_;
  std::unordered_map<std::string, std::size_t> index_by_id_;
  std::size_t dropped_duplicates_{0};
};

} // namespace fuelroute
