#include "histop/Frequency.hpp"

#include <algorithm>
#include <iterator>

namespace histop {

void FrequencyTable::add(std::string const& command) {
  add(command, 1);
}

void FrequencyTable::add(std::string const& command, size_t count) {
  if (count == 0) {
    return;
  }
  counts_[command] += count;
  total_ += count;
}

void FrequencyTable::filter(std::set<std::string, std::less<>> const& ignore, size_t more_than) {
  std::erase_if(counts_, [&](auto const& kv) {
    auto const& [command, count] = kv;
    if (ignore.contains(command) || count <= more_than) {
      total_ -= count;
      return true;
    }
    return false;
  });
}

size_t FrequencyTable::count(std::string_view command) const {
  auto it = counts_.find(std::string{command});
  return it == counts_.end() ? 0 : it->second;
}

size_t FrequencyTable::total() const noexcept {
  return total_;
}

size_t FrequencyTable::size() const noexcept {
  return counts_.size();
}

bool FrequencyTable::empty() const noexcept {
  return counts_.empty();
}

std::unordered_map<std::string, size_t> const& FrequencyTable::counts() const noexcept {
  return counts_;
}

std::vector<RankedEntry> rank(FrequencyTable const& table, RankOptions const& options) {
  std::vector<RankedEntry> ranked;
  if (table.empty() || table.total() == 0) {
    return ranked;
  }

  ranked.reserve(table.size());
  for (auto const& [command, count] : table.counts()) {
    ranked.push_back(RankedEntry{command, count});
  }
  std::ranges::sort(ranked, [](RankedEntry const& a, RankedEntry const& b) {
    if (a.count_ != b.count_) {
      return a.count_ > b.count_;
    }
    return a.command_ < b.command_;
  });

  auto   total     = static_cast<double>(table.total());
  size_t remaining = table.total();
  for (auto& entry : ranked) {
    entry.percentage_         = 100.0 * static_cast<double>(entry.count_) / total;
    entry.inverse_cumulative_ = 100.0 * static_cast<double>(remaining) / total;
    remaining -= entry.count_;
  }

  if (!options.all_ && options.limit_ && *options.limit_ < ranked.size()) {
    ranked.erase(std::next(ranked.begin(), static_cast<std::ptrdiff_t>(*options.limit_)), ranked.end());
  }
  return ranked;
}

} // namespace histop
