#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace histop {

// Occurrence count per canonical command.
class FrequencyTable {
  std::unordered_map<std::string, size_t> counts_;
  size_t                                  total_ = 0;

public:
  void add(std::string const& command);
  void add(std::string const& command, size_t count);

  // Drop ignored commands and those seen `more_than` times or fewer.
  void filter(std::set<std::string, std::less<>> const& ignore, size_t more_than);

  [[nodiscard]] size_t count(std::string_view command) const;
  [[nodiscard]] size_t total() const noexcept;
  [[nodiscard]] size_t size() const noexcept;
  [[nodiscard]] bool   empty() const noexcept;

  [[nodiscard]] std::unordered_map<std::string, size_t> const& counts() const noexcept;
};

struct RankedEntry {
  std::string command_;
  size_t      count_              = 0;
  double      percentage_         = 0.0;
  double      inverse_cumulative_ = 0.0; // share of this and every lower rank

  friend bool operator==(RankedEntry const&, RankedEntry const&) = default;
};

struct RankOptions {
  std::optional<size_t> limit_;
  bool                  all_ = false; // ignore limit_
};

// Count descending, then command ascending. Percentages are relative to the
// table total; the limit only truncates the result.
std::vector<RankedEntry> rank(FrequencyTable const& table, RankOptions const& options = {});

} // namespace histop
