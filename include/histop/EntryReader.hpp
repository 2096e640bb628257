#pragma once

#include "histop/Error.hpp"
#include "histop/HistoryFormat.hpp"
#include "histop/LineReader.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace histop {

// One logical command line as the user typed it.
struct RawEntry {
  std::string              text_;
  std::optional<long long> timestamp_;
  std::optional<long long> duration_;
  size_t                   line_ = 0; // physical line the entry started on
};

struct EntryStats {
  size_t entries_           = 0; // entries yielded
  size_t blank_entries_     = 0; // logical entries dropped as empty
  size_t skipped_records_   = 0; // malformed fish records
  size_t unmetafied_        = 0; // zsh lines that needed unmetafying
  size_t undecodable_lines_ = 0; // lines skipped as invalid UTF-8
};

// Lazy, single-pass sequence of RawEntry over a LineReader. The reader is
// borrowed and must outlive the EntryReader.
class EntryReader {
  LineReader*              lines_;
  HistoryFormat            format_;
  EntryStats               stats_;
  std::optional<long long> pending_timestamp_;
  size_t                   decoded_lines_ = 0; // non-blank lines that decoded

public:
  EntryReader(LineReader& lines, HistoryFormat format) noexcept;

  EntryReader(EntryReader const&)            = delete;
  EntryReader& operator=(EntryReader const&) = delete;
  EntryReader(EntryReader&&) noexcept        = default;
  EntryReader& operator=(EntryReader&&)      = default;
  ~EntryReader()                             = default;

  // Next non-empty entry or std::nullopt at end of input. Lines that are not
  // valid UTF-8 are skipped; UnreadableInput only when no non-blank line
  // decodes at all.
  Result<std::optional<RawEntry>> next();

  [[nodiscard]] HistoryFormat     format() const noexcept;
  [[nodiscard]] EntryStats const& stats() const noexcept;

private:
  Result<std::optional<std::string>> nextLine();
  Result<std::optional<RawEntry>>    nextLineEntry();
  Result<std::optional<RawEntry>>    nextFishEntry();
};

// True when `line` ends with a backslash that is not itself escaped.
bool endsWithContinuation(std::string_view line) noexcept;

// Decode fish_history escaping: "\\" -> "\", "\n" -> newline.
std::string unescapeFish(std::string_view value);

} // namespace histop
