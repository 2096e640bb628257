#pragma once

#include "histop/Error.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace histop {

enum class HistoryFormat {
  PlainLines,     // bash, ash
  ZshExtended,    // ": <ts>:<dur>;cmd"
  FishRecord,     // "- cmd: ..." YAML-ish records
  TcshPlain,      // plain lines with "#+<ts>" comments
  PowerShellPlain // PSReadLine ConsoleHost_history.txt
};

std::string_view formatName(HistoryFormat format) noexcept;

// Accepts the canonical names and the shell aliases (bash, ash, pwsh).
Result<HistoryFormat> parseFormatName(std::string_view name);

struct DetectOptions {
  // Explicit override, always wins over the heuristics
  std::optional<HistoryFormat> override_;
  // Path of the history file, used only to recognize PSReadLine histories
  std::string path_hint_;
};

// Selects the grammar for `sample`, the first non-empty physical lines of
// the input. Pure function of its arguments.
Result<HistoryFormat> detectFormat(std::span<std::string const> sample, DetectOptions const& options);

struct ZshMetadata {
  long long        timestamp_ = 0;
  long long        duration_  = 0;
  std::string_view command_; // remainder of the line after ';'
};

// Line shapes shared by the detector and the entry reader.
std::optional<ZshMetadata> parseZshMetadata(std::string_view line) noexcept;
std::optional<long long>   parseTimestampComment(std::string_view line, HistoryFormat format) noexcept;
bool                       isFishRecordStart(std::string_view line) noexcept;

} // namespace histop

template<>
struct fmt::formatter<histop::HistoryFormat> : fmt::formatter<std::string_view> {
  template<typename FormatContext>
  auto format(histop::HistoryFormat f, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(histop::formatName(f), ctx);
  }
};
