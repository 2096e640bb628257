#include "histop/HistoryFormat.hpp"
#include "histop/Util.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <utility>

namespace histop {

namespace {

constexpr std::array<std::pair<std::string_view, HistoryFormat>, 8> FORMAT_NAMES = {{
    {"plain", HistoryFormat::PlainLines},
    {"bash", HistoryFormat::PlainLines},
    {"ash", HistoryFormat::PlainLines},
    {"zsh", HistoryFormat::ZshExtended},
    {"fish", HistoryFormat::FishRecord},
    {"tcsh", HistoryFormat::TcshPlain},
    {"powershell", HistoryFormat::PowerShellPlain},
    {"pwsh", HistoryFormat::PowerShellPlain},
}};

bool isPowerShellPath(std::string_view path) noexcept {
  return path.find("PSReadLine") != std::string_view::npos || path.ends_with("ConsoleHost_history.txt");
}

bool looksLikeFish(std::span<std::string const> sample) noexcept {
  auto first = std::ranges::find_if(sample, [](std::string const& l) { return !isBlank(l); });
  if (first == sample.end()) {
    return false;
  }
  if (first->starts_with("- cmd:")) {
    return true;
  }
  // record marker alone, "cmd:" field on the next line
  if (trimEnd(*first) == "-") {
    auto next = std::next(first);
    return next != sample.end() && next->starts_with(' ') && trim(*next).starts_with("cmd:");
  }
  return false;
}

} // namespace

std::string_view formatName(HistoryFormat format) noexcept {
  switch (format) {
    case HistoryFormat::PlainLines: return "plain";
    case HistoryFormat::ZshExtended: return "zsh";
    case HistoryFormat::FishRecord: return "fish";
    case HistoryFormat::TcshPlain: return "tcsh";
    case HistoryFormat::PowerShellPlain: return "powershell";
  }
  return "plain";
}

Result<HistoryFormat> parseFormatName(std::string_view name) {
  auto key = trim(name);
  for (auto const& [format_name, format] : FORMAT_NAMES) {
    if (key == format_name) {
      return format;
    }
  }
  return fail(
      ErrorKind::UnknownFormat,
      fmt::format("unknown history format '{}' (expected plain, zsh, fish, tcsh or powershell)", key)
  );
}

std::optional<ZshMetadata> parseZshMetadata(std::string_view line) noexcept {
  // ": 1680820391:0;ls -la"
  if (!line.starts_with(": ")) {
    return std::nullopt;
  }
  line.remove_prefix(2);

  size_t colon = line.find(':');
  size_t semi  = line.find(';');
  if (colon == std::string_view::npos || semi == std::string_view::npos || colon > semi) {
    return std::nullopt;
  }

  auto ts  = line.substr(0, colon);
  auto dur = line.substr(colon + 1, semi - colon - 1);
  if (!isAllDigits(ts) || !isAllDigits(dur)) {
    return std::nullopt;
  }

  ZshMetadata meta;
  meta.timestamp_ = parseInteger(ts).value_or(0);
  meta.duration_  = parseInteger(dur).value_or(0);
  meta.command_   = line.substr(semi + 1);
  return meta;
}

std::optional<long long> parseTimestampComment(std::string_view line, HistoryFormat format) noexcept {
  if (format == HistoryFormat::ZshExtended || format == HistoryFormat::FishRecord) {
    return std::nullopt;
  }
  auto text = trim(line);
  if (!text.starts_with('#')) {
    return std::nullopt;
  }
  text.remove_prefix(1);
  if (format == HistoryFormat::TcshPlain) {
    if (!text.starts_with('+')) {
      return std::nullopt;
    }
    text.remove_prefix(1);
  }
  if (!isAllDigits(text)) {
    return std::nullopt;
  }
  return parseInteger(text);
}

bool isFishRecordStart(std::string_view line) noexcept {
  return line == "-" || line.starts_with("- ");
}

Result<HistoryFormat> detectFormat(std::span<std::string const> sample, DetectOptions const& options) {
  if (options.override_) {
    return *options.override_;
  }

  for (auto const& line : sample) {
    if (line.find('\0') != std::string::npos) {
      return fail(ErrorKind::UnknownFormat, "input looks like binary data, not a shell history");
    }
  }

  if (looksLikeFish(sample)) {
    return HistoryFormat::FishRecord;
  }
  if (std::ranges::any_of(sample, [](std::string const& l) { return parseZshMetadata(l).has_value(); })) {
    return HistoryFormat::ZshExtended;
  }
  if (std::ranges::any_of(sample, [](std::string const& l) {
        return parseTimestampComment(l, HistoryFormat::TcshPlain).has_value();
      })) {
    return HistoryFormat::TcshPlain;
  }
  if (isPowerShellPath(options.path_hint_)) {
    return HistoryFormat::PowerShellPlain;
  }
  return HistoryFormat::PlainLines;
}

} // namespace histop
