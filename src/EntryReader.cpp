#include "histop/EntryReader.hpp"
#include "histop/Util.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <utility>
#include <vector>

namespace histop {

namespace {

// Indentation of record fields ("  when: ..."); the "- " of the first line
// puts its field at the same column.
constexpr size_t FISH_FIELD_INDENT = 2;

struct FishLine {
  size_t           indent_;
  std::string_view content_;
};

FishLine splitIndent(std::string_view line) noexcept {
  size_t indent = 0;
  while (indent < line.size() && line[indent] == ' ') {
    ++indent;
  }
  return {indent, line.substr(indent)};
}

// "key: value" or "key:" with a lowercase key; returns {key, value}.
std::optional<std::pair<std::string_view, std::string_view>> splitField(std::string_view content) noexcept {
  size_t colon = content.find(':');
  if (colon == std::string_view::npos || colon == 0) {
    return std::nullopt;
  }
  auto key = content.substr(0, colon);
  for (char c : key) {
    if (!((c >= 'a' && c <= 'z') || c == '_')) {
      return std::nullopt;
    }
  }
  auto value = content.substr(colon + 1);
  if (!value.empty() && value.front() != ' ') {
    return std::nullopt;
  }
  if (!value.empty()) {
    value.remove_prefix(1);
  }
  return std::pair{key, value};
}

bool isBlockIndicator(std::string_view value) noexcept {
  value = trim(value);
  return value == "|" || value == "|-" || value == "|+";
}

std::optional<RawEntry> parseFishRecord(std::vector<std::string> const& record, size_t first_line) {
  std::vector<FishLine> lines;
  lines.reserve(record.size());
  for (size_t i = 0; i < record.size(); ++i) {
    std::string_view raw = record[i];
    if (i == 0) {
      // "- cmd: ls" -> field at the common indent; bare "-" -> nothing
      raw.remove_prefix(raw.size() > 1 ? 2 : 1);
      lines.push_back({FISH_FIELD_INDENT, raw});
    } else {
      lines.push_back(splitIndent(raw));
    }
  }

  std::optional<std::string> cmd;
  RawEntry                   entry;
  entry.line_ = first_line;

  for (size_t i = 0; i < lines.size(); ++i) {
    auto const& [indent, content] = lines[i];
    if (indent != FISH_FIELD_INDENT) {
      continue;
    }
    auto field = splitField(content);
    if (!field) {
      continue;
    }
    auto [key, value] = *field;

    if (key == "when") {
      entry.timestamp_ = parseInteger(trim(value));
      continue;
    }
    if (key != "cmd" || cmd) {
      continue;
    }

    if (isBlockIndicator(value)) {
      std::string block;
      size_t      block_indent = 0;
      while (i + 1 < lines.size() && (lines[i + 1].indent_ > FISH_FIELD_INDENT || lines[i + 1].content_.empty())) {
        ++i;
        std::string_view raw = record[i];
        if (block_indent == 0) {
          block_indent = lines[i].indent_;
        }
        if (!block.empty()) {
          block.push_back('\n');
        }
        block += raw.substr(std::min(block_indent, raw.size()));
      }
      cmd = std::move(block);
      continue;
    }

    std::string text{value};
    // "- cmd: doas -- \"
    // "  systemctl stop sshd"
    while (endsWithContinuation(text) && i + 1 < lines.size() && lines[i + 1].indent_ >= FISH_FIELD_INDENT &&
           !splitField(lines[i + 1].content_) && !lines[i + 1].content_.starts_with("- ")) {
      ++i;
      text.pop_back();
      text.erase(trimEnd(text).size());
      text.push_back(' ');
      text += trim(lines[i].content_);
    }
    cmd = unescapeFish(text);
  }

  if (!cmd) {
    return std::nullopt;
  }
  entry.text_ = std::move(*cmd);
  return entry;
}

} // namespace

bool endsWithContinuation(std::string_view line) noexcept {
  size_t backslashes = 0;
  while (backslashes < line.size() && line[line.size() - 1 - backslashes] == '\\') {
    ++backslashes;
  }
  return backslashes % 2 == 1;
}

std::string unescapeFish(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '\\' && i + 1 < value.size()) {
      char next = value[i + 1];
      if (next == '\\') {
        out.push_back('\\');
        ++i;
        continue;
      }
      if (next == 'n') {
        out.push_back('\n');
        ++i;
        continue;
      }
    }
    out.push_back(value[i]);
  }
  return out;
}

EntryReader::EntryReader(LineReader& lines, HistoryFormat format) noexcept
    : lines_(&lines), format_(format) {}

HistoryFormat EntryReader::format() const noexcept {
  return format_;
}

EntryStats const& EntryReader::stats() const noexcept {
  return stats_;
}

Result<std::optional<RawEntry>> EntryReader::next() {
  if (format_ == HistoryFormat::FishRecord) {
    return nextFishEntry();
  }
  return nextLineEntry();
}

Result<std::optional<std::string>> EntryReader::nextLine() {
  while (true) {
    auto line = lines_->next();
    if (!line) {
      return line;
    }
    if (!*line) {
      // every non-blank line was undecodable: not a text file
      if (stats_.undecodable_lines_ > 0 && decoded_lines_ == 0) {
        return fail(ErrorKind::UnreadableInput,
                    fmt::format("none of the {} non-blank lines is valid UTF-8 text", stats_.undecodable_lines_));
      }
      return line;
    }
    if (isValidUtf8(**line)) {
      if (!isBlank(**line)) {
        ++decoded_lines_;
      }
      return line;
    }
    if (format_ == HistoryFormat::ZshExtended) {
      std::string decoded = unmetafy(**line);
      if (isValidUtf8(decoded)) {
        ++stats_.unmetafied_;
        ++decoded_lines_;
        return decoded;
      }
    }
    ++stats_.undecodable_lines_;
  }
}

Result<std::optional<RawEntry>> EntryReader::nextLineEntry() {
  while (true) {
    auto line = nextLine();
    if (!line) {
      return std::unexpected(line.error());
    }
    if (!*line) {
      return std::nullopt;
    }

    std::string_view first = **line;
    if (auto ts = parseTimestampComment(first, format_)) {
      pending_timestamp_ = ts;
      continue;
    }
    if (format_ == HistoryFormat::TcshPlain && trim(first).starts_with('#')) {
      continue;
    }

    RawEntry entry;
    entry.line_ = lines_->lineNumber();

    std::string text;
    if (auto meta = format_ == HistoryFormat::ZshExtended ? parseZshMetadata(first) : std::nullopt) {
      entry.timestamp_ = meta->timestamp_;
      entry.duration_  = meta->duration_;
      text             = meta->command_;
    } else {
      text = first;
    }
    if (!entry.timestamp_) {
      entry.timestamp_ = pending_timestamp_;
    }
    pending_timestamp_.reset();

    while (endsWithContinuation(text)) {
      text.pop_back();
      auto cont = nextLine();
      if (!cont) {
        return std::unexpected(cont.error());
      }
      if (!*cont) {
        break;
      }
      text += **cont;
    }

    if (isBlank(text)) {
      ++stats_.blank_entries_;
      continue;
    }
    entry.text_ = std::move(text);
    ++stats_.entries_;
    return entry;
  }
}

Result<std::optional<RawEntry>> EntryReader::nextFishEntry() {
  while (true) {
    auto line = nextLine();
    if (!line) {
      return std::unexpected(line.error());
    }
    if (!*line) {
      return std::nullopt;
    }
    if (!isFishRecordStart(**line)) {
      // stray line outside any record
      if (!isBlank(**line)) {
        ++stats_.skipped_records_;
      }
      continue;
    }

    size_t                   start = lines_->lineNumber();
    std::vector<std::string> record;
    record.push_back(std::move(**line));
    while (true) {
      auto more = nextLine();
      if (!more) {
        return std::unexpected(more.error());
      }
      if (!*more) {
        break;
      }
      if (isFishRecordStart(**more)) {
        lines_->unread(std::move(**more));
        break;
      }
      record.push_back(std::move(**more));
    }

    auto entry = parseFishRecord(record, start);
    if (!entry) {
      ++stats_.skipped_records_;
      continue;
    }
    if (isBlank(entry->text_)) {
      ++stats_.blank_entries_;
      continue;
    }
    ++stats_.entries_;
    return entry;
  }
}

} // namespace histop
