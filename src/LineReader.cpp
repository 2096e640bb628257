#include "histop/LineReader.hpp"
#include "histop/Util.hpp"

#include <fmt/format.h>

#include <utility>

namespace histop {

LineReader::LineReader(std::istream& in) noexcept
    : in_(&in) {}

Result<std::vector<std::string>> LineReader::sample(size_t non_blank) {
  size_t seen = 0;
  for (auto const& line : pending_) {
    if (!isBlank(line)) {
      ++seen;
    }
  }

  while (seen < non_blank) {
    auto line = readPhysical();
    if (!line) {
      return std::unexpected(line.error());
    }
    if (!*line) {
      break;
    }
    if (!isBlank(**line)) {
      ++seen;
    }
    pending_.push_back(std::move(**line));
  }

  return std::vector<std::string>(pending_.begin(), pending_.end());
}

Result<std::optional<std::string>> LineReader::next() {
  if (!pending_.empty()) {
    std::string line = std::move(pending_.front());
    pending_.pop_front();
    ++line_no_;
    return line;
  }

  auto line = readPhysical();
  if (line && *line) {
    ++line_no_;
  }
  return line;
}

void LineReader::unread(std::string line) {
  pending_.push_front(std::move(line));
  --line_no_;
}

size_t LineReader::lineNumber() const noexcept {
  return line_no_;
}

Result<std::optional<std::string>> LineReader::readPhysical() {
  if (eof_) {
    return std::nullopt;
  }

  std::string line;
  if (!std::getline(*in_, line)) {
    if (in_->bad()) {
      return fail(ErrorKind::Io, fmt::format("read error after line {}", line_no_ + pending_.size()));
    }
    eof_ = true;
    return std::nullopt;
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return line;
}

} // namespace histop
