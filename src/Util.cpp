#include "histop/Util.hpp"

#include <charconv>
#include <cstdint>
#include <system_error>

namespace histop {

namespace {

constexpr unsigned char ZSH_META = 0x83;

bool isAsciiAlpha(char c) noexcept {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool isAsciiDigit(char c) noexcept {
  return c >= '0' && c <= '9';
}

bool isContinuation(unsigned char c) noexcept {
  return (c & 0xC0U) == 0x80U;
}

} // namespace

bool isBlank(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

bool isBlank(std::string_view s) noexcept {
  for (char c : s) {
    if (!isBlank(c)) {
      return false;
    }
  }
  return true;
}

std::string_view trim(std::string_view s) noexcept {
  size_t begin = 0;
  while (begin < s.size() && isBlank(s[begin])) {
    ++begin;
  }
  return trimEnd(s.substr(begin));
}

std::string_view trimEnd(std::string_view s) noexcept {
  size_t end = s.size();
  while (end > 0 && isBlank(s[end - 1])) {
    --end;
  }
  return s.substr(0, end);
}

bool isAllDigits(std::string_view s) noexcept {
  if (s.empty()) {
    return false;
  }
  for (char c : s) {
    if (!isAsciiDigit(c)) {
      return false;
    }
  }
  return true;
}

bool isValidIdentifier(std::string_view name) noexcept {
  if (name.empty() || isAsciiDigit(name.front())) {
    return false;
  }
  for (char c : name) {
    if (!isAsciiAlpha(c) && !isAsciiDigit(c) && c != '_') {
      return false;
    }
  }
  return true;
}

bool isValidUtf8(std::string_view bytes) noexcept {
  size_t i = 0;
  while (i < bytes.size()) {
    auto c = static_cast<unsigned char>(bytes[i]);
    if (c < 0x80) {
      ++i;
      continue;
    }

    size_t        len = 0;
    std::uint32_t cp  = 0;
    if ((c & 0xE0U) == 0xC0U) {
      len = 2;
      cp  = c & 0x1FU;
    } else if ((c & 0xF0U) == 0xE0U) {
      len = 3;
      cp  = c & 0x0FU;
    } else if ((c & 0xF8U) == 0xF0U) {
      len = 4;
      cp  = c & 0x07U;
    } else {
      return false;
    }

    if (i + len > bytes.size()) {
      return false;
    }
    for (size_t k = 1; k < len; ++k) {
      auto cc = static_cast<unsigned char>(bytes[i + k]);
      if (!isContinuation(cc)) {
        return false;
      }
      cp = (cp << 6U) | (cc & 0x3FU);
    }

    // overlong forms, surrogates, out of range
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
      return false;
    }
    if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
      return false;
    }
    i += len;
  }
  return true;
}

std::string unmetafy(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size());
  for (size_t i = 0; i < bytes.size(); ++i) {
    auto c = static_cast<unsigned char>(bytes[i]);
    if (c == ZSH_META && i + 1 < bytes.size()) {
      out.push_back(static_cast<char>(static_cast<unsigned char>(bytes[i + 1]) ^ 0x20U));
      ++i;
      continue;
    }
    out.push_back(bytes[i]);
  }
  return out;
}

std::vector<std::string> splitList(std::string_view s, char delim) {
  std::vector<std::string> parts;
  while (true) {
    size_t pos  = s.find(delim);
    auto   part = trim(s.substr(0, pos));
    if (!part.empty()) {
      parts.emplace_back(part);
    }
    if (pos == std::string_view::npos) {
      break;
    }
    s.remove_prefix(pos + 1);
  }
  return parts;
}

std::optional<long long> parseInteger(std::string_view s) noexcept {
  long long value = 0;
  auto [ptr, ec]  = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc{} || ptr != s.data() + s.size()) {
    return std::nullopt;
  }
  return value;
}

} // namespace histop
