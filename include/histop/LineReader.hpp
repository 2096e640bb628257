#pragma once

#include "histop/Error.hpp"

#include <deque>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace histop {

// Physical line source over a byte stream. Lines are returned raw (no
// decoding) without the trailing "\n" or "\r\n". Supports read-ahead for
// format detection and a one-line push back for record grouping.
class LineReader {
  std::istream*           in_;
  std::deque<std::string> pending_;
  size_t                  line_no_ = 0;
  bool                    eof_     = false;

public:
  explicit LineReader(std::istream& in) noexcept;

  LineReader(LineReader const&)            = delete;
  LineReader& operator=(LineReader const&) = delete;
  LineReader(LineReader&&) noexcept        = default;
  LineReader& operator=(LineReader&&)      = default;
  ~LineReader()                            = default;

  // Buffers lines until `non_blank` non-blank lines are seen or the input
  // ends, and returns a copy of everything buffered so far.
  Result<std::vector<std::string>> sample(size_t non_blank);

  Result<std::optional<std::string>> next();
  void                               unread(std::string line);

  // 1-based number of the line most recently returned by next()
  [[nodiscard]] size_t lineNumber() const noexcept;

private:
  Result<std::optional<std::string>> readPhysical();
};

} // namespace histop
