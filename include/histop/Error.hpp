#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace histop {

enum class ErrorKind {
  UnknownFormat,   // no format heuristic matched, or an unknown format name
  UnreadableInput, // content is not valid UTF-8 text
  Io,              // open/read failure
  Config,          // malformed configuration file
  Usage            // invalid command-line arguments
};

struct Error {
  ErrorKind   kind_;
  std::string message_;

  Error(ErrorKind kind, std::string message);

  [[nodiscard]] ErrorKind          kind() const noexcept;
  [[nodiscard]] std::string const& message() const noexcept;
};

template<typename T>
using Result = std::expected<T, Error>;

std::string_view errorKindName(ErrorKind kind) noexcept;

inline std::unexpected<Error> fail(ErrorKind kind, std::string message) {
  return std::unexpected(Error{kind, std::move(message)});
}

} // namespace histop
