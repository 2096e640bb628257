#include "histop/Error.hpp"

#include <utility>

namespace histop {

Error::Error(ErrorKind kind, std::string message)
    : kind_(kind), message_(std::move(message)) {}

ErrorKind Error::kind() const noexcept {
  return kind_;
}

std::string const& Error::message() const noexcept {
  return message_;
}

std::string_view errorKindName(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::UnknownFormat: return "unknown format";
    case ErrorKind::UnreadableInput: return "unreadable input";
    case ErrorKind::Io: return "i/o error";
    case ErrorKind::Config: return "configuration error";
    case ErrorKind::Usage: return "usage error";
  }
  return "error";
}

} // namespace histop
