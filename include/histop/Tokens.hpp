#pragma once

#include <string>
#include <vector>

namespace histop {

// Word token carries text (quotes and escapes removed) and quoting flags
struct Token {
  std::string text_;
  // any part of the word was quoted or escaped
  bool quoted_ = false;
  // the first character came from a quoted or escaped context; such a word
  // is never an assignment
  bool leading_quoted_ = false;

  friend bool operator==(Token const&, Token const&) = default;
};

// Words of one command between unquoted pipe boundaries
struct PipelineSegment {
  std::vector<Token> tokens_;

  [[nodiscard]] bool   empty() const noexcept {
    return tokens_.empty();
  }
  [[nodiscard]] size_t size() const noexcept {
    return tokens_.size();
  }

  // token texts, handy for diagnostics and tests
  [[nodiscard]] std::vector<std::string> words() const;

  friend bool operator==(PipelineSegment const&, PipelineSegment const&) = default;
};

} // namespace histop
