#pragma once

#include "histop/Tokens.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace histop {

enum class ScanState {
  Unquoted,
  UnquotedEscape, // after '\' outside quotes
  SingleQuoted,
  DoubleQuoted,
  DoubleQuotedEscape // after '\' inside double quotes
};

struct TokenizeOptions {
  // When false "|" is an ordinary character and every entry is a single
  // segment
  bool split_pipes_ = true;
};

// Splits one history entry into pipeline segments of words. Approximates
// shell lexing only as far as quoting, escaping and pipes go: no
// expansions, no redirections, no other operators.
class Tokenizer {
  std::string_view             src_;
  TokenizeOptions              options_;
  size_t                       pos_   = 0;
  ScanState                    state_ = ScanState::Unquoted;
  std::string                  word_;
  bool                         in_word_        = false;
  bool                         quoted_         = false;
  bool                         leading_quoted_ = false;
  PipelineSegment              segment_;
  std::vector<PipelineSegment> out_;

public:
  explicit Tokenizer(std::string_view src, TokenizeOptions options = {}) noexcept;

  std::vector<PipelineSegment> tokenize();

  [[nodiscard]] ScanState state() const noexcept;

private:
  void scanUnquoted(char c);
  void scanSingleQuoted(char c);
  void scanDoubleQuoted(char c);

  void        append(char c, bool quoted);
  void        openQuote(ScanState state);
  void        closeWord();
  void        closeSegment();
  void        finish();
  [[nodiscard]] char peek() const noexcept;
};

std::vector<PipelineSegment> tokenize(std::string_view entry, TokenizeOptions options = {});

} // namespace histop
