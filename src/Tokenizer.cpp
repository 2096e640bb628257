#include "histop/Tokenizer.hpp"
#include "histop/Util.hpp"

#include <utility>

namespace histop {

std::vector<std::string> PipelineSegment::words() const {
  std::vector<std::string> out;
  out.reserve(tokens_.size());
  for (auto const& token : tokens_) {
    out.push_back(token.text_);
  }
  return out;
}

Tokenizer::Tokenizer(std::string_view src, TokenizeOptions options) noexcept
    : src_(src), options_(options) {}

ScanState Tokenizer::state() const noexcept {
  return state_;
}

std::vector<PipelineSegment> Tokenizer::tokenize() {
  while (pos_ < src_.size()) {
    char c = src_[pos_++];
    switch (state_) {
      case ScanState::Unquoted: scanUnquoted(c); break;
      case ScanState::UnquotedEscape:
        // backslash-newline is a line continuation
        if (c != '\n') {
          append(c, true);
        }
        state_ = ScanState::Unquoted;
        break;
      case ScanState::SingleQuoted: scanSingleQuoted(c); break;
      case ScanState::DoubleQuoted: scanDoubleQuoted(c); break;
      case ScanState::DoubleQuotedEscape:
        if (c == '\n') {
          state_ = ScanState::DoubleQuoted;
          break;
        }
        if (c != '"' && c != '\\') {
          append('\\', true);
        }
        append(c, true);
        state_ = ScanState::DoubleQuoted;
        break;
    }
  }
  finish();
  return std::move(out_);
}

void Tokenizer::scanUnquoted(char c) {
  switch (c) {
    case '\\': state_ = ScanState::UnquotedEscape; return;
    case '\'': openQuote(ScanState::SingleQuoted); return;
    case '"': openQuote(ScanState::DoubleQuoted); return;
    case '|':
      if (!options_.split_pipes_) {
        break;
      }
      if (peek() == '|') {
        // logical OR: ends the word, not the segment
        ++pos_;
        closeWord();
        return;
      }
      if (peek() == '&') {
        ++pos_; // "|&" pipes stderr too
      }
      closeSegment();
      return;
    default:
      if (isBlank(c)) {
        closeWord();
        return;
      }
      break;
  }
  append(c, false);
}

void Tokenizer::scanSingleQuoted(char c) {
  if (c == '\'') {
    state_ = ScanState::Unquoted;
    return;
  }
  append(c, true);
}

void Tokenizer::scanDoubleQuoted(char c) {
  if (c == '"') {
    state_ = ScanState::Unquoted;
    return;
  }
  if (c == '\\') {
    state_ = ScanState::DoubleQuotedEscape;
    return;
  }
  append(c, true);
}

void Tokenizer::append(char c, bool quoted) {
  if (!in_word_) {
    in_word_        = true;
    leading_quoted_ = quoted;
  }
  quoted_ = quoted_ || quoted;
  word_.push_back(c);
}

void Tokenizer::openQuote(ScanState state) {
  state_ = state;
  if (!in_word_) {
    in_word_        = true;
    leading_quoted_ = true;
  }
  quoted_ = true;
}

void Tokenizer::closeWord() {
  if (!in_word_) {
    return;
  }
  segment_.tokens_.push_back(Token{std::move(word_), quoted_, leading_quoted_});
  word_.clear();
  in_word_        = false;
  quoted_         = false;
  leading_quoted_ = false;
}

void Tokenizer::closeSegment() {
  closeWord();
  if (!segment_.empty()) {
    out_.push_back(std::move(segment_));
  }
  segment_ = PipelineSegment{};
}

void Tokenizer::finish() {
  switch (state_) {
    case ScanState::Unquoted: break;
    case ScanState::UnquotedEscape:
      // dangling backslash is kept
      append('\\', false);
      break;
    case ScanState::DoubleQuotedEscape: append('\\', true); [[fallthrough]];
    case ScanState::SingleQuoted:
    case ScanState::DoubleQuoted:
      // unterminated quote: the rest of the entry was taken literally;
      // nothing left to keep if the word is empty
      if (word_.empty()) {
        in_word_ = false;
      }
      break;
  }
  closeSegment();
}

char Tokenizer::peek() const noexcept {
  return pos_ < src_.size() ? src_[pos_] : '\0';
}

std::vector<PipelineSegment> tokenize(std::string_view entry, TokenizeOptions options) {
  return Tokenizer{entry, options}.tokenize();
}

} // namespace histop
