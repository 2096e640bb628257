#include "histop/Normalizer.hpp"
#include "histop/Util.hpp"

#include <algorithm>
#include <string_view>

namespace histop {

namespace {

bool contains(std::vector<std::string> const& names, std::string_view name) {
  return std::ranges::find(names, name) != names.end();
}

} // namespace

bool isAssignment(Token const& token) noexcept {
  if (token.leading_quoted_) {
    return false;
  }
  size_t eq = token.text_.find('=');
  if (eq == std::string::npos) {
    return false;
  }
  return isValidIdentifier(std::string_view{token.text_}.substr(0, eq));
}

std::optional<std::string> normalize(PipelineSegment const& segment, NormalizeOptions const& options) {
  auto const& tokens = segment.tokens_;

  size_t head = 0;
  while (head < tokens.size()) {
    if (isAssignment(tokens[head])) {
      ++head;
      continue;
    }
    if (options.strip_wrappers_ && contains(options.wrappers_, tokens[head].text_)) {
      ++head;
      // sudo -- cmd
      if (head < tokens.size() && tokens[head].text_ == "--") {
        ++head;
      }
      continue;
    }
    break;
  }

  if (head == tokens.size() || tokens[head].text_.empty()) {
    return std::nullopt;
  }

  std::string command = tokens[head].text_;
  if (options.track_subcommands_ && contains(options.subcommand_tools_, command) && head + 1 < tokens.size()) {
    auto const& sub = tokens[head + 1].text_;
    if (!sub.empty() && !sub.starts_with('-')) {
      command += ' ';
      command += sub;
    }
  }
  return command;
}

} // namespace histop
