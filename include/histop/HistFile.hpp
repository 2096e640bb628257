#pragma once

#include "histop/Error.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace histop {

// Environment inputs of history file resolution
struct HistEnv {
  std::optional<std::string> histfile_;
  std::optional<std::string> shell_;
  std::optional<std::string> home_;

  static HistEnv fromEnvironment();
};

// Known history locations of one shell ("zsh", "/bin/zsh"); empty for an
// unknown shell.
std::vector<std::string> shellHistoryCandidates(std::string_view home, std::string_view shell);

// Every known location, in lookup order.
std::vector<std::string> defaultHistoryCandidates(std::string_view home);

// $HISTFILE, then the locations of $SHELL, then every known location; the
// first regular file wins.
Result<std::string> resolveHistoryPath(HistEnv const& env);

} // namespace histop
