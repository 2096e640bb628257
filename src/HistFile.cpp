#include "histop/HistFile.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <utility>

namespace histop {

namespace {

std::optional<std::string> getEnv(char const* name) {
  char const* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string{value};
}

bool isRegularFile(std::string const& path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec);
}

void pushUnique(std::vector<std::string>& values, std::string value) {
  if (std::ranges::find(values, value) == values.end()) {
    values.push_back(std::move(value));
  }
}

std::string_view baseName(std::string_view path) noexcept {
  size_t slash = path.rfind('/');
  return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

} // namespace

HistEnv HistEnv::fromEnvironment() {
  return HistEnv{getEnv("HISTFILE"), getEnv("SHELL"), getEnv("HOME")};
}

std::vector<std::string> shellHistoryCandidates(std::string_view home, std::string_view shell) {
  shell = baseName(shell);
  if (shell == "ash") {
    return {fmt::format("{}/.ash_history", home)};
  }
  if (shell == "bash") {
    return {fmt::format("{}/.bash_history", home)};
  }
  if (shell == "fish") {
    return {fmt::format("{}/.local/share/fish/fish_history", home)};
  }
  if (shell == "zsh") {
    return {fmt::format("{}/.config/zsh/.zsh_history", home), fmt::format("{}/.zsh_history", home)};
  }
  if (shell == "pwsh") {
    return {fmt::format("{}/.local/share/powershell/PSReadLine/ConsoleHost_history.txt", home)};
  }
  if (shell == "tcsh" || shell == "csh") {
    return {
        fmt::format("{}/.history", home),
        fmt::format("{}/.tcsh_history", home),
        fmt::format("{}/.csh_history", home),
    };
  }
  return {};
}

std::vector<std::string> defaultHistoryCandidates(std::string_view home) {
  return {
      fmt::format("{}/.bash_history", home),
      fmt::format("{}/.zsh_history", home),
      fmt::format("{}/.config/zsh/.zsh_history", home),
      fmt::format("{}/.ash_history", home),
      fmt::format("{}/.local/share/fish/fish_history", home),
      fmt::format("{}/.local/share/powershell/PSReadLine/ConsoleHost_history.txt", home),
      fmt::format("{}/.history", home),
      fmt::format("{}/.tcsh_history", home),
      fmt::format("{}/.csh_history", home),
  };
}

Result<std::string> resolveHistoryPath(HistEnv const& env) {
  std::vector<std::string> checked;

  if (env.histfile_) {
    if (isRegularFile(*env.histfile_)) {
      return *env.histfile_;
    }
    checked.push_back(*env.histfile_);
  }

  if (!env.home_) {
    return fail(ErrorKind::Usage, "could not determine the history file: HOME is not set");
  }

  std::vector<std::string> candidates;
  if (env.shell_) {
    for (auto& path : shellHistoryCandidates(*env.home_, *env.shell_)) {
      pushUnique(candidates, std::move(path));
    }
  }
  for (auto& path : defaultHistoryCandidates(*env.home_)) {
    pushUnique(candidates, std::move(path));
  }

  for (auto& path : candidates) {
    if (isRegularFile(path)) {
      return path;
    }
    checked.push_back(std::move(path));
  }

  return fail(
      ErrorKind::Usage,
      fmt::format("could not determine the history file, checked: {}", fmt::join(checked, ", "))
  );
}

} // namespace histop
