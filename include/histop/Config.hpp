#pragma once

#include "histop/Analyzer.hpp"
#include "histop/ArgParser.hpp"
#include "histop/Error.hpp"
#include "histop/HistoryFormat.hpp"
#include "histop/Render.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace histop {

using ConfigValue = std::variant<long long, bool, std::string, std::vector<std::string>>;

// Settings read from config.toml; unset keys stay empty.
struct FileConfig {
  std::optional<size_t>                   count_;
  std::optional<size_t>                   bar_size_;
  std::optional<size_t>                   more_than_;
  std::optional<std::vector<std::string>> ignore_;
  std::optional<ColorMode>                color_;
  std::optional<bool>                     subcommands_;
  std::optional<HistoryFormat>            format_;
  std::optional<std::vector<std::string>> wrappers_;
};

// One value in the TOML subset: integer, boolean, quoted or bare string,
// array of strings.
Result<ConfigValue> parseConfigValue(std::string_view text);

Result<FileConfig> parseConfig(std::string_view text);
Result<FileConfig> loadConfig(std::string const& path);

// $XDG_CONFIG_HOME/histop/config.toml or ~/.config/histop/config.toml
std::optional<std::string> defaultConfigPath();

// An explicit path must exist; a missing default file gives an empty config.
Result<FileConfig> loadConfigOrDefault(std::optional<std::string> const& explicit_path);

// Everything one run needs, after defaults < config file < command line.
struct RunConfig {
  std::optional<std::string>   file_;
  size_t                       count_     = DEFAULT_COUNT;
  bool                         all_       = false;
  size_t                       more_than_ = DEFAULT_MORE_THAN;
  std::vector<std::string>     ignore_;
  BarOptions                   bar_;
  bool                         raw_         = false;
  bool                         subcommands_ = false;
  std::optional<HistoryFormat> format_;
  OutputFormat                 output_  = OutputFormat::Text;
  ColorMode                    color_   = ColorMode::Auto;
  bool                         verbose_ = false;
  std::vector<std::string>     wrappers_{DEFAULT_WRAPPERS.begin(), DEFAULT_WRAPPERS.end()};
};

Result<RunConfig> buildRunConfig(Arguments const& args, FileConfig const& file);

AnalyzeOptions analyzeOptions(RunConfig const& config);

} // namespace histop
