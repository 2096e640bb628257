#include "histop/Config.hpp"
#include "histop/Util.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <utility>

namespace histop {

namespace {

// Drops a '#' comment that is not inside quotes.
std::string_view stripComment(std::string_view text) noexcept {
  char quote = '\0';
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (quote != '\0') {
      if (c == '\\' && quote == '"') {
        ++i;
      } else if (c == quote) {
        quote = '\0';
      }
    } else if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == '#') {
      return text.substr(0, i);
    }
  }
  return text;
}

// Splits array contents on commas outside quotes.
std::vector<std::string_view> splitArrayItems(std::string_view inner) {
  std::vector<std::string_view> items;
  char                          quote = '\0';
  size_t                        start = 0;
  for (size_t i = 0; i < inner.size(); ++i) {
    char c = inner[i];
    if (quote != '\0') {
      if (c == '\\' && quote == '"') {
        ++i;
      } else if (c == quote) {
        quote = '\0';
      }
    } else if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == ',') {
      items.push_back(inner.substr(start, i - start));
      start = i + 1;
    }
  }
  items.push_back(inner.substr(start));
  return items;
}

std::string unquote(std::string_view body, char quote) {
  if (quote == '\'') {
    return std::string{body};
  }
  std::string out;
  out.reserve(body.size());
  for (size_t i = 0; i < body.size(); ++i) {
    if (body[i] == '\\' && i + 1 < body.size() && (body[i + 1] == '"' || body[i + 1] == '\\')) {
      ++i;
    }
    out.push_back(body[i]);
  }
  return out;
}

Result<size_t> expectCount(ConfigValue const& value, std::string_view key, size_t line, long long min) {
  auto const* n = std::get_if<long long>(&value);
  if (n == nullptr || *n < min) {
    return fail(
        ErrorKind::Config,
        fmt::format("line {}: '{}' expects {} integer", line, key, min > 0 ? "a positive" : "a non-negative")
    );
  }
  return static_cast<size_t>(*n);
}

Result<std::string> expectString(ConfigValue const& value, std::string_view key, size_t line) {
  auto const* s = std::get_if<std::string>(&value);
  if (s == nullptr) {
    return fail(ErrorKind::Config, fmt::format("line {}: '{}' expects a string", line, key));
  }
  return *s;
}

Result<std::vector<std::string>> expectList(ConfigValue const& value, std::string_view key, size_t line) {
  auto const* list = std::get_if<std::vector<std::string>>(&value);
  if (list == nullptr) {
    return fail(ErrorKind::Config, fmt::format("line {}: '{}' expects an array of strings", line, key));
  }
  return *list;
}

Result<void> applyKey(FileConfig& config, std::string_view key, ConfigValue const& value, size_t line) {
  if (key == "count" || key == "bar_size" || key == "more_than") {
    auto n = expectCount(value, key, line, key == "count" ? 1 : 0);
    if (!n) {
      return std::unexpected(n.error());
    }
    (key == "count" ? config.count_ : key == "bar_size" ? config.bar_size_ : config.more_than_) = *n;
  } else if (key == "ignore" || key == "wrappers") {
    auto list = expectList(value, key, line);
    if (!list) {
      return std::unexpected(list.error());
    }
    (key == "ignore" ? config.ignore_ : config.wrappers_) = std::move(*list);
  } else if (key == "subcommands") {
    auto const* b = std::get_if<bool>(&value);
    if (b == nullptr) {
      return fail(ErrorKind::Config, fmt::format("line {}: 'subcommands' expects true or false", line));
    }
    config.subcommands_ = *b;
  } else if (key == "color") {
    auto s = expectString(value, key, line);
    if (!s) {
      return std::unexpected(s.error());
    }
    auto mode = parseColorMode(*s);
    if (!mode) {
      return fail(ErrorKind::Config, fmt::format("line {}: {}", line, mode.error().message()));
    }
    config.color_ = *mode;
  } else if (key == "format") {
    auto s = expectString(value, key, line);
    if (!s) {
      return std::unexpected(s.error());
    }
    auto format = parseFormatName(*s);
    if (!format) {
      return fail(ErrorKind::Config, fmt::format("line {}: {}", line, format.error().message()));
    }
    config.format_ = *format;
  }
  // unknown keys are ignored
  return {};
}

Result<size_t> parseCountOption(Arguments const& args, std::string const& name, long long min) {
  auto text  = args.get<std::string>(name).value_or("");
  auto value = parseInteger(text);
  if (!value || *value < min) {
    return fail(
        ErrorKind::Usage,
        fmt::format("--{} expects {} integer, got '{}'", name, min > 0 ? "a positive" : "a non-negative", text)
    );
  }
  return static_cast<size_t>(*value);
}

} // namespace

Result<ConfigValue> parseConfigValue(std::string_view text) {
  text = trim(text);
  if (text.empty()) {
    return fail(ErrorKind::Config, "missing value");
  }

  if (text.front() == '[') {
    if (text.size() < 2 || text.back() != ']') {
      return fail(ErrorKind::Config, "unterminated array");
    }
    std::vector<std::string> items;
    for (auto item : splitArrayItems(text.substr(1, text.size() - 2))) {
      if (isBlank(item)) {
        continue;
      }
      auto value = parseConfigValue(item);
      if (!value) {
        return std::unexpected(value.error());
      }
      auto* s = std::get_if<std::string>(&*value);
      if (s == nullptr) {
        return fail(ErrorKind::Config, "arrays may only hold strings");
      }
      items.push_back(std::move(*s));
    }
    return items;
  }

  if (text.front() == '"' || text.front() == '\'') {
    char quote = text.front();
    if (text.size() < 2 || text.back() != quote) {
      return fail(ErrorKind::Config, "unterminated string");
    }
    return unquote(text.substr(1, text.size() - 2), quote);
  }

  if (text == "true" || text == "false") {
    return text == "true";
  }
  if (auto n = parseInteger(text)) {
    return *n;
  }
  // bare word: color = auto
  return std::string{text};
}

Result<FileConfig> parseConfig(std::string_view text) {
  FileConfig config;
  size_t     line_no = 0;

  while (!text.empty()) {
    size_t           nl   = text.find('\n');
    std::string_view line = text.substr(0, nl);
    text.remove_prefix(nl == std::string_view::npos ? text.size() : nl + 1);
    ++line_no;

    line = trim(line);
    if (line.empty() || line.starts_with('#') || line.starts_with('[')) {
      continue;
    }

    size_t eq = line.find('=');
    if (eq == std::string_view::npos) {
      return fail(ErrorKind::Config, fmt::format("line {}: expected 'key = value'", line_no));
    }
    auto key = trim(line.substr(0, eq));
    if (key.empty()) {
      return fail(ErrorKind::Config, fmt::format("line {}: missing key", line_no));
    }

    auto value = parseConfigValue(stripComment(line.substr(eq + 1)));
    if (!value) {
      return fail(ErrorKind::Config, fmt::format("line {}: {}", line_no, value.error().message()));
    }
    if (auto applied = applyKey(config, key, *value, line_no); !applied) {
      return std::unexpected(applied.error());
    }
  }
  return config;
}

Result<FileConfig> loadConfig(std::string const& path) {
  std::ifstream file{path};
  if (!file) {
    return fail(ErrorKind::Io, fmt::format("cannot open config file {}: {}", path, std::strerror(errno)));
  }
  std::ostringstream buf;
  buf << file.rdbuf();

  auto config = parseConfig(buf.str());
  if (!config) {
    return fail(ErrorKind::Config, fmt::format("{}: {}", path, config.error().message()));
  }
  return config;
}

std::optional<std::string> defaultConfigPath() {
  if (char const* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0') {
    return fmt::format("{}/histop/config.toml", xdg);
  }
  if (char const* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return fmt::format("{}/.config/histop/config.toml", home);
  }
  return std::nullopt;
}

Result<FileConfig> loadConfigOrDefault(std::optional<std::string> const& explicit_path) {
  if (explicit_path) {
    return loadConfig(*explicit_path);
  }
  auto path = defaultConfigPath();
  if (!path) {
    return FileConfig{};
  }
  std::ifstream probe{*path};
  if (!probe) {
    return FileConfig{};
  }
  return loadConfig(*path);
}

Result<RunConfig> buildRunConfig(Arguments const& args, FileConfig const& file) {
  RunConfig config;

  // config file
  config.count_       = file.count_.value_or(config.count_);
  config.bar_.size_   = file.bar_size_.value_or(config.bar_.size_);
  config.more_than_   = file.more_than_.value_or(config.more_than_);
  config.color_       = file.color_.value_or(config.color_);
  config.subcommands_ = file.subcommands_.value_or(config.subcommands_);
  config.format_      = file.format_;
  if (file.ignore_) {
    config.ignore_ = *file.ignore_;
  }
  if (file.wrappers_) {
    config.wrappers_ = *file.wrappers_;
  }

  // command line
  if (args.given("file") && !args.positional_.empty()) {
    return fail(ErrorKind::Usage, "--file conflicts with a positional FILE argument");
  }
  if (args.positional_.size() > 1) {
    return fail(ErrorKind::Usage, fmt::format("unexpected argument '{}'", args.positional_[1]));
  }
  if (args.given("file")) {
    config.file_ = args.get<std::string>("file");
  } else if (!args.positional_.empty()) {
    config.file_ = args.positional_.front();
  }

  if (args.given("count")) {
    auto n = parseCountOption(args, "count", 1);
    if (!n) {
      return std::unexpected(n.error());
    }
    config.count_ = *n;
  }
  if (args.given("more-than")) {
    auto n = parseCountOption(args, "more-than", 0);
    if (!n) {
      return std::unexpected(n.error());
    }
    config.more_than_ = *n;
  }
  if (args.given("bar-size")) {
    auto n = parseCountOption(args, "bar-size", 0);
    if (!n) {
      return std::unexpected(n.error());
    }
    config.bar_.size_ = *n;
  }
  if (args.given("ignore")) {
    config.ignore_ = splitList(args.get<std::string>("ignore").value_or(""), '|');
  }
  if (args.given("format")) {
    auto format = parseFormatName(args.get<std::string>("format").value_or(""));
    if (!format) {
      return fail(ErrorKind::Usage, format.error().message());
    }
    config.format_ = *format;
  }
  if (args.given("color")) {
    auto mode = parseColorMode(args.get<std::string>("color").value_or(""));
    if (!mode) {
      return std::unexpected(mode.error());
    }
    config.color_ = *mode;
  }
  if (args.has("output")) {
    auto output = parseOutputFormat(args.get<std::string>("output").value_or(""));
    if (!output) {
      return std::unexpected(output.error());
    }
    config.output_ = *output;
  }

  config.all_            = args.has("all");
  config.bar_.show_bar_  = !args.has("no-bar") && config.bar_.size_ > 0;
  config.bar_.show_perc_ = !args.has("no-perc");
  config.bar_.show_cumu_ = !args.has("no-cumu");
  config.raw_            = args.has("raw");
  config.subcommands_    = config.subcommands_ || args.has("subcommands");
  config.verbose_        = args.has("verbose");
  return config;
}

AnalyzeOptions analyzeOptions(RunConfig const& config) {
  AnalyzeOptions options;
  options.detect_.override_ = config.format_;
  if (config.file_ && *config.file_ != "-") {
    options.detect_.path_hint_ = *config.file_;
  }
  options.tokenize_.split_pipes_        = !config.raw_;
  options.normalize_.wrappers_          = config.wrappers_;
  options.normalize_.strip_wrappers_    = !config.raw_;
  options.normalize_.track_subcommands_ = config.subcommands_;
  options.ignore_.insert(config.ignore_.begin(), config.ignore_.end());
  options.more_than_   = config.more_than_;
  options.rank_.limit_ = config.count_;
  options.rank_.all_   = config.all_;
  return options;
}

} // namespace histop
