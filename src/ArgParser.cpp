#include "histop/ArgParser.hpp"
#include "histop/Constants.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace histop {

namespace {

// "-" alone is a value (standard input), not an option
bool looksLikeOption(std::string_view arg) noexcept {
  return arg.size() > 1 && arg.starts_with('-');
}

} // namespace

bool Arguments::has(std::string const& name) const noexcept {
  return args_.contains(name);
}

bool Arguments::given(std::string const& name) const noexcept {
  return explicit_.contains(name);
}

Option::Option(std::string name, std::string short_name) noexcept
    : name_{std::move(name)}, short_name_{std::move(short_name)} {}

Option& Option::desc(std::string desc) noexcept {
  description_ = std::move(desc);
  return *this;
}

Option& Option::defaultValue(std::string value) noexcept {
  default_value_ = std::move(value);
  return *this;
}

Option& Option::nargs(size_t n) noexcept {
  nargs_ = n;
  return *this;
}

Option& Option::valueName(std::string name) noexcept {
  value_name_ = std::move(name);
  return *this;
}

ArgumentParser::ArgumentParser(std::string name, std::string desc, std::string usage) noexcept
    : name_{std::move(name)}, desc_{std::move(desc)}, usage_{std::move(usage)} {}

Option& ArgumentParser::addArgument(std::string name, std::string short_name) {
  options_.emplace_back(std::move(name), std::move(short_name));
  return options_.back();
}

Result<Arguments> ArgumentParser::parse(int argc, char const* const* argv) const {
  Arguments result;

  for (auto const& option : options_) {
    if (option.default_value_) {
      result.args_[option.name_] = {*option.default_value_};
    }
  }

  bool options_done = false;
  for (int i = 1; i < argc; ++i) {
    std::string_view arg{argv[i]};

    if (options_done || !looksLikeOption(arg)) {
      // Positional argument
      result.positional_.emplace_back(arg);
    } else if (arg == "--") {
      options_done = true;
    } else if (arg.starts_with("--")) {
      // Long option
      std::string_view name        = arg.substr(2);
      size_t           eq_pos      = name.find('=');
      std::string_view option_name = name.substr(0, eq_pos);

      auto option_it = std::ranges::find_if(options_, [option_name](Option const& opt) {
        return opt.name_ == option_name;
      });

      if (option_it == options_.end()) {
        return fail(ErrorKind::Usage, fmt::format("unknown option: --{}", option_name));
      }

      if (option_it->nargs_ == 0) {
        if (eq_pos != std::string_view::npos) {
          return fail(ErrorKind::Usage, fmt::format("flag option --{} does not accept a value", option_name));
        }
        result.args_[option_it->name_] = {"true"};
      } else {
        std::vector<std::string> values;
        values.reserve(option_it->nargs_);

        if (eq_pos != std::string_view::npos) {
          values.emplace_back(name.substr(eq_pos + 1));
        } else {
          for (size_t j = 0; j < option_it->nargs_ && i + 1 < argc; ++j) {
            if (looksLikeOption(argv[i + 1])) {
              break;
            }
            values.emplace_back(argv[++i]);
          }
        }

        if (values.size() < option_it->nargs_) {
          return fail(
              ErrorKind::Usage,
              fmt::format("option --{} requires {} argument(s), got {}", option_name, option_it->nargs_, values.size())
          );
        }

        result.args_[option_it->name_] = std::move(values);
      }
      result.explicit_[option_it->name_] = true;
    } else {
      // Short option(s)
      for (size_t j = 1; j < arg.size(); ++j) {
        char short_opt{arg[j]};

        auto option_it = std::ranges::find_if(options_, [short_opt](Option const& opt) {
          return !opt.short_name_.empty() && opt.short_name_.front() == short_opt;
        });

        if (option_it == options_.end()) {
          return fail(ErrorKind::Usage, fmt::format("unknown option: -{}", short_opt));
        }

        if (option_it->nargs_ == 0) {
          result.args_[option_it->name_] = {"true"};
        } else {
          if (j < arg.size() - 1) {
            return fail(
                ErrorKind::Usage,
                fmt::format("option -{} requires a value and cannot be combined with other short options", short_opt)
            );
          }

          std::vector<std::string> values;
          for (size_t k = 0; k < option_it->nargs_ && i + 1 < argc; ++k) {
            if (looksLikeOption(argv[i + 1])) {
              break;
            }
            values.emplace_back(argv[++i]);
          }

          if (values.size() < option_it->nargs_) {
            return fail(
                ErrorKind::Usage,
                fmt::format("option -{} requires {} argument(s), got {}", short_opt, option_it->nargs_, values.size())
            );
          }

          result.args_[option_it->name_] = std::move(values);
        }
        result.explicit_[option_it->name_] = true;
      }
    }
  }

  return result;
}

std::string ArgumentParser::help() const {
  std::string out;
  auto        it = std::back_inserter(out);

  fmt::format_to(it, "Usage: {}", name_);
  if (!options_.empty()) {
    fmt::format_to(it, " [OPTIONS]");
  }
  if (!usage_.empty()) {
    fmt::format_to(it, " {}", usage_);
  }
  fmt::format_to(it, "\n\n");

  if (!desc_.empty()) {
    fmt::format_to(it, "{}\n\n", desc_);
  }

  if (!options_.empty()) {
    fmt::format_to(it, "Options:\n");
    for (auto const& option : options_) {
      fmt::format_to(it, "  ");

      if (!option.short_name_.empty()) {
        fmt::format_to(it, "-{}", option.short_name_);
        if (!option.name_.empty()) {
          fmt::format_to(it, ", ");
        }
      } else {
        fmt::format_to(it, "    ");
      }

      if (!option.name_.empty()) {
        fmt::format_to(it, "--{}", option.name_);
      }

      if (option.nargs_ > 0) {
        fmt::format_to(it, " <{}>", option.value_name_);
      }

      if (!option.description_.empty()) {
        fmt::format_to(it, "\n      {}", option.description_);
      }

      if (option.default_value_) {
        fmt::format_to(it, " (default: {})", *option.default_value_);
      }

      fmt::format_to(it, "\n");
    }
  }
  return out;
}

void printVersion() {
  fmt::print("{} {}\n", EXE_NAME, VERSION);
}

ArgumentParser createArgParser() {
  // clang-format off
  ArgumentParser parser(std::string{EXE_NAME}, std::string{EXE_DESC}, "[FILE]");

  parser.addArgument("file", "f")
    .nargs(1).valueName("FILE")
    .desc("History file to read, - for standard input");
  parser.addArgument("count", "c")
    .nargs(1).valueName("N")
    .desc(fmt::format("Number of commands to show (default: {})", DEFAULT_COUNT));
  parser.addArgument("all", "a")
    .desc("Show all commands");
  parser.addArgument("more-than", "m")
    .nargs(1).valueName("N")
    .desc("Only show commands seen more than N times");
  parser.addArgument("ignore", "i")
    .nargs(1).valueName("LIST")
    .desc("Commands to ignore, separated by |");
  parser.addArgument("bar-size", "b")
    .nargs(1).valueName("N")
    .desc(fmt::format("Width of the bar (default: {})", DEFAULT_BAR_SIZE));
  parser.addArgument("no-bar", "n")
    .desc("Hide the bar");
  parser.addArgument("no-perc")
    .desc("Hide the percentage part of the bar");
  parser.addArgument("no-cumu")
    .desc("Hide the inverse cumulative part of the bar");
  parser.addArgument("raw", "r")
    .desc("Raw input: no wrapper stripping, no pipe splitting");
  parser.addArgument("subcommands", "s")
    .desc("Count subcommands of multi-command tools (git status)");
  parser.addArgument("format", "F")
    .nargs(1).valueName("NAME")
    .desc("Force the history format: plain, zsh, fish, tcsh, powershell");
  parser.addArgument("output", "o")
    .nargs(1).valueName("FMT")
    .defaultValue("text")
    .desc("Output format: text, json, csv");
  parser.addArgument("color")
    .nargs(1).valueName("MODE")
    .desc("Colorize output: auto, always, never (default: auto)");
  parser.addArgument("config")
    .nargs(1).valueName("PATH")
    .desc("Configuration file");
  parser.addArgument("verbose", "v")
    .desc("Print diagnostics to stderr");
  parser.addArgument("help", "h")
    .desc("Show help message");
  parser.addArgument("version", "V")
    .desc("Show version");

  return parser;
  // clang-format on
}

} // namespace histop
