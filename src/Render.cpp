#include "histop/Render.hpp"

#include <fmt/color.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>

#include <unistd.h>

namespace histop {

namespace {

constexpr std::string_view FILLED     = "█";
constexpr std::string_view SEMIFILLED = "▓";
constexpr std::string_view UNFILLED   = "░";
constexpr std::string_view EDGE       = "│";
constexpr std::string_view PADDING    = "   ";

size_t cells(double percentage, size_t size) noexcept {
  auto n = std::lround(percentage / 100.0 * static_cast<double>(size));
  return n < 0 ? 0 : std::min(static_cast<size_t>(n), size);
}

std::string repeat(std::string_view s, size_t n) {
  std::string out;
  out.reserve(s.size() * n);
  for (size_t i = 0; i < n; ++i) {
    out += s;
  }
  return out;
}

double round2(double value) noexcept {
  return std::round(value * 100.0) / 100.0;
}

} // namespace

Result<OutputFormat> parseOutputFormat(std::string_view name) {
  if (name == "text") {
    return OutputFormat::Text;
  }
  if (name == "json") {
    return OutputFormat::Json;
  }
  if (name == "csv") {
    return OutputFormat::Csv;
  }
  return fail(ErrorKind::Usage, fmt::format("invalid output format '{}', use text, json or csv", name));
}

Result<ColorMode> parseColorMode(std::string_view name) {
  if (name == "auto") {
    return ColorMode::Auto;
  }
  if (name == "always") {
    return ColorMode::Always;
  }
  if (name == "never") {
    return ColorMode::Never;
  }
  return fail(ErrorKind::Usage, fmt::format("invalid color mode '{}', use auto, always or never", name));
}

std::string renderBar(double percentage, double inverse_cumulative, BarOptions const& options, bool color) {
  size_t filled = 0;
  size_t semi   = 0;
  size_t size   = options.size_;

  if (!options.show_bar_ || size == 0) {
    return {};
  }
  if (options.show_perc_ && options.show_cumu_) {
    filled = cells(percentage, size);
    semi   = std::min(cells(inverse_cumulative - percentage, size), size - filled);
  } else if (options.show_perc_) {
    filled = cells(percentage, size);
  } else if (options.show_cumu_) {
    semi = cells(inverse_cumulative, size);
  } else {
    return {};
  }

  std::string bar = repeat(UNFILLED, size - filled - semi) + repeat(SEMIFILLED, semi);
  if (color && filled > 0) {
    bar += fmt::format(fmt::fg(fmt::terminal_color::cyan), "{}", repeat(FILLED, filled));
  } else {
    bar += repeat(FILLED, filled);
  }
  return fmt::format("{}{}{}", EDGE, bar, EDGE);
}

std::string renderText(std::span<RankedEntry const> entries, RenderOptions const& options) {
  std::string out;
  auto        it = std::back_inserter(out);

  size_t count_width = 0;
  size_t perc_width  = 0;
  for (auto const& entry : entries) {
    count_width = std::max(count_width, fmt::formatted_size("{}", entry.count_));
    perc_width  = std::max(perc_width, fmt::formatted_size("{:.2f}%", entry.percentage_));
  }

  for (auto const& entry : entries) {
    auto count = fmt::format("{:>{}}", entry.count_, count_width);
    if (options.color_) {
      fmt::format_to(it, fmt::emphasis::faint, "{}", count);
    } else {
      fmt::format_to(it, "{}", count);
    }
    fmt::format_to(it, "{}", PADDING);

    auto bar = renderBar(entry.percentage_, entry.inverse_cumulative_, options.bar_, options.color_);
    if (!bar.empty()) {
      fmt::format_to(it, "{} ", bar);
    }

    fmt::format_to(it, "{:>{}}{}", fmt::format("{:.2f}%", entry.percentage_), perc_width, PADDING);
    if (options.color_) {
      fmt::format_to(it, fmt::emphasis::bold, "{}", entry.command_);
    } else {
      fmt::format_to(it, "{}", entry.command_);
    }
    fmt::format_to(it, "\n");
  }
  return out;
}

std::string renderJson(std::span<RankedEntry const> entries) {
  using json = nlohmann::ordered_json;

  json output = json::array();
  for (auto const& entry : entries) {
    json item;
    item["command"]                       = entry.command_;
    item["count"]                         = entry.count_;
    item["percentage"]                    = round2(entry.percentage_);
    item["inverse_cumulative_percentage"] = round2(entry.inverse_cumulative_);
    output.push_back(std::move(item));
  }
  return output.dump(2) + "\n";
}

std::string csvEscape(std::string_view field) {
  if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
    return std::string{field};
  }
  std::string out = "\"";
  for (char c : field) {
    if (c == '"') {
      out += '"';
    }
    out += c;
  }
  out += '"';
  return out;
}

std::string renderCsv(std::span<RankedEntry const> entries) {
  std::string out = "command,count,percentage,inverse_cumulative_percentage\n";
  auto        it  = std::back_inserter(out);
  for (auto const& entry : entries) {
    fmt::format_to(
        it,
        "{},{},{:.2f},{:.2f}\n",
        csvEscape(entry.command_),
        entry.count_,
        entry.percentage_,
        entry.inverse_cumulative_
    );
  }
  return out;
}

std::string render(std::span<RankedEntry const> entries, RenderOptions const& options) {
  switch (options.format_) {
    case OutputFormat::Text: return renderText(entries, options);
    case OutputFormat::Json: return renderJson(entries);
    case OutputFormat::Csv: return renderCsv(entries);
  }
  return {};
}

bool useColor(ColorMode mode, bool is_terminal, bool no_color) noexcept {
  switch (mode) {
    case ColorMode::Always: return true;
    case ColorMode::Never: return false;
    case ColorMode::Auto: return is_terminal && !no_color;
  }
  return false;
}

bool stdoutIsTerminal() noexcept {
  return ::isatty(STDOUT_FILENO) == 1;
}

bool noColorRequested(char const* value) noexcept {
  return value != nullptr && *value != '\0';
}

} // namespace histop
