#pragma once

#include "histop/Constants.hpp"
#include "histop/Error.hpp"
#include "histop/Frequency.hpp"

#include <span>
#include <string>
#include <string_view>

namespace histop {

enum class OutputFormat { Text, Json, Csv };
enum class ColorMode { Auto, Always, Never };

Result<OutputFormat> parseOutputFormat(std::string_view name);
Result<ColorMode>    parseColorMode(std::string_view name);

struct BarOptions {
  size_t size_      = DEFAULT_BAR_SIZE;
  bool   show_bar_  = true;
  bool   show_perc_ = true; // filled part, the entry's own share
  bool   show_cumu_ = true; // semi-filled part, the share of lower ranks
};

struct RenderOptions {
  OutputFormat format_ = OutputFormat::Text;
  BarOptions   bar_;
  bool         color_ = false;
};

// "│░░▓▓██│" for one entry, or "" when nothing is to be drawn.
std::string renderBar(double percentage, double inverse_cumulative, BarOptions const& options, bool color = false);

std::string renderText(std::span<RankedEntry const> entries, RenderOptions const& options);
std::string renderJson(std::span<RankedEntry const> entries);
std::string renderCsv(std::span<RankedEntry const> entries);

std::string render(std::span<RankedEntry const> entries, RenderOptions const& options);

// RFC 4180 quoting for one field
std::string csvEscape(std::string_view field);

// Auto means a terminal without NO_COLOR
bool useColor(ColorMode mode, bool is_terminal, bool no_color) noexcept;
bool stdoutIsTerminal() noexcept;

// NO_COLOR counts only when set to a non-empty value
bool noColorRequested(char const* value) noexcept;

} // namespace histop
