#pragma once

#include "histop/Constants.hpp"
#include "histop/Tokens.hpp"

#include <optional>
#include <string>
#include <vector>

namespace histop {

struct NormalizeOptions {
  std::vector<std::string> wrappers_{DEFAULT_WRAPPERS.begin(), DEFAULT_WRAPPERS.end()};
  bool                     strip_wrappers_    = true;
  bool                     track_subcommands_ = false;
  std::vector<std::string> subcommand_tools_{DEFAULT_SUBCOMMAND_TOOLS.begin(), DEFAULT_SUBCOMMAND_TOOLS.end()};
};

// NAME=value with an unquoted identifier NAME
bool isAssignment(Token const& token) noexcept;

// Reduce a segment to the command it runs: leading assignments and
// privilege wrappers are peeled off, the first remaining word is the
// command. Yields nothing for segments without a command ("FOO=bar").
std::optional<std::string> normalize(PipelineSegment const& segment, NormalizeOptions const& options = {});

} // namespace histop
