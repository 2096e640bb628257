#pragma once

#include <array>
#include <cstddef>
#include <string_view>

#define HISTOP_VERSION "0.4.0"
#define HISTOP_DETECT_SAMPLE_LINES 64

namespace histop {

inline constexpr std::string_view EXE_NAME = "histop";
inline constexpr std::string_view EXE_DESC = "Shell history command frequency analyzer";
inline constexpr std::string_view VERSION  = HISTOP_VERSION;

// Report defaults
inline constexpr size_t DEFAULT_COUNT     = 25;
inline constexpr size_t DEFAULT_BAR_SIZE  = 25;
inline constexpr size_t DEFAULT_MORE_THAN = 0;

// Number of non-empty lines handed to the format detector
inline constexpr size_t DETECT_SAMPLE_LINES = HISTOP_DETECT_SAMPLE_LINES;

inline constexpr std::array<std::string_view, 2> DEFAULT_WRAPPERS = {"sudo", "doas"};

// Tools whose first argument is reported along with the command when
// subcommand tracking is on ("git status" instead of "git").
inline constexpr std::array<std::string_view, 17> DEFAULT_SUBCOMMAND_TOOLS = {
    "git",
    "cargo",
    "npm",
    "yarn",
    "pnpm",
    "docker",
    "kubectl",
    "systemctl",
    "apt",
    "dnf",
    "pacman",
    "brew",
    "nix",
    "rustup",
    "go",
    "pip",
    "poetry",
};

} // namespace histop
