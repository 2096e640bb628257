#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace histop {

std::string_view trim(std::string_view s) noexcept;
std::string_view trimEnd(std::string_view s) noexcept;

bool isBlank(char c) noexcept;
bool isBlank(std::string_view s) noexcept;
bool isAllDigits(std::string_view s) noexcept;

// NAME of a NAME=value assignment: ASCII letters, digits and underscore,
// not starting with a digit.
bool isValidIdentifier(std::string_view name) noexcept;

bool isValidUtf8(std::string_view bytes) noexcept;

// Undo zsh's history metafication: Meta (0x83) followed by c ^ 0x20.
std::string unmetafy(std::string_view bytes);

// Split on `delim`, trimming each part and dropping empty ones.
std::vector<std::string> splitList(std::string_view s, char delim);

std::optional<long long> parseInteger(std::string_view s) noexcept;

} // namespace histop
