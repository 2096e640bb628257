#pragma once

#include "histop/Error.hpp"

#include <charconv>
#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace histop {

template<typename T>
concept ArgType = std::convertible_to<T, std::string> || requires(T t, char const* ptr, char const* end) {
  std::from_chars(ptr, end, t);
};

class Option;
class Arguments;

class ArgumentParser {
  std::string         name_;
  std::string         desc_;
  std::string         usage_;
  std::vector<Option> options_;

public:
  explicit ArgumentParser(std::string name = "", std::string desc = "", std::string usage = "") noexcept;

  Result<Arguments> parse(int argc, char const* const* argv) const;
  Option&           addArgument(std::string name, std::string short_name = "");

  [[nodiscard]] std::string help() const;
};

class Option {
  std::string                name_;
  std::string                short_name_;
  std::string                description_;
  std::string                value_name_ = "value";
  std::optional<std::string> default_value_;
  size_t                     nargs_ = 0;

public:
  Option(std::string name, std::string short_name) noexcept;

  Option& desc(std::string desc) noexcept;
  Option& defaultValue(std::string value) noexcept;
  Option& nargs(size_t n) noexcept;
  Option& valueName(std::string name) noexcept;

  friend class ArgumentParser;
};

class Arguments {
  std::unordered_map<std::string, std::vector<std::string>> args_;
  std::unordered_map<std::string, bool>                     explicit_;

public:
  std::vector<std::string> positional_;

  Arguments() = default;

  // Present on the command line or through a default value
  [[nodiscard]] bool has(std::string const& name) const noexcept;
  // Present on the command line
  [[nodiscard]] bool given(std::string const& name) const noexcept;

  template<ArgType T>
  [[nodiscard]] std::optional<T> get(std::string const& name) const {
    auto it = args_.find(name);
    if (it == args_.end() || it->second.empty()) {
      return std::nullopt;
    }

    std::string const& str = it->second.front();

    if constexpr (std::convertible_to<T, std::string>) {
      return str;
    } else {
      T value = 0;

      auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
      if (ec != std::errc{} || ptr != str.data() + str.size()) {
        return std::nullopt;
      }
      return value;
    }
  }

  friend class ArgumentParser;
};

// The histop command line
ArgumentParser createArgParser();

void printVersion();

} // namespace histop
