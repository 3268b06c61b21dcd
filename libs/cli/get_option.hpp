#pragma once

#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

/// Removes every occurence of `flag` from `args` and reports if there was any.
bool get_flag(std::span<char*>& args, std::string_view flag) noexcept;

/// Removes the first `option VALUE` pair from `args` and returns VALUE or nullptr if there is no such pair.
const char* get_option(std::span<char*>& args, std::string_view option) noexcept;

/// Same as get_option for an option with two spellings. The pair which comes first wins whatever spelling it uses.
const char* get_either_option(
    std::span<char*>& args, std::string_view option, std::string_view alias
) noexcept;

template <typename T>
std::decay_t<T> get_option(std::span<char*>& args, std::string_view option, T&& default_val) noexcept {
  const char* val = get_option(args, option);
  if (!val)
    return std::forward<T>(default_val);
  return std::decay_t<T>{val};
}
