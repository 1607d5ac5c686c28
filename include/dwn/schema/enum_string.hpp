#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

// Closed enums that travel as names on the wire (interface, method,
// dateSort). Each enum declares a constexpr table of `wire_name` entries and
// specializes `try_from_string` over it.
namespace dwn::schema {

template <typename Enum>
using wire_name = std::pair<std::string_view, Enum>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const std::array<wire_name<Enum>, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const std::array<wire_name<Enum>, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

/// Only enums with a wire name table can be parsed.
template <typename Enum>
std::optional<Enum> try_from_string(std::string_view value) = delete;

}  // namespace dwn::schema
