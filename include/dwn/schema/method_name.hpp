#pragma once

#include <dwn/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: method name (descriptor.method on the wire).
namespace dwn::schema {

enum class method_name_t : uint8_t {
  write = 0,
  delete_ = 1,
  query = 2,
  read = 3,
  configure = 4,
  get = 5
};

inline constexpr auto kMethodNameMappings = std::array{
    wire_name<method_name_t>{"Write", method_name_t::write},
    wire_name<method_name_t>{"Delete", method_name_t::delete_},
    wire_name<method_name_t>{"Query", method_name_t::query},
    wire_name<method_name_t>{"Read", method_name_t::read},
    wire_name<method_name_t>{"Configure", method_name_t::configure},
    wire_name<method_name_t>{"Get", method_name_t::get}};

template <>
inline std::optional<method_name_t> try_from_string<method_name_t>(
    const std::string_view value) {
  return from_string(value, kMethodNameMappings);
}

inline constexpr std::string_view to_string(const method_name_t value) {
  return to_string(value, kMethodNameMappings).value_or("unknown");
}

}  // namespace dwn::schema
