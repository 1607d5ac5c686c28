#pragma once

#include <dwn/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: interface name.
// Top level grouping of message methods (descriptor.interface on the wire).
namespace dwn::schema {

enum class interface_name_t : uint8_t {
  records = 0,
  protocols = 1,
  events = 2,
  messages = 3
};

inline constexpr auto kInterfaceNameMappings = std::array{
    wire_name<interface_name_t>{"Records", interface_name_t::records},
    wire_name<interface_name_t>{"Protocols", interface_name_t::protocols},
    wire_name<interface_name_t>{"Events", interface_name_t::events},
    wire_name<interface_name_t>{"Messages", interface_name_t::messages}};

template <>
inline std::optional<interface_name_t> try_from_string<interface_name_t>(
    const std::string_view value) {
  return from_string(value, kInterfaceNameMappings);
}

inline constexpr std::string_view to_string(const interface_name_t value) {
  return to_string(value, kInterfaceNameMappings).value_or("unknown");
}

}  // namespace dwn::schema
