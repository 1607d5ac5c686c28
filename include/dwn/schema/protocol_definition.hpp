#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: protocol definition.
// Declares the record types of a protocol and, per protocol path (type names
// joined with '/'), the actions any signer may perform on records at that
// path.
namespace dwn::schema {

inline constexpr auto kProtocolActionRead = std::string_view{"read"};
inline constexpr auto kProtocolActionWrite = std::string_view{"write"};

template <uint16_t Version>
struct protocol_type;

template <>
struct protocol_type<1> final {
  std::string name;
  std::optional<std::string> schema;
  std::vector<std::string> data_formats;
};

using protocol_type_t = protocol_type<1>;

template <uint16_t Version>
struct protocol_rule;

template <>
struct protocol_rule<1> final {
  std::string protocol_path;
  std::vector<std::string> anyone_can;
};

using protocol_rule_t = protocol_rule<1>;

template <uint16_t Version>
struct protocol_definition;

template <>
struct protocol_definition<1> final {
  std::string protocol;
  std::vector<protocol_type_t> types;
  std::vector<protocol_rule_t> rules;
};

using protocol_definition_t = protocol_definition<1>;

}  // namespace dwn::schema
