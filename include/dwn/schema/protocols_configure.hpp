#pragma once

#include <dwn/schema/protocol_definition.hpp>
#include <cstdint>
#include <string>

// Schema type: protocols configure descriptor.
namespace dwn::schema {

template <uint16_t Version>
struct protocols_configure_descriptor;

template <>
struct protocols_configure_descriptor<1> final {
  std::string date_created;
  protocol_definition_t definition;
};

using protocols_configure_descriptor_t = protocols_configure_descriptor<1>;

}  // namespace dwn::schema
