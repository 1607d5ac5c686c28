#pragma once

#include <cstdint>
#include <optional>
#include <string>

// Schema type: events get descriptor.
// Reads the tenant event log strictly after `watermark` (from the start when
// absent).
namespace dwn::schema {

template <uint16_t Version>
struct events_get_descriptor;

template <>
struct events_get_descriptor<1> final {
  std::string date_created;
  std::optional<uint64_t> watermark;
};

using events_get_descriptor_t = events_get_descriptor<1>;

}  // namespace dwn::schema
