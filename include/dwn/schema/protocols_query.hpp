#pragma once

#include <cstdint>
#include <optional>
#include <string>

// Schema type: protocols query descriptor.
namespace dwn::schema {

template <uint16_t Version>
struct protocols_filter;

template <>
struct protocols_filter<1> final {
  std::optional<std::string> protocol;
};

using protocols_filter_t = protocols_filter<1>;

template <uint16_t Version>
struct protocols_query_descriptor;

template <>
struct protocols_query_descriptor<1> final {
  std::string date_created;
  protocols_filter_t filter;
};

using protocols_query_descriptor_t = protocols_query_descriptor<1>;

}  // namespace dwn::schema
