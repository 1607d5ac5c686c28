#pragma once

#include <cstdint>
#include <string>

// Schema type: records read descriptor.
namespace dwn::schema {

template <uint16_t Version>
struct records_read_descriptor;

template <>
struct records_read_descriptor<1> final {
  std::string date_created;
  std::string record_id;
};

using records_read_descriptor_t = records_read_descriptor<1>;

}  // namespace dwn::schema
