#pragma once

#include <cstdint>
#include <string>

// Schema type: records delete descriptor.
namespace dwn::schema {

template <uint16_t Version>
struct records_delete_descriptor;

template <>
struct records_delete_descriptor<1> final {
  std::string date_created;
  std::string record_id;
};

using records_delete_descriptor_t = records_delete_descriptor<1>;

}  // namespace dwn::schema
