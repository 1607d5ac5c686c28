#pragma once

#include <dwn/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: records write descriptor.
// Creates or replaces the current version of a logical record. The initial
// write of a record uses its own entry id as `record_id`.
namespace dwn::schema {

template <uint16_t Version>
struct records_write_descriptor;

template <>
struct records_write_descriptor<1> final {
  std::string date_created;
  std::string record_id;
  std::optional<std::string> protocol;
  std::optional<std::string> protocol_path;
  std::optional<std::string> schema;
  std::optional<std::string> recipient;
  std::string data_format;
  hash32_t data_cid{};
  uint64_t data_size{};
  bool published{};
};

using records_write_descriptor_t = records_write_descriptor<1>;

}  // namespace dwn::schema
