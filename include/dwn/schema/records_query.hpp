#pragma once

#include <dwn/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Schema type: records query descriptor.
// Equality filter over record index fields; only current versions of records
// are ever returned.
namespace dwn::schema {

enum class date_sort_t : uint8_t {
  created_ascending = 0,
  created_descending = 1
};

inline constexpr auto kDateSortMappings = std::array{
    wire_name<date_sort_t>{"createdAscending", date_sort_t::created_ascending},
    wire_name<date_sort_t>{"createdDescending",
                           date_sort_t::created_descending}};

template <>
inline std::optional<date_sort_t> try_from_string<date_sort_t>(
    const std::string_view value) {
  return from_string(value, kDateSortMappings);
}

inline constexpr std::string_view to_string(const date_sort_t value) {
  return to_string(value, kDateSortMappings).value_or("unknown");
}

template <uint16_t Version>
struct records_filter;

template <>
struct records_filter<1> final {
  std::optional<std::string> record_id;
  std::optional<std::string> protocol;
  std::optional<std::string> protocol_path;
  std::optional<std::string> schema;
  std::optional<std::string> recipient;
  std::optional<std::string> data_format;
};

using records_filter_t = records_filter<1>;

template <uint16_t Version>
struct records_query_descriptor;

template <>
struct records_query_descriptor<1> final {
  std::string date_created;
  records_filter_t filter;
  std::optional<std::string> date_sort;
};

using records_query_descriptor_t = records_query_descriptor<1>;

}  // namespace dwn::schema
