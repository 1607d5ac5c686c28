#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Schema type: index row.
// Flat projection of one stored message used to answer queries without
// decoding messages. Values are scalars so equality is well defined.
namespace dwn::schema {

inline constexpr auto kIndexInterface = std::string_view{"interface"};
inline constexpr auto kIndexMethod = std::string_view{"method"};
inline constexpr auto kIndexDateCreated = std::string_view{"dateCreated"};
inline constexpr auto kIndexRecordId = std::string_view{"recordId"};
inline constexpr auto kIndexAuthor = std::string_view{"author"};
inline constexpr auto kIndexProtocol = std::string_view{"protocol"};
inline constexpr auto kIndexProtocolPath = std::string_view{"protocolPath"};
inline constexpr auto kIndexSchema = std::string_view{"schema"};
inline constexpr auto kIndexRecipient = std::string_view{"recipient"};
inline constexpr auto kIndexDataFormat = std::string_view{"dataFormat"};
inline constexpr auto kIndexDataCid = std::string_view{"dataCid"};
inline constexpr auto kIndexDataSize = std::string_view{"dataSize"};
inline constexpr auto kIndexPublished = std::string_view{"published"};
inline constexpr auto kIndexIsLatestBaseState =
    std::string_view{"isLatestBaseState"};
inline constexpr auto kIndexInitialWrite = std::string_view{"initialWrite"};

using index_value_t = std::variant<std::string, uint64_t, bool>;

template <uint16_t Version>
struct index_entry;

template <>
struct index_entry<1> final {
  std::string name;
  index_value_t value;
};

using index_entry_t = index_entry<1>;
using index_row_t = std::vector<index_entry_t>;

inline const index_value_t* find_index(const index_row_t& row,
                                       const std::string_view name) {
  auto found = std::find_if(
      std::begin(row), std::end(row),
      [&](const index_entry_t& entry) { return entry.name == name; });
  if (found == std::end(row)) {
    return nullptr;
  }
  return &found->value;
}

/// True when every filter entry is present in `row` with an equal value.
inline bool matches(const index_row_t& row, const index_row_t& filter) {
  return std::all_of(
      std::begin(filter), std::end(filter), [&](const index_entry_t& wanted) {
        const auto* value = find_index(row, wanted.name);
        return value != nullptr && *value == wanted.value;
      });
}

}  // namespace dwn::schema
