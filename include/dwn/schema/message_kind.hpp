#pragma once

#include <dwn/schema/interface_name.hpp>
#include <dwn/schema/method_name.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema type: message kind.
// Closed set of (interface, method) pairs the node knows how to handle.
namespace dwn::schema {

enum class message_kind_t : uint8_t {
  records_write = 0,
  records_delete = 1,
  records_query = 2,
  records_read = 3,
  protocols_configure = 4,
  protocols_query = 5,
  events_get = 6,
  messages_get = 7
};

inline constexpr std::size_t kMessageKindCount = 8;

inline constexpr std::optional<message_kind_t> classify(
    const interface_name_t interface_name,
    const method_name_t method) {
  switch (interface_name) {
    case interface_name_t::records:
      switch (method) {
        case method_name_t::write:
          return message_kind_t::records_write;
        case method_name_t::delete_:
          return message_kind_t::records_delete;
        case method_name_t::query:
          return message_kind_t::records_query;
        case method_name_t::read:
          return message_kind_t::records_read;
        default:
          return std::nullopt;
      }
    case interface_name_t::protocols:
      switch (method) {
        case method_name_t::configure:
          return message_kind_t::protocols_configure;
        case method_name_t::query:
          return message_kind_t::protocols_query;
        default:
          return std::nullopt;
      }
    case interface_name_t::events:
      if (method == method_name_t::get) {
        return message_kind_t::events_get;
      }
      return std::nullopt;
    case interface_name_t::messages:
      if (method == method_name_t::get) {
        return message_kind_t::messages_get;
      }
      return std::nullopt;
  }
  return std::nullopt;
}

inline constexpr std::pair<interface_name_t, method_name_t> names_of(
    const message_kind_t kind) {
  switch (kind) {
    case message_kind_t::records_write:
      return {interface_name_t::records, method_name_t::write};
    case message_kind_t::records_delete:
      return {interface_name_t::records, method_name_t::delete_};
    case message_kind_t::records_query:
      return {interface_name_t::records, method_name_t::query};
    case message_kind_t::records_read:
      return {interface_name_t::records, method_name_t::read};
    case message_kind_t::protocols_configure:
      return {interface_name_t::protocols, method_name_t::configure};
    case message_kind_t::protocols_query:
      return {interface_name_t::protocols, method_name_t::query};
    case message_kind_t::events_get:
      return {interface_name_t::events, method_name_t::get};
    case message_kind_t::messages_get:
      return {interface_name_t::messages, method_name_t::get};
  }
  return {interface_name_t::records, method_name_t::write};
}

}  // namespace dwn::schema
