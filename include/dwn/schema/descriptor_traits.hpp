#pragma once

#include <dwn/schema/events_get.hpp>
#include <dwn/schema/message_kind.hpp>
#include <dwn/schema/messages_get.hpp>
#include <dwn/schema/protocols_configure.hpp>
#include <dwn/schema/protocols_query.hpp>
#include <dwn/schema/records_delete.hpp>
#include <dwn/schema/records_query.hpp>
#include <dwn/schema/records_read.hpp>
#include <dwn/schema/records_write.hpp>

// Schema type: descriptor traits.
// Binds each method descriptor to the message kind it is carried under.
namespace dwn::schema {

template <typename Descriptor>
struct descriptor_traits;

template <>
struct descriptor_traits<records_write_descriptor_t> final {
  static constexpr auto kind = message_kind_t::records_write;
};

template <>
struct descriptor_traits<records_delete_descriptor_t> final {
  static constexpr auto kind = message_kind_t::records_delete;
};

template <>
struct descriptor_traits<records_query_descriptor_t> final {
  static constexpr auto kind = message_kind_t::records_query;
};

template <>
struct descriptor_traits<records_read_descriptor_t> final {
  static constexpr auto kind = message_kind_t::records_read;
};

template <>
struct descriptor_traits<protocols_configure_descriptor_t> final {
  static constexpr auto kind = message_kind_t::protocols_configure;
};

template <>
struct descriptor_traits<protocols_query_descriptor_t> final {
  static constexpr auto kind = message_kind_t::protocols_query;
};

template <>
struct descriptor_traits<events_get_descriptor_t> final {
  static constexpr auto kind = message_kind_t::events_get;
};

template <>
struct descriptor_traits<messages_get_descriptor_t> final {
  static constexpr auto kind = message_kind_t::messages_get;
};

}  // namespace dwn::schema
