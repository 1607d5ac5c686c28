#pragma once

#include <dwn/schema/primitives.hpp>
#include <cstdint>

// Schema type: event log entry.
namespace dwn::schema {

template <uint16_t Version>
struct event;

template <>
struct event<1> final {
  uint64_t watermark{};
  content_id_t message_cid{};
};

using event_t = event<1>;

}  // namespace dwn::schema
