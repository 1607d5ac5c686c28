#pragma once

#include <dwn/schema/index_row.hpp>
#include <dwn/schema/raw_message.hpp>
#include <cstdint>

// Schema type: stored message.
// Value persisted by the message store: the message and the index row it was
// admitted with.
namespace dwn::schema {

template <uint16_t Version>
struct stored_message;

template <>
struct stored_message<1> final {
  raw_message_t message;
  index_row_t indexes;
};

using stored_message_t = stored_message<1>;

}  // namespace dwn::schema
