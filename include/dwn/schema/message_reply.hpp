#pragma once

#include <dwn/schema/error_code.hpp>
#include <dwn/schema/event.hpp>
#include <dwn/schema/primitives.hpp>
#include <dwn/schema/raw_message.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Schema type: message reply.
// Status plus whichever result set the handled method produces.
namespace dwn::schema {

inline constexpr uint32_t kStatusOk = 200;
inline constexpr uint32_t kStatusAccepted = 202;

template <uint16_t Version>
struct status;

template <>
struct status<1> final {
  uint32_t code{};
  std::string detail;
};

using status_t = status<1>;

template <uint16_t Version>
struct record_entry;

/// A message together with its payload when the node still holds it.
template <>
struct record_entry<1> final {
  content_id_t message_cid{};
  raw_message_t message;
  std::optional<bytes_t> data;
};

using record_entry_t = record_entry<1>;

template <uint16_t Version>
struct message_reply;

template <>
struct message_reply<1> final {
  status_t status;
  std::vector<record_entry_t> entries;
  std::optional<record_entry_t> record;
  std::vector<event_t> events;
};

using message_reply_t = message_reply<1>;

inline message_reply_t make_reply(const uint32_t code, std::string detail) {
  auto reply = message_reply_t{};
  reply.status.code = code;
  reply.status.detail = std::move(detail);
  return reply;
}

inline message_reply_t make_error_reply(const error_code_t code,
                                        std::string detail) {
  return make_reply(status_code_of(code), std::move(detail));
}

}  // namespace dwn::schema
