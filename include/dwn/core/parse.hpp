#pragma once

#include <dwn/core/message_identity.hpp>
#include <dwn/schema/descriptor_traits.hpp>
#include <dwn/schema/encoding/scale/encoder.hpp>
#include <dwn/schema/raw_message.hpp>
#include <dwn/schema/timestamp.hpp>
#include <optional>
#include <string>

namespace dwn::core {

/// A raw message whose descriptor decoded, validated and passed the
/// authorization integrity checks. The author is derived, never sent.
template <typename Descriptor>
struct parsed_message final {
  dwn::schema::raw_message_t raw;
  Descriptor descriptor;
  dwn::schema::content_id_t message_cid{};
  std::string author;
};

bool validate(const dwn::schema::records_write_descriptor_t& descriptor,
              std::string& error);
bool validate(const dwn::schema::records_delete_descriptor_t& descriptor,
              std::string& error);
bool validate(const dwn::schema::records_query_descriptor_t& descriptor,
              std::string& error);
bool validate(const dwn::schema::records_read_descriptor_t& descriptor,
              std::string& error);
bool validate(const dwn::schema::protocols_configure_descriptor_t& descriptor,
              std::string& error);
bool validate(const dwn::schema::protocols_query_descriptor_t& descriptor,
              std::string& error);
bool validate(const dwn::schema::events_get_descriptor_t& descriptor,
              std::string& error);
bool validate(const dwn::schema::messages_get_descriptor_t& descriptor,
              std::string& error);

/// Authorization present, exactly one signature with a `<did>#<fragment>`
/// key id, and a payload committing to this descriptor.
bool check_integrity(const dwn::schema::raw_message_t& message,
                     std::string& error);

template <typename Descriptor>
std::optional<Descriptor> decode_descriptor(
    const dwn::schema::raw_descriptor_t& raw,
    std::string& error) {
  auto encoder = dwn::schema::encoding::encoder<
      dwn::schema::encoding::scale_encoder_tag>{};
  auto decoded = encoder.try_decode<Descriptor>(
      dwn::schema::bytes_view_t{raw.fields.data(), raw.fields.size()});
  if (!decoded) {
    error = "descriptor fields do not decode";
    return std::nullopt;
  }
  // Content ids hash the raw bytes, so only the canonical encoding of a
  // descriptor is accepted.
  if (encoder.encode(*decoded) != raw.fields) {
    error = "descriptor fields are not canonically encoded";
    return std::nullopt;
  }
  return decoded;
}

template <typename Descriptor>
std::optional<parsed_message<Descriptor>> parse(
    const dwn::schema::raw_message_t& raw,
    std::string& error) {
  constexpr auto names =
      dwn::schema::names_of(dwn::schema::descriptor_traits<Descriptor>::kind);
  if (raw.descriptor.interface_name != dwn::schema::to_string(names.first) ||
      raw.descriptor.method != dwn::schema::to_string(names.second)) {
    error = "descriptor does not match " +
            std::string{dwn::schema::to_string(names.first)} +
            std::string{dwn::schema::to_string(names.second)};
    return std::nullopt;
  }

  auto descriptor = decode_descriptor<Descriptor>(raw.descriptor, error);
  if (!descriptor) {
    return std::nullopt;
  }
  if (!dwn::schema::is_valid_timestamp(descriptor->date_created)) {
    error = "dateCreated '" + descriptor->date_created +
            "' is not a microsecond precision UTC timestamp";
    return std::nullopt;
  }
  if (!validate(*descriptor, error) || !check_integrity(raw, error)) {
    return std::nullopt;
  }

  auto out = parsed_message<Descriptor>{};
  out.raw = raw;
  out.descriptor = std::move(*descriptor);
  out.message_cid = identity_of(raw);
  out.author = author_of(raw).value_or(std::string{});
  return out;
}

}  // namespace dwn::core
