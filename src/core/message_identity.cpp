#include <dwn/blake3/hash.hpp>
#include <dwn/core/message_identity.hpp>
#include <dwn/schema/encoding/scale/encoder.hpp>

#include <tuple>

namespace dwn::core {

namespace {

using encoder_t = dwn::schema::encoding::encoder<
    dwn::schema::encoding::scale_encoder_tag>;

template <typename T>
dwn::schema::content_id_t hash_encoded(const T& value) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(value);
  return dwn::blake3::hash(
      dwn::schema::bytes_view_t{encoded.data(), encoded.size()});
}

}  // namespace

dwn::schema::content_id_t identity_of(
    const dwn::schema::raw_message_t& message) {
  return hash_encoded(message);
}

dwn::schema::content_id_t descriptor_cid_of(
    const dwn::schema::raw_descriptor_t& descriptor) {
  return hash_encoded(descriptor);
}

dwn::schema::bytes_t signing_bytes_of(
    const dwn::schema::authorization_payload_t& payload) {
  auto encoder = encoder_t{};
  return encoder.encode(payload);
}

dwn::schema::content_id_t entry_id_of(
    const dwn::schema::records_write_descriptor_t& descriptor,
    const std::string_view author) {
  auto entry = descriptor;
  entry.record_id.clear();
  return hash_encoded(std::tuple{entry, std::string{author}});
}

bool is_initial_write(const dwn::schema::records_write_descriptor_t& descriptor,
                      const std::string_view author) {
  auto entry_id = entry_id_of(descriptor, author);
  return descriptor.record_id == dwn::schema::to_hex(entry_id);
}

std::optional<std::string> author_of_key_id(const std::string_view key_id) {
  auto separator = key_id.find('#');
  if (separator == std::string_view::npos || separator == 0 ||
      separator + 1 == key_id.size()) {
    return std::nullopt;
  }
  return std::string{key_id.substr(0, separator)};
}

std::optional<std::string> author_of(const dwn::schema::raw_message_t& message) {
  if (!message.authorization || message.authorization->signatures.empty()) {
    return std::nullopt;
  }
  return author_of_key_id(message.authorization->signatures.front().key_id);
}

}  // namespace dwn::core
