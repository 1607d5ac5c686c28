#pragma once

#include <dwn/core/message_identity.hpp>
#include <dwn/schema/descriptor_traits.hpp>
#include <dwn/schema/encoding/scale/encoder.hpp>
#include <dwn/schema/raw_message.hpp>
#include <functional>
#include <optional>
#include <string>

// Client side construction of signed messages.
namespace dwn::core {

/// Produces a signature over the given bytes.
using signer_t = std::function<std::optional<dwn::schema::signature_t>(
    const dwn::schema::bytes_view_t& message)>;

struct message_signer final {
  std::string key_id;
  signer_t sign;
};

/// Wrap a descriptor in an unsigned raw message.
template <typename Descriptor>
dwn::schema::raw_message_t make_unsigned_message(const Descriptor& descriptor) {
  constexpr auto names =
      dwn::schema::names_of(dwn::schema::descriptor_traits<Descriptor>::kind);
  auto encoder = dwn::schema::encoding::encoder<
      dwn::schema::encoding::scale_encoder_tag>{};
  auto message = dwn::schema::raw_message_t{};
  message.descriptor.interface_name =
      std::string{dwn::schema::to_string(names.first)};
  message.descriptor.method = std::string{dwn::schema::to_string(names.second)};
  message.descriptor.fields = encoder.encode(descriptor);
  return message;
}

/// Attach an authorization signed by `signer`. Returns std::nullopt when the
/// signer fails.
std::optional<dwn::schema::raw_message_t> sign_message(
    dwn::schema::raw_message_t message,
    const message_signer& signer);

template <typename Descriptor>
std::optional<dwn::schema::raw_message_t> make_message(
    const Descriptor& descriptor,
    const message_signer& signer) {
  return sign_message(make_unsigned_message(descriptor), signer);
}

/// Turn `descriptor` into the initial write of a new record by `author`.
void assign_initial_record_id(
    dwn::schema::records_write_descriptor_t& descriptor,
    std::string_view author);

}  // namespace dwn::core
