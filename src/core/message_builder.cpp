#include <dwn/core/message_builder.hpp>

namespace dwn::core {

std::optional<dwn::schema::raw_message_t> sign_message(
    dwn::schema::raw_message_t message,
    const message_signer& signer) {
  auto authorization = dwn::schema::authorization_t{};
  authorization.payload.descriptor_cid = descriptor_cid_of(message.descriptor);
  auto signed_bytes = signing_bytes_of(authorization.payload);
  if (!signer.sign) {
    return std::nullopt;
  }
  auto signature = signer.sign(
      dwn::schema::bytes_view_t{signed_bytes.data(), signed_bytes.size()});
  if (!signature) {
    return std::nullopt;
  }
  authorization.signatures.push_back(
      dwn::schema::signature_entry_t{signer.key_id, *signature});
  message.authorization = std::move(authorization);
  return message;
}

void assign_initial_record_id(
    dwn::schema::records_write_descriptor_t& descriptor,
    const std::string_view author) {
  descriptor.record_id = dwn::schema::to_hex(entry_id_of(descriptor, author));
}

}  // namespace dwn::core
