#include <dwn/core/auth.hpp>
#include <dwn/core/index_projector.hpp>
#include <dwn/crypto/verify.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace dwn::core {

namespace {

using dwn::schema::error_code_t;
using dwn::schema::make_error_reply;

std::string_view record_type_of(const std::string_view protocol_path) {
  auto separator = protocol_path.rfind('/');
  if (separator == std::string_view::npos) {
    return protocol_path;
  }
  return protocol_path.substr(separator + 1);
}

bool anyone_can(const dwn::schema::protocol_definition_t& definition,
                const std::string_view protocol_path,
                const std::string_view action) {
  return std::any_of(
      std::begin(definition.rules), std::end(definition.rules),
      [&](const dwn::schema::protocol_rule_t& rule) {
        return rule.protocol_path == protocol_path &&
               std::find(std::begin(rule.anyone_can), std::end(rule.anyone_can),
                         action) != std::end(rule.anyone_can);
      });
}

std::optional<std::string> string_index(const dwn::schema::index_row_t& row,
                                        const std::string_view name) {
  const auto* value = dwn::schema::find_index(row, name);
  if (value == nullptr || !std::holds_alternative<std::string>(*value)) {
    return std::nullopt;
  }
  return std::get<std::string>(*value);
}

}  // namespace

void static_key_registry::add(std::string key_id,
                              dwn::schema::public_key_t public_key) {
  keys_.insert_or_assign(std::move(key_id), std::move(public_key));
}

std::optional<dwn::schema::public_key_t> static_key_registry::resolve(
    const std::string_view key_id) const {
  auto found = keys_.find(key_id);
  if (found == std::end(keys_)) {
    return std::nullopt;
  }
  return found->second;
}

key_resolver_t static_key_registry::resolver() const {
  return [registry = *this](const std::string_view key_id) {
    return registry.resolve(key_id);
  };
}

authenticator::authenticator(key_resolver_t resolver,
                             const bool require_strict_crypto)
    : resolver_{std::move(resolver)},
      verifier_{dwn::crypto::verify_signature},
      require_strict_crypto_{require_strict_crypto} {}

void authenticator::set_signature_verifier(signature_verifier_t verifier) {
  verifier_ = std::move(verifier);
}

std::optional<dwn::schema::message_reply_t> authenticator::authenticate(
    const dwn::schema::raw_message_t& message) const {
  if (!message.authorization || message.authorization->signatures.empty()) {
    return make_error_reply(error_code_t::authentication_failure,
                            "message is not signed");
  }
  const auto& authorization = *message.authorization;
  const auto& signature = authorization.signatures.front();

  auto public_key = std::optional<dwn::schema::public_key_t>{};
  try {
    if (resolver_) {
      public_key = resolver_(signature.key_id);
    }
  } catch (const std::exception& e) {
    spdlog::warn("Key resolution for '{}' failed: {}", signature.key_id,
                 e.what());
    return make_error_reply(error_code_t::authentication_failure,
                            "failed to resolve key " + signature.key_id);
  }
  if (!public_key) {
    spdlog::warn("Unknown signing key '{}'", signature.key_id);
    return make_error_reply(error_code_t::authentication_failure,
                            "unknown key " + signature.key_id);
  }

  if (!require_strict_crypto_) {
    return std::nullopt;
  }
  auto signed_bytes = signing_bytes_of(authorization.payload);
  auto verified = false;
  try {
    verified = verifier_ &&
               verifier_(dwn::schema::bytes_view_t{signed_bytes.data(),
                                                   signed_bytes.size()},
                         *public_key, signature.signature);
  } catch (const std::exception& e) {
    spdlog::warn("Signature verification for '{}' failed: {}",
                 signature.key_id, e.what());
    verified = false;
  }
  if (!verified) {
    spdlog::warn("Signature by '{}' does not verify", signature.key_id);
    return make_error_reply(error_code_t::authentication_failure,
                            "signature verification failed");
  }
  return std::nullopt;
}

std::optional<dwn::schema::message_reply_t> authorize_tenant_only(
    const std::string_view tenant,
    const std::string_view author) {
  if (author != tenant) {
    return make_error_reply(error_code_t::authorization_denied,
                            "message failed authorization: " +
                                std::string{author} + " is not the tenant");
  }
  return std::nullopt;
}

std::optional<dwn::schema::message_reply_t> authorize_records_write(
    const std::string_view tenant,
    const parsed_message<dwn::schema::records_write_descriptor_t>& write,
    const std::optional<dwn::schema::protocol_definition_t>& definition) {
  const auto& descriptor = write.descriptor;
  if (!descriptor.protocol) {
    return authorize_tenant_only(tenant, write.author);
  }
  if (!definition) {
    return make_error_reply(error_code_t::authorization_denied,
                            "protocol " + *descriptor.protocol +
                                " is not configured");
  }

  auto type_name = record_type_of(descriptor.protocol_path.value_or(""));
  auto type = std::find_if(std::begin(definition->types),
                           std::end(definition->types),
                           [&](const dwn::schema::protocol_type_t& candidate) {
                             return candidate.name == type_name;
                           });
  if (type == std::end(definition->types)) {
    return make_error_reply(error_code_t::authorization_denied,
                            "record type '" + std::string{type_name} +
                                "' is not declared by the protocol");
  }
  if (type->schema && type->schema != descriptor.schema) {
    return make_error_reply(error_code_t::authorization_denied,
                            "schema does not match record type '" +
                                type->name + "'");
  }
  if (!type->data_formats.empty() &&
      std::find(std::begin(type->data_formats), std::end(type->data_formats),
                descriptor.data_format) == std::end(type->data_formats)) {
    return make_error_reply(error_code_t::authorization_denied,
                            "data format '" + descriptor.data_format +
                                "' is not allowed for '" + type->name + "'");
  }

  if (write.author == tenant ||
      anyone_can(*definition, *descriptor.protocol_path,
                 dwn::schema::kProtocolActionWrite)) {
    return std::nullopt;
  }
  return make_error_reply(error_code_t::authorization_denied,
                          "no protocol rule lets " + write.author +
                              " write " + *descriptor.protocol_path);
}

bool can_read(const std::string_view tenant,
              const std::string_view requester,
              const dwn::schema::records_write_descriptor_t& record,
              const std::string_view record_author,
              const std::optional<dwn::schema::protocol_definition_t>& definition) {
  if (requester == tenant || requester == record_author || record.published) {
    return true;
  }
  if (record.recipient && *record.recipient == requester) {
    return true;
  }
  return definition && record.protocol_path &&
         anyone_can(*definition, *record.protocol_path,
                    dwn::schema::kProtocolActionRead);
}

bool is_visible_to(
    const std::string_view tenant,
    const std::string_view requester,
    const dwn::schema::index_row_t& row,
    const std::optional<dwn::schema::protocol_definition_t>& definition) {
  if (requester == tenant) {
    return true;
  }
  const auto* published =
      dwn::schema::find_index(row, dwn::schema::kIndexPublished);
  if (published != nullptr && *published == dwn::schema::index_value_t{true}) {
    return true;
  }
  if (string_index(row, dwn::schema::kIndexAuthor) == requester ||
      string_index(row, dwn::schema::kIndexRecipient) == requester) {
    return true;
  }
  auto protocol_path = string_index(row, dwn::schema::kIndexProtocolPath);
  return definition && protocol_path &&
         anyone_can(*definition, *protocol_path,
                    dwn::schema::kProtocolActionRead);
}

std::optional<dwn::schema::protocol_definition_t> find_protocol_definition(
    const dwn::store::message_store& messages,
    const std::string_view tenant,
    const std::string_view protocol) {
  auto entries = messages.query(
      tenant, configurations_filter(std::string{protocol}));
  if (entries.empty()) {
    return std::nullopt;
  }
  // Entries come back in (dateCreated, cid) order.
  auto error = std::string{};
  auto descriptor =
      decode_descriptor<dwn::schema::protocols_configure_descriptor_t>(
          entries.back().stored.message.descriptor, error);
  if (!descriptor) {
    spdlog::error("Stored configuration of {} does not decode: {}", protocol,
                  error);
    return std::nullopt;
  }
  return descriptor->definition;
}

}  // namespace dwn::core
