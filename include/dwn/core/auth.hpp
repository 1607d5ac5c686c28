#pragma once

#include <dwn/core/parse.hpp>
#include <dwn/schema/index_row.hpp>
#include <dwn/schema/message_reply.hpp>
#include <dwn/schema/primitives.hpp>
#include <dwn/schema/protocol_definition.hpp>
#include <dwn/schema/raw_message.hpp>
#include <dwn/schema/records_write.hpp>
#include <dwn/store/message_store.hpp>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace dwn::core {

/// Resolves a `<did>#<fragment>` key id to its current public key. May throw;
/// any failure is treated as unauthenticated.
using key_resolver_t =
    std::function<std::optional<dwn::schema::public_key_t>(
        std::string_view key_id)>;

using signature_verifier_t =
    std::function<bool(const dwn::schema::bytes_view_t& message,
                       const dwn::schema::public_key_t& public_key,
                       const dwn::schema::signature_t& signature)>;

/// Keys registered up front, e.g. from configuration.
class static_key_registry final {
 public:
  void add(std::string key_id, dwn::schema::public_key_t public_key);

  std::optional<dwn::schema::public_key_t> resolve(
      std::string_view key_id) const;

  /// Resolver over a snapshot of the registered keys.
  key_resolver_t resolver() const;

 private:
  std::map<std::string, dwn::schema::public_key_t, std::less<>> keys_;
};

/// Checks that a message's signature was produced by the key it names.
class authenticator final {
 public:
  /// `require_strict_crypto` enables real signature verification; when false
  /// the key must still resolve but signatures are not checked.
  explicit authenticator(key_resolver_t resolver,
                         bool require_strict_crypto = true);

  /// Install runtime signature verifier callback.
  ///
  /// Ignored when strict-crypto mode is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

  /// Error reply (401) when the message is not authentic, std::nullopt
  /// otherwise. Expects a message that passed check_integrity.
  std::optional<dwn::schema::message_reply_t> authenticate(
      const dwn::schema::raw_message_t& message) const;

 private:
  key_resolver_t resolver_;
  signature_verifier_t verifier_;
  bool require_strict_crypto_{true};
};

/// Error reply (401) unless the author is the tenant.
std::optional<dwn::schema::message_reply_t> authorize_tenant_only(
    std::string_view tenant,
    std::string_view author);

/// The tenant may write anything its protocol allows; anyone else needs a
/// protocol rule granting `write` at the record's protocol path.
std::optional<dwn::schema::message_reply_t> authorize_records_write(
    std::string_view tenant,
    const parsed_message<dwn::schema::records_write_descriptor_t>& write,
    const std::optional<dwn::schema::protocol_definition_t>& definition);

/// Tenant, record author, recipient, published records, or a protocol rule
/// granting `read`.
bool can_read(std::string_view tenant,
              std::string_view requester,
              const dwn::schema::records_write_descriptor_t& record,
              std::string_view record_author,
              const std::optional<dwn::schema::protocol_definition_t>& definition);

/// Query visibility of a current write row for `requester`; the same grants
/// as `can_read`, evaluated over the row's indexes. `definition` is the
/// configuration of the row's protocol, if it has one.
bool is_visible_to(
    std::string_view tenant,
    std::string_view requester,
    const dwn::schema::index_row_t& row,
    const std::optional<dwn::schema::protocol_definition_t>& definition);

/// Newest persisted definition of `protocol` for the tenant.
std::optional<dwn::schema::protocol_definition_t> find_protocol_definition(
    const dwn::store::message_store& messages,
    std::string_view tenant,
    std::string_view protocol);

}  // namespace dwn::core
