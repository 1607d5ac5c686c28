#pragma once

#include <dwn/core/auth.hpp>
#include <dwn/core/record_lock.hpp>
#include <dwn/core/tenant_gate.hpp>
#include <dwn/handlers/method_handler.hpp>
#include <dwn/schema/message_kind.hpp>
#include <dwn/schema/message_reply.hpp>
#include <dwn/schema/primitives.hpp>
#include <dwn/schema/raw_message.hpp>
#include <dwn/store/data_store.hpp>
#include <dwn/store/event_log.hpp>
#include <dwn/store/message_store.hpp>
#include <array>
#include <memory>
#include <optional>
#include <string_view>

namespace dwn::node {

/// Entry point of the node: admits or serves one message per call.
///
/// Every call runs the same pre-flight checks (tenant served, interface and
/// method present and known, expected pair for bound entry points) before
/// handing the message to the handler registered for its kind. Calls may
/// run concurrently; admissions for the same record are serialized.
class dispatcher final {
 public:
  /// Construct the dispatcher over its stores and key material.
  ///
  /// `require_strict_crypto` enables real signature verification; when false,
  /// signatures are bypassed for test and PoC setups.
  dispatcher(dwn::store::message_store& messages,
             dwn::store::data_store& data,
             dwn::store::event_log& events,
             dwn::core::key_resolver_t key_resolver,
             bool require_strict_crypto = true,
             dwn::core::tenant_gate_t tenant_gate =
                 dwn::core::allow_all_tenants());

  dispatcher(const dispatcher&) = delete;
  dispatcher& operator=(const dispatcher&) = delete;

  /// Route any message by its descriptor's interface and method.
  dwn::schema::message_reply_t process_message(
      std::string_view tenant,
      const dwn::schema::raw_message_t& message,
      const std::optional<dwn::schema::bytes_t>& data = std::nullopt);

  /// Same, starting from the SCALE encoding of the message.
  dwn::schema::message_reply_t process_message(
      std::string_view tenant,
      const dwn::schema::bytes_view_t& encoded_message,
      const std::optional<dwn::schema::bytes_t>& data = std::nullopt);

  dwn::schema::message_reply_t handle_records_read(
      std::string_view tenant,
      const dwn::schema::raw_message_t& message);

  dwn::schema::message_reply_t handle_messages_get(
      std::string_view tenant,
      const dwn::schema::raw_message_t& message);

  /// Privileged: admit a RecordsWrite without its payload, e.g. an initial
  /// write whose data was pruned on the node it is synchronized from.
  dwn::schema::message_reply_t synchronize_pruned_initial_records_write(
      std::string_view tenant,
      const dwn::schema::raw_message_t& message);

  /// Install runtime signature verifier callback.
  ///
  /// Ignored when strict-crypto mode is disabled.
  void set_signature_verifier(dwn::core::signature_verifier_t verifier);

 private:
  /// Kind of the message, or std::nullopt with `rejection` set.
  std::optional<dwn::schema::message_kind_t> preflight(
      std::string_view tenant,
      const dwn::schema::raw_message_t& message,
      std::optional<dwn::schema::message_kind_t> expected,
      dwn::schema::message_reply_t& rejection) const;

  dwn::schema::message_reply_t dispatch(
      std::string_view tenant,
      const dwn::schema::raw_message_t& message,
      const std::optional<dwn::schema::bytes_t>& data,
      std::optional<dwn::schema::message_kind_t> expected,
      const dwn::handlers::handler_options& options);

  dwn::core::authenticator authenticator_;
  dwn::core::record_lock_table locks_;
  dwn::core::tenant_gate_t tenant_gate_;
  std::array<std::unique_ptr<dwn::handlers::method_handler>,
             dwn::schema::kMessageKindCount>
      handlers_;
};

}  // namespace dwn::node
