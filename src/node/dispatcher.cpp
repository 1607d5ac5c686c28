#include <dwn/node/dispatcher.hpp>
#include <dwn/schema/encoding/scale/encoder.hpp>
#include <dwn/schema/interface_name.hpp>
#include <dwn/schema/method_name.hpp>

#include <spdlog/spdlog.h>

namespace dwn::node {

using dwn::schema::error_code_t;
using dwn::schema::make_error_reply;
using dwn::schema::message_kind_t;

dispatcher::dispatcher(dwn::store::message_store& messages,
                       dwn::store::data_store& data,
                       dwn::store::event_log& events,
                       dwn::core::key_resolver_t key_resolver,
                       const bool require_strict_crypto,
                       dwn::core::tenant_gate_t tenant_gate)
    : authenticator_{std::move(key_resolver), require_strict_crypto},
      tenant_gate_{std::move(tenant_gate)} {
  auto context = dwn::handlers::handler_context{messages, data, events,
                                                authenticator_, locks_};
  for (std::size_t i = 0; i < handlers_.size(); ++i) {
    handlers_[i] =
        dwn::handlers::make_handler(static_cast<message_kind_t>(i), context);
  }
  if (!require_strict_crypto) {
    spdlog::warn("Signature verification is disabled");
  }
}

dwn::schema::message_reply_t dispatcher::process_message(
    const std::string_view tenant,
    const dwn::schema::raw_message_t& message,
    const std::optional<dwn::schema::bytes_t>& data) {
  return dispatch(tenant, message, data, std::nullopt, {});
}

dwn::schema::message_reply_t dispatcher::process_message(
    const std::string_view tenant,
    const dwn::schema::bytes_view_t& encoded_message,
    const std::optional<dwn::schema::bytes_t>& data) {
  auto encoder = dwn::schema::encoding::encoder<
      dwn::schema::encoding::scale_encoder_tag>{};
  auto message = encoder.try_decode<dwn::schema::raw_message_t>(encoded_message);
  if (!message) {
    return make_error_reply(error_code_t::malformed_message,
                            "message bytes do not decode");
  }
  return dispatch(tenant, *message, data, std::nullopt, {});
}

dwn::schema::message_reply_t dispatcher::handle_records_read(
    const std::string_view tenant,
    const dwn::schema::raw_message_t& message) {
  return dispatch(tenant, message, std::nullopt, message_kind_t::records_read,
                  {});
}

dwn::schema::message_reply_t dispatcher::handle_messages_get(
    const std::string_view tenant,
    const dwn::schema::raw_message_t& message) {
  return dispatch(tenant, message, std::nullopt, message_kind_t::messages_get,
                  {});
}

dwn::schema::message_reply_t
dispatcher::synchronize_pruned_initial_records_write(
    const std::string_view tenant,
    const dwn::schema::raw_message_t& message) {
  return dispatch(tenant, message, std::nullopt, message_kind_t::records_write,
                  dwn::handlers::handler_options{.skip_data_storage = true});
}

void dispatcher::set_signature_verifier(
    dwn::core::signature_verifier_t verifier) {
  authenticator_.set_signature_verifier(std::move(verifier));
}

std::optional<message_kind_t> dispatcher::preflight(
    const std::string_view tenant,
    const dwn::schema::raw_message_t& message,
    const std::optional<message_kind_t> expected,
    dwn::schema::message_reply_t& rejection) const {
  if (!tenant_gate_ || !tenant_gate_(tenant)) {
    rejection = make_error_reply(error_code_t::tenant_not_served,
                                 std::string{tenant} + " is not a tenant");
    return std::nullopt;
  }

  const auto& interface_name = message.descriptor.interface_name;
  const auto& method = message.descriptor.method;
  if (interface_name.empty() || method.empty()) {
    rejection = make_error_reply(
        error_code_t::malformed_message,
        "Both interface and method must be present, interface: " +
            interface_name + ", method: " + method);
    return std::nullopt;
  }

  if (expected) {
    auto [expected_interface, expected_method] =
        dwn::schema::names_of(*expected);
    if (interface_name != dwn::schema::to_string(expected_interface)) {
      rejection = make_error_reply(
          error_code_t::malformed_message,
          "Expected interface " +
              std::string{dwn::schema::to_string(expected_interface)} +
              ", received " + interface_name);
      return std::nullopt;
    }
    if (method != dwn::schema::to_string(expected_method)) {
      rejection = make_error_reply(
          error_code_t::malformed_message,
          "Expected method " +
              std::string{dwn::schema::to_string(expected_interface)} +
              std::string{dwn::schema::to_string(expected_method)} +
              ", received " + interface_name + method);
      return std::nullopt;
    }
  }

  auto parsed_interface =
      dwn::schema::try_from_string<dwn::schema::interface_name_t>(
          interface_name);
  auto parsed_method =
      dwn::schema::try_from_string<dwn::schema::method_name_t>(method);
  auto kind = parsed_interface && parsed_method
                  ? dwn::schema::classify(*parsed_interface, *parsed_method)
                  : std::nullopt;
  if (!kind) {
    rejection = make_error_reply(
        error_code_t::malformed_message,
        "Unsupported message " + interface_name + method);
    return std::nullopt;
  }
  return kind;
}

dwn::schema::message_reply_t dispatcher::dispatch(
    const std::string_view tenant,
    const dwn::schema::raw_message_t& message,
    const std::optional<dwn::schema::bytes_t>& data,
    const std::optional<message_kind_t> expected,
    const dwn::handlers::handler_options& options) {
  auto rejection = dwn::schema::message_reply_t{};
  auto kind = preflight(tenant, message, expected, rejection);
  if (!kind) {
    spdlog::debug("Pre-flight rejected message for '{}': {}", tenant,
                  rejection.status.detail);
    return rejection;
  }
  auto& handler = handlers_[static_cast<std::size_t>(*kind)];
  return handler->handle(tenant, message, data, options);
}

}  // namespace dwn::node
