#include <dwn/core/index_projector.hpp>
#include <dwn/core/parse.hpp>
#include <dwn/handlers/protocols_configure.hpp>
#include <dwn/handlers/record_state.hpp>

#include <spdlog/spdlog.h>

namespace dwn::handlers {

using dwn::schema::error_code_t;
using dwn::schema::make_error_reply;

namespace {

constexpr auto kProtocolLockPrefix = std::string_view{"protocol:"};

}  // namespace

protocols_configure_handler::protocols_configure_handler(
    const handler_context& context)
    : context_{context} {}

dwn::schema::message_reply_t protocols_configure_handler::handle(
    const std::string_view tenant,
    const dwn::schema::raw_message_t& message,
    const std::optional<dwn::schema::bytes_t>&,
    const handler_options&) {
  auto error = std::string{};
  auto configure =
      dwn::core::parse<dwn::schema::protocols_configure_descriptor_t>(message,
                                                                      error);
  if (!configure) {
    return make_error_reply(error_code_t::malformed_message, error);
  }
  if (auto denied = context_.authenticator.authenticate(message)) {
    return *denied;
  }
  if (auto denied =
          dwn::core::authorize_tenant_only(tenant, configure->author)) {
    return *denied;
  }

  const auto& protocol = configure->descriptor.definition.protocol;
  auto guard =
      context_.locks.lock(tenant, std::string{kProtocolLockPrefix} + protocol);
  auto existing = context_.messages.query(
      tenant, dwn::core::configurations_filter(protocol));

  auto versions = std::vector<dwn::core::message_version>{};
  for (const auto& entry : existing) {
    const auto* date = dwn::schema::find_index(entry.stored.indexes,
                                               dwn::schema::kIndexDateCreated);
    auto version = dwn::core::message_version{};
    if (date != nullptr && std::holds_alternative<std::string>(*date)) {
      version.date_created = std::get<std::string>(*date);
    }
    version.message_cid = entry.message_cid;
    versions.push_back(std::move(version));
  }

  auto incoming = dwn::core::message_version{};
  incoming.date_created = configure->descriptor.date_created;
  incoming.message_cid = configure->message_cid;
  auto resolution = dwn::core::resolve_configuration(versions, incoming);
  if (resolution.outcome != dwn::core::resolution_t::accept) {
    return make_error_reply(error_code_t::superseded_by_newer, "Conflict");
  }

  auto watermark = context_.events.append(
      tenant, configure->message_cid,
      context_.messages.stage_put(
          tenant, configure->message_cid, message,
          dwn::core::project_protocols_configure(configure->descriptor,
                                                 configure->author, true)));
  apply_prune(tenant, resolution.prune, context_.messages, context_.data);

  spdlog::info("Accepted ProtocolsConfigure {} for {} (event {})",
               dwn::schema::to_hex(configure->message_cid), protocol,
               watermark);
  return dwn::schema::make_reply(dwn::schema::kStatusAccepted, "Accepted");
}

}  // namespace dwn::handlers
