#include <dwn/core/index_projector.hpp>
#include <dwn/core/parse.hpp>
#include <dwn/handlers/record_state.hpp>
#include <dwn/handlers/records_delete.hpp>

#include <spdlog/spdlog.h>

namespace dwn::handlers {

using dwn::schema::error_code_t;
using dwn::schema::make_error_reply;

records_delete_handler::records_delete_handler(const handler_context& context)
    : context_{context} {}

dwn::schema::message_reply_t records_delete_handler::handle(
    const std::string_view tenant,
    const dwn::schema::raw_message_t& message,
    const std::optional<dwn::schema::bytes_t>&,
    const handler_options&) {
  auto error = std::string{};
  auto deletion = dwn::core::parse<dwn::schema::records_delete_descriptor_t>(
      message, error);
  if (!deletion) {
    return make_error_reply(error_code_t::malformed_message, error);
  }
  if (auto denied = context_.authenticator.authenticate(message)) {
    return *denied;
  }
  if (auto denied = dwn::core::authorize_tenant_only(tenant, deletion->author)) {
    return *denied;
  }

  const auto& record_id = deletion->descriptor.record_id;
  auto guard = context_.locks.lock(tenant, record_id);
  auto existing = context_.messages.query(
      tenant, dwn::core::record_messages_filter(record_id));
  auto versions = versions_of(existing);

  auto incoming = dwn::core::message_version{};
  incoming.date_created = deletion->descriptor.date_created;
  incoming.message_cid = deletion->message_cid;
  incoming.is_delete = true;
  auto resolution = dwn::core::resolve(versions, incoming);
  switch (resolution.outcome) {
    case dwn::core::resolution_t::not_found:
      return make_error_reply(error_code_t::record_not_found, "Not Found");
    case dwn::core::resolution_t::conflict:
      return make_error_reply(error_code_t::superseded_by_newer, "Conflict");
    case dwn::core::resolution_t::accept:
      break;
  }

  // The anchor is referenced from the delete row so the record id stays
  // bound to its first write.
  auto anchor = versions[*resolution.newest_existing].message_cid;
  if (auto initial = find_initial_write(existing)) {
    anchor = initial->message_cid;
  }

  auto watermark = context_.events.append(
      tenant, deletion->message_cid,
      context_.messages.stage_put(
          tenant, deletion->message_cid, message,
          dwn::core::project_records_delete(deletion->descriptor,
                                            deletion->author, anchor)));
  apply_prune(tenant, resolution.prune, context_.messages, context_.data);

  spdlog::info("Accepted RecordsDelete {} for record {} (event {})",
               dwn::schema::to_hex(deletion->message_cid), record_id,
               watermark);
  return dwn::schema::make_reply(dwn::schema::kStatusAccepted, "Accepted");
}

}  // namespace dwn::handlers
