#include <dwn/blake3/hash.hpp>
#include <dwn/core/index_projector.hpp>
#include <dwn/core/parse.hpp>
#include <dwn/handlers/record_state.hpp>
#include <dwn/handlers/records_write.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace dwn::handlers {

namespace {

using dwn::schema::error_code_t;
using dwn::schema::make_error_reply;

// Properties fixed by the initial write of a record.
std::optional<std::string> immutable_mismatch(
    const dwn::schema::records_write_descriptor_t& incoming,
    const dwn::schema::records_write_descriptor_t& initial) {
  if (incoming.protocol != initial.protocol) {
    return std::string{"protocol"};
  }
  if (incoming.protocol_path != initial.protocol_path) {
    return std::string{"protocolPath"};
  }
  if (incoming.schema != initial.schema) {
    return std::string{"schema"};
  }
  if (incoming.recipient != initial.recipient) {
    return std::string{"recipient"};
  }
  return std::nullopt;
}

std::optional<dwn::schema::bytes_t> reusable_payload(
    const std::string_view tenant,
    const dwn::schema::records_write_descriptor_t& incoming,
    const std::vector<dwn::store::message_entry>& existing,
    const dwn::store::data_store& data) {
  for (auto entry = std::rbegin(existing); entry != std::rend(existing);
       ++entry) {
    auto write = decode_write(*entry);
    if (!write || write->descriptor.data_cid != incoming.data_cid) {
      continue;
    }
    if (auto payload = data.get(tenant, entry->message_cid)) {
      return payload;
    }
  }
  return std::nullopt;
}

}  // namespace

records_write_handler::records_write_handler(const handler_context& context)
    : context_{context} {}

dwn::schema::message_reply_t records_write_handler::handle(
    const std::string_view tenant,
    const dwn::schema::raw_message_t& message,
    const std::optional<dwn::schema::bytes_t>& data,
    const handler_options& options) {
  auto error = std::string{};
  auto write =
      dwn::core::parse<dwn::schema::records_write_descriptor_t>(message, error);
  if (!write) {
    return make_error_reply(error_code_t::malformed_message, error);
  }
  const auto& descriptor = write->descriptor;

  if (auto denied = context_.authenticator.authenticate(message)) {
    return *denied;
  }
  auto definition = std::optional<dwn::schema::protocol_definition_t>{};
  if (descriptor.protocol) {
    definition = dwn::core::find_protocol_definition(context_.messages, tenant,
                                                     *descriptor.protocol);
  }
  if (auto denied =
          dwn::core::authorize_records_write(tenant, *write, definition)) {
    return *denied;
  }

  if (data && !options.skip_data_storage) {
    auto data_cid =
        dwn::blake3::hash(dwn::schema::bytes_view_t{data->data(), data->size()});
    if (data_cid != descriptor.data_cid) {
      return make_error_reply(error_code_t::malformed_message,
                              "payload does not match dataCid");
    }
    if (data->size() != descriptor.data_size) {
      return make_error_reply(error_code_t::malformed_message,
                              "payload does not match dataSize");
    }
  }

  auto guard = context_.locks.lock(tenant, descriptor.record_id);
  auto existing = context_.messages.query(
      tenant, dwn::core::record_messages_filter(descriptor.record_id));

  auto incoming_is_initial =
      dwn::core::is_initial_write(descriptor, write->author);
  if (!incoming_is_initial) {
    auto initial = find_initial_write(existing);
    if (!initial) {
      return make_error_reply(error_code_t::malformed_message,
                              "initial write of record " +
                                  descriptor.record_id + " not found");
    }
    if (auto mismatch = immutable_mismatch(descriptor, initial->descriptor)) {
      return make_error_reply(error_code_t::malformed_message,
                              *mismatch +
                                  " differs from the initial write of record " +
                                  descriptor.record_id);
    }
  }

  auto incoming = dwn::core::message_version{};
  incoming.date_created = descriptor.date_created;
  incoming.message_cid = write->message_cid;
  incoming.is_initial_write = incoming_is_initial;
  auto resolution = dwn::core::resolve(versions_of(existing), incoming);
  if (resolution.outcome != dwn::core::resolution_t::accept) {
    spdlog::debug("RecordsWrite {} superseded for record {}",
                  dwn::schema::to_hex(write->message_cid), descriptor.record_id);
    return make_error_reply(error_code_t::superseded_by_newer, "Conflict");
  }

  auto payload = std::optional<dwn::schema::bytes_t>{};
  if (!options.skip_data_storage) {
    payload = data ? data
                   : reusable_payload(tenant, descriptor, existing,
                                      context_.data);
    if (!payload) {
      return make_error_reply(error_code_t::malformed_message,
                              "no payload supplied and none stored for dataCid");
    }
  }

  // Payload, message, index row and event entry land in one batch.
  auto admission = context_.messages.stage_put(
      tenant, write->message_cid, message,
      dwn::core::project_records_write(descriptor, write->author, true));
  if (payload) {
    admission.push_back(context_.data.stage_put(
        tenant, write->message_cid,
        dwn::schema::bytes_view_t{payload->data(), payload->size()}));
  }
  auto watermark = context_.events.append(tenant, write->message_cid,
                                          std::move(admission));
  apply_prune(tenant, resolution.prune, context_.messages, context_.data);

  spdlog::info("Accepted RecordsWrite {} for record {} (event {})",
               dwn::schema::to_hex(write->message_cid), descriptor.record_id,
               watermark);
  return dwn::schema::make_reply(dwn::schema::kStatusAccepted, "Accepted");
}

}  // namespace dwn::handlers
