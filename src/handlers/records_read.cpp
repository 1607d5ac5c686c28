#include <dwn/core/index_projector.hpp>
#include <dwn/core/parse.hpp>
#include <dwn/handlers/record_state.hpp>
#include <dwn/handlers/records_read.hpp>

namespace dwn::handlers {

using dwn::schema::error_code_t;
using dwn::schema::make_error_reply;

records_read_handler::records_read_handler(const handler_context& context)
    : context_{context} {}

dwn::schema::message_reply_t records_read_handler::handle(
    const std::string_view tenant,
    const dwn::schema::raw_message_t& message,
    const std::optional<dwn::schema::bytes_t>&,
    const handler_options&) {
  auto error = std::string{};
  auto read =
      dwn::core::parse<dwn::schema::records_read_descriptor_t>(message, error);
  if (!read) {
    return make_error_reply(error_code_t::malformed_message, error);
  }
  if (auto denied = context_.authenticator.authenticate(message)) {
    return *denied;
  }

  auto filter = dwn::schema::records_filter_t{};
  filter.record_id = read->descriptor.record_id;
  auto current =
      context_.messages.query(tenant, dwn::core::current_records_filter(filter));
  if (current.empty()) {
    return make_error_reply(error_code_t::record_not_found, "Not Found");
  }
  auto& newest = current.back();
  auto record = decode_write(newest);
  if (!record) {
    return make_error_reply(error_code_t::record_not_found, "Not Found");
  }

  auto definition = std::optional<dwn::schema::protocol_definition_t>{};
  if (record->descriptor.protocol) {
    definition = dwn::core::find_protocol_definition(
        context_.messages, tenant, *record->descriptor.protocol);
  }
  if (!dwn::core::can_read(tenant, read->author, record->descriptor,
                           record->author, definition)) {
    return make_error_reply(error_code_t::authorization_denied,
                            "message failed authorization: " + read->author +
                                " may not read record " +
                                read->descriptor.record_id);
  }

  auto reply = dwn::schema::make_reply(dwn::schema::kStatusOk, "OK");
  reply.record = dwn::schema::record_entry_t{
      newest.message_cid, std::move(newest.stored.message),
      context_.data.get(tenant, newest.message_cid)};
  return reply;
}

}  // namespace dwn::handlers
