#include <dwn/core/parse.hpp>
#include <dwn/handlers/events_get.hpp>

namespace dwn::handlers {

using dwn::schema::error_code_t;
using dwn::schema::make_error_reply;

events_get_handler::events_get_handler(const handler_context& context)
    : context_{context} {}

dwn::schema::message_reply_t events_get_handler::handle(
    const std::string_view tenant,
    const dwn::schema::raw_message_t& message,
    const std::optional<dwn::schema::bytes_t>&,
    const handler_options&) {
  auto error = std::string{};
  auto get =
      dwn::core::parse<dwn::schema::events_get_descriptor_t>(message, error);
  if (!get) {
    return make_error_reply(error_code_t::malformed_message, error);
  }
  if (auto denied = context_.authenticator.authenticate(message)) {
    return *denied;
  }
  if (auto denied = dwn::core::authorize_tenant_only(tenant, get->author)) {
    return *denied;
  }

  auto reply = dwn::schema::make_reply(dwn::schema::kStatusOk, "OK");
  reply.events = context_.events.query(tenant, get->descriptor.watermark);
  return reply;
}

}  // namespace dwn::handlers
