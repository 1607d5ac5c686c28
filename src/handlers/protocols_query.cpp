#include <dwn/core/index_projector.hpp>
#include <dwn/core/parse.hpp>
#include <dwn/handlers/protocols_query.hpp>

namespace dwn::handlers {

using dwn::schema::error_code_t;
using dwn::schema::make_error_reply;

protocols_query_handler::protocols_query_handler(const handler_context& context)
    : context_{context} {}

dwn::schema::message_reply_t protocols_query_handler::handle(
    const std::string_view tenant,
    const dwn::schema::raw_message_t& message,
    const std::optional<dwn::schema::bytes_t>&,
    const handler_options&) {
  auto error = std::string{};
  auto query = dwn::core::parse<dwn::schema::protocols_query_descriptor_t>(
      message, error);
  if (!query) {
    return make_error_reply(error_code_t::malformed_message, error);
  }
  if (auto denied = context_.authenticator.authenticate(message)) {
    return *denied;
  }
  if (auto denied = dwn::core::authorize_tenant_only(tenant, query->author)) {
    return *denied;
  }

  auto reply = dwn::schema::make_reply(dwn::schema::kStatusOk, "OK");
  for (auto& entry : context_.messages.query(
           tenant,
           dwn::core::configurations_filter(query->descriptor.filter.protocol))) {
    reply.entries.push_back(dwn::schema::record_entry_t{
        entry.message_cid, std::move(entry.stored.message), std::nullopt});
  }
  return reply;
}

}  // namespace dwn::handlers
