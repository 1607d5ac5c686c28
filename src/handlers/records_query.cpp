#include <dwn/core/auth.hpp>
#include <dwn/core/index_projector.hpp>
#include <dwn/core/parse.hpp>
#include <dwn/handlers/records_query.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <string>
#include <variant>

namespace dwn::handlers {

using dwn::schema::error_code_t;
using dwn::schema::make_error_reply;

records_query_handler::records_query_handler(const handler_context& context)
    : context_{context} {}

dwn::schema::message_reply_t records_query_handler::handle(
    const std::string_view tenant,
    const dwn::schema::raw_message_t& message,
    const std::optional<dwn::schema::bytes_t>&,
    const handler_options&) {
  auto error = std::string{};
  auto query = dwn::core::parse<dwn::schema::records_query_descriptor_t>(
      message, error);
  if (!query) {
    return make_error_reply(error_code_t::malformed_message, error);
  }
  if (auto denied = context_.authenticator.authenticate(message)) {
    return *denied;
  }

  auto matches = context_.messages.query(
      tenant, dwn::core::current_records_filter(query->descriptor.filter));
  auto reply = dwn::schema::make_reply(dwn::schema::kStatusOk, "OK");
  // Configurations looked up once per protocol among the matches.
  auto definitions =
      std::map<std::string,
               std::optional<dwn::schema::protocol_definition_t>>{};
  for (auto& entry : matches) {
    auto definition = std::optional<dwn::schema::protocol_definition_t>{};
    const auto* protocol = dwn::schema::find_index(
        entry.stored.indexes, dwn::schema::kIndexProtocol);
    if (query->author != tenant && protocol != nullptr &&
        std::holds_alternative<std::string>(*protocol)) {
      const auto& name = std::get<std::string>(*protocol);
      auto cached = definitions.find(name);
      if (cached == std::end(definitions)) {
        cached = definitions
                     .emplace(name, dwn::core::find_protocol_definition(
                                        context_.messages, tenant, name))
                     .first;
      }
      definition = cached->second;
    }
    if (!dwn::core::is_visible_to(tenant, query->author, entry.stored.indexes,
                                  definition)) {
      continue;
    }
    reply.entries.push_back(dwn::schema::record_entry_t{
        entry.message_cid, std::move(entry.stored.message), std::nullopt});
  }

  auto sort = dwn::schema::date_sort_t::created_ascending;
  if (query->descriptor.date_sort) {
    sort = dwn::schema::try_from_string<dwn::schema::date_sort_t>(
               *query->descriptor.date_sort)
               .value_or(sort);
  }
  if (sort == dwn::schema::date_sort_t::created_descending) {
    std::reverse(std::begin(reply.entries), std::end(reply.entries));
  }

  spdlog::debug("RecordsQuery by {} matched {} record(s)", query->author,
                reply.entries.size());
  return reply;
}

}  // namespace dwn::handlers
