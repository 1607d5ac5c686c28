#include <dwn/common/critical.hpp>
#include <dwn/handlers/events_get.hpp>
#include <dwn/handlers/messages_get.hpp>
#include <dwn/handlers/method_handler.hpp>
#include <dwn/handlers/protocols_configure.hpp>
#include <dwn/handlers/protocols_query.hpp>
#include <dwn/handlers/records_delete.hpp>
#include <dwn/handlers/records_query.hpp>
#include <dwn/handlers/records_read.hpp>
#include <dwn/handlers/records_write.hpp>

namespace dwn::handlers {

std::unique_ptr<method_handler> make_handler(
    const dwn::schema::message_kind_t kind,
    const handler_context& context) {
  switch (kind) {
    case dwn::schema::message_kind_t::records_write:
      return std::make_unique<records_write_handler>(context);
    case dwn::schema::message_kind_t::records_delete:
      return std::make_unique<records_delete_handler>(context);
    case dwn::schema::message_kind_t::records_query:
      return std::make_unique<records_query_handler>(context);
    case dwn::schema::message_kind_t::records_read:
      return std::make_unique<records_read_handler>(context);
    case dwn::schema::message_kind_t::protocols_configure:
      return std::make_unique<protocols_configure_handler>(context);
    case dwn::schema::message_kind_t::protocols_query:
      return std::make_unique<protocols_query_handler>(context);
    case dwn::schema::message_kind_t::events_get:
      return std::make_unique<events_get_handler>(context);
    case dwn::schema::message_kind_t::messages_get:
      return std::make_unique<messages_get_handler>(context);
  }
  dwn::common::critical("no handler for message kind");
}

}  // namespace dwn::handlers
