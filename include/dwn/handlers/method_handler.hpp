#pragma once

#include <dwn/core/auth.hpp>
#include <dwn/core/record_lock.hpp>
#include <dwn/schema/message_kind.hpp>
#include <dwn/schema/message_reply.hpp>
#include <dwn/schema/primitives.hpp>
#include <dwn/schema/raw_message.hpp>
#include <dwn/store/data_store.hpp>
#include <dwn/store/event_log.hpp>
#include <dwn/store/message_store.hpp>
#include <memory>
#include <optional>
#include <string_view>

namespace dwn::handlers {

/// Collaborators shared by every handler of one node. All outlive the
/// handlers.
struct handler_context final {
  dwn::store::message_store& messages;
  dwn::store::data_store& data;
  dwn::store::event_log& events;
  const dwn::core::authenticator& authenticator;
  dwn::core::record_lock_table& locks;
};

struct handler_options final {
  /// Admit a RecordsWrite without storing or requiring its payload.
  bool skip_data_storage{};
};

/// Parses, authorizes and applies one kind of message.
///
/// Rejections come back as replies; storage failures propagate as
/// dwn::storage::storage_error.
class method_handler {
 public:
  virtual ~method_handler() = default;

  virtual dwn::schema::message_reply_t handle(
      std::string_view tenant,
      const dwn::schema::raw_message_t& message,
      const std::optional<dwn::schema::bytes_t>& data,
      const handler_options& options) = 0;
};

std::unique_ptr<method_handler> make_handler(dwn::schema::message_kind_t kind,
                                             const handler_context& context);

}  // namespace dwn::handlers
