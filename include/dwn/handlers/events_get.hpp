#pragma once

#include <dwn/handlers/method_handler.hpp>

namespace dwn::handlers {

class events_get_handler final : public method_handler {
 public:
  explicit events_get_handler(const handler_context& context);

  dwn::schema::message_reply_t handle(
      std::string_view tenant,
      const dwn::schema::raw_message_t& message,
      const std::optional<dwn::schema::bytes_t>& data,
      const handler_options& options) override;

 private:
  handler_context context_;
};

}  // namespace dwn::handlers
