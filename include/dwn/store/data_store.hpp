#pragma once

#include <dwn/schema/primitives.hpp>
#include <dwn/storage/storage.hpp>
#include <optional>
#include <string_view>

namespace dwn::store {

/// Payloads associated with a message, keyed by (tenant, message cid).
class data_store {
 public:
  virtual ~data_store() = default;

  virtual void put(std::string_view tenant,
                   const dwn::schema::content_id_t& message_cid,
                   const dwn::schema::bytes_view_t& data) = 0;

  virtual dwn::storage::mutation stage_put(
      std::string_view tenant,
      const dwn::schema::content_id_t& message_cid,
      const dwn::schema::bytes_view_t& data) const = 0;

  virtual std::optional<dwn::schema::bytes_t> get(
      std::string_view tenant,
      const dwn::schema::content_id_t& message_cid) const = 0;

  virtual void remove(std::string_view tenant,
                      const dwn::schema::content_id_t& message_cid) = 0;
};

}  // namespace dwn::store
