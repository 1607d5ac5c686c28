#pragma once

#include <dwn/schema/index_row.hpp>
#include <dwn/schema/primitives.hpp>
#include <dwn/schema/raw_message.hpp>
#include <dwn/schema/stored_message.hpp>
#include <dwn/storage/storage.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace dwn::store {

struct message_entry final {
  dwn::schema::content_id_t message_cid{};
  dwn::schema::stored_message_t stored;
};

/// Messages of one tenant together with the index row each was admitted with.
///
/// Implementations are thread safe. Backend failures throw
/// dwn::storage::storage_error.
class message_store {
 public:
  virtual ~message_store() = default;

  /// Entries whose index row contains every entry of `filter`, ordered by
  /// (dateCreated, message cid). An empty filter returns every message.
  virtual std::vector<message_entry> query(
      std::string_view tenant,
      const dwn::schema::index_row_t& filter) const = 0;

  virtual std::optional<dwn::schema::stored_message_t> get(
      std::string_view tenant,
      const dwn::schema::content_id_t& message_cid) const = 0;

  /// Persist the message and its index row in one atomic write. Putting an
  /// existing cid replaces its index row.
  virtual void put(std::string_view tenant,
                   const dwn::schema::content_id_t& message_cid,
                   const dwn::schema::raw_message_t& message,
                   const dwn::schema::index_row_t& indexes) = 0;

  /// The mutations `put` would apply, for a caller that commits them in its
  /// own batch.
  virtual std::vector<dwn::storage::mutation> stage_put(
      std::string_view tenant,
      const dwn::schema::content_id_t& message_cid,
      const dwn::schema::raw_message_t& message,
      const dwn::schema::index_row_t& indexes) const = 0;

  /// Remove the message and its index row. Missing messages are ignored.
  virtual void remove(std::string_view tenant,
                      const dwn::schema::content_id_t& message_cid) = 0;
};

}  // namespace dwn::store
