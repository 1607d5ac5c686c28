#pragma once

#include <dwn/schema/event.hpp>
#include <dwn/schema/primitives.hpp>
#include <dwn/storage/storage.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace dwn::store {

/// Append only, per tenant ledger of admitted message cids.
///
/// Watermarks start at 1, are never reused and follow append order even when
/// appends race. Entries are never removed.
class event_log {
 public:
  virtual ~event_log() = default;

  /// `admission` is committed in the same batch as the entry: either the
  /// admitted message and its event both persist or neither does.
  virtual uint64_t append(
      std::string_view tenant,
      const dwn::schema::content_id_t& message_cid,
      std::vector<dwn::storage::mutation> admission = {}) = 0;

  /// Entries with a watermark strictly greater than `watermark`, in order.
  /// No watermark returns the whole log.
  virtual std::vector<dwn::schema::event_t> query(
      std::string_view tenant,
      std::optional<uint64_t> watermark) const = 0;
};

}  // namespace dwn::store
