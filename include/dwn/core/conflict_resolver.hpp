#pragma once

#include <dwn/schema/primitives.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Last writer wins over the messages of one logical record. Pure: callers
// pass the snapshot they read under the record lock and apply the returned
// plan themselves.
namespace dwn::core {

/// What the resolver needs to know about one message of a record.
struct message_version final {
  std::string date_created;
  dwn::schema::content_id_t message_cid{};
  bool is_delete{};
  bool is_initial_write{};
};

enum class resolution_t : uint8_t { accept = 0, conflict = 1, not_found = 2 };

/// Side effects owed once the incoming message is persisted.
struct prune_plan final {
  /// Messages to remove together with their index rows and payloads.
  std::vector<dwn::schema::content_id_t> remove;
  /// Initial write kept as anchor: payload removed, row no longer current.
  std::optional<dwn::schema::content_id_t> tombstone;
};

struct resolution_result final {
  resolution_t outcome{resolution_t::accept};
  /// Index into the snapshot of its newest message, if any.
  std::optional<std::size_t> newest_existing;
  prune_plan prune;
};

/// Strict (dateCreated, content id) order; equal messages outrank neither.
bool outranks(const message_version& lhs, const message_version& rhs);

std::optional<std::size_t> newest(const std::vector<message_version>& versions);

/// Decide a RecordsWrite or RecordsDelete against the record's messages.
///
/// A delete of a record with no messages, or whose newest message is already
/// a delete, is not_found even when the delete is older than that message.
resolution_result resolve(const std::vector<message_version>& existing,
                          const message_version& incoming);

/// Same ordering for protocol configurations; no anchor is kept, every older
/// configuration is removed.
resolution_result resolve_configuration(
    const std::vector<message_version>& existing,
    const message_version& incoming);

}  // namespace dwn::core
