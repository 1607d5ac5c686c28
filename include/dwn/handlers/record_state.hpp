#pragma once

#include <dwn/core/conflict_resolver.hpp>
#include <dwn/schema/records_write.hpp>
#include <dwn/store/data_store.hpp>
#include <dwn/store/message_store.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Bridges stored messages of a record to the conflict resolver and applies
// its prune plans.
namespace dwn::handlers {

/// A stored RecordsWrite decoded back into its descriptor.
struct stored_write final {
  dwn::schema::content_id_t message_cid{};
  dwn::schema::records_write_descriptor_t descriptor;
  std::string author;
};

std::optional<stored_write> decode_write(const dwn::store::message_entry& entry);

/// Resolver view of stored record messages. Entries that are neither a
/// write nor a delete are skipped.
std::vector<dwn::core::message_version> versions_of(
    const std::vector<dwn::store::message_entry>& entries);

std::optional<stored_write> find_initial_write(
    const std::vector<dwn::store::message_entry>& entries);

/// Remove superseded messages and demote the anchor. Runs only after the
/// newest message has been persisted.
void apply_prune(std::string_view tenant,
                 const dwn::core::prune_plan& plan,
                 dwn::store::message_store& messages,
                 dwn::store::data_store& data);

}  // namespace dwn::handlers
