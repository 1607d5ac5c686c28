#include <dwn/schema/key/store_keys.hpp>
#include <dwn/store/rocksdb/message_store.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace dwn::store {

namespace {

std::string date_created_of(const dwn::schema::index_row_t& row) {
  const auto* value = dwn::schema::find_index(row, dwn::schema::kIndexDateCreated);
  if (value == nullptr || !std::holds_alternative<std::string>(*value)) {
    return {};
  }
  return std::get<std::string>(*value);
}

dwn::schema::content_id_t cid_suffix(const dwn::schema::bytes_t& key) {
  auto cid = dwn::schema::content_id_t{};
  std::copy(std::end(key) - static_cast<std::ptrdiff_t>(cid.size()),
            std::end(key), std::begin(cid));
  return cid;
}

}  // namespace

rocksdb_message_store::rocksdb_message_store(
    dwn::storage::storage<dwn::storage::rocksdb_storage_tag>& storage)
    : storage_{storage} {}

std::vector<message_entry> rocksdb_message_store::query(
    const std::string_view tenant,
    const dwn::schema::index_row_t& filter) const {
  auto candidates = std::set<dwn::schema::content_id_t>{};
  if (filter.empty()) {
    auto prefix = dwn::schema::key::make_message_prefix(tenant);
    for (const auto& [key, value] : storage_.list_by_prefix(prefix)) {
      candidates.insert(cid_suffix(key));
    }
  } else {
    // The first filter entry narrows the scan; the rest are checked against
    // the stored row.
    auto prefix = dwn::schema::key::make_index_prefix(tenant, filter.front());
    for (const auto& [key, value] : storage_.list_by_prefix(prefix)) {
      candidates.insert(cid_suffix(key));
    }
  }

  auto entries = std::vector<message_entry>{};
  for (const auto& cid : candidates) {
    auto stored = get(tenant, cid);
    if (!stored || !dwn::schema::matches(stored->indexes, filter)) {
      continue;
    }
    entries.push_back(message_entry{cid, std::move(*stored)});
  }
  std::sort(std::begin(entries), std::end(entries),
            [](const message_entry& lhs, const message_entry& rhs) {
              auto lhs_date = date_created_of(lhs.stored.indexes);
              auto rhs_date = date_created_of(rhs.stored.indexes);
              if (lhs_date != rhs_date) {
                return lhs_date < rhs_date;
              }
              return lhs.message_cid < rhs.message_cid;
            });
  return entries;
}

std::optional<dwn::schema::stored_message_t> rocksdb_message_store::get(
    const std::string_view tenant,
    const dwn::schema::content_id_t& message_cid) const {
  auto key = dwn::schema::key::make_message_key(tenant, message_cid);
  return storage_.get<dwn::schema::stored_message_t>(encoder_, key);
}

void rocksdb_message_store::put(const std::string_view tenant,
                                const dwn::schema::content_id_t& message_cid,
                                const dwn::schema::raw_message_t& message,
                                const dwn::schema::index_row_t& indexes) {
  auto lock = std::scoped_lock{mutex_};
  storage_.apply(stage_put(tenant, message_cid, message, indexes));
  spdlog::debug("Stored message {} for tenant '{}'",
                dwn::schema::to_hex(message_cid), tenant);
}

std::vector<dwn::storage::mutation> rocksdb_message_store::stage_put(
    const std::string_view tenant,
    const dwn::schema::content_id_t& message_cid,
    const dwn::schema::raw_message_t& message,
    const dwn::schema::index_row_t& indexes) const {
  auto mutations = std::vector<dwn::storage::mutation>{};
  // A replaced row leaves no stale index keys behind.
  if (auto existing = get(tenant, message_cid)) {
    for (const auto& entry : existing->indexes) {
      mutations.push_back(dwn::storage::mutation{
          dwn::schema::key::make_index_key(tenant, entry, message_cid),
          std::nullopt});
    }
  }
  for (const auto& entry : indexes) {
    mutations.push_back(dwn::storage::mutation{
        dwn::schema::key::make_index_key(tenant, entry, message_cid),
        dwn::schema::bytes_t{}});
  }
  mutations.push_back(dwn::storage::mutation{
      dwn::schema::key::make_message_key(tenant, message_cid),
      encoder_.encode(dwn::schema::stored_message_t{message, indexes})});
  return mutations;
}

void rocksdb_message_store::remove(const std::string_view tenant,
                                   const dwn::schema::content_id_t& message_cid) {
  auto lock = std::scoped_lock{mutex_};
  auto existing = get(tenant, message_cid);
  if (!existing) {
    return;
  }
  auto mutations = std::vector<dwn::storage::mutation>{};
  for (const auto& entry : existing->indexes) {
    mutations.push_back(dwn::storage::mutation{
        dwn::schema::key::make_index_key(tenant, entry, message_cid),
        std::nullopt});
  }
  mutations.push_back(dwn::storage::mutation{
      dwn::schema::key::make_message_key(tenant, message_cid), std::nullopt});
  storage_.apply(mutations);
  spdlog::debug("Removed message {} for tenant '{}'",
                dwn::schema::to_hex(message_cid), tenant);
}

}  // namespace dwn::store
