#include <boost/endian/conversion.hpp>
#include <dwn/schema/key/store_keys.hpp>
#include <dwn/store/rocksdb/event_log.hpp>

#include <spdlog/spdlog.h>

namespace dwn::store {

rocksdb_event_log::rocksdb_event_log(
    dwn::storage::storage<dwn::storage::rocksdb_storage_tag>& storage)
    : storage_{storage} {}

uint64_t rocksdb_event_log::append(
    const std::string_view tenant,
    const dwn::schema::content_id_t& message_cid,
    std::vector<dwn::storage::mutation> admission) {
  auto lock = std::scoped_lock{mutex_};
  auto seq_key = dwn::schema::key::make_event_seq_key(tenant);
  auto sequence = storage_.get<uint64_t>(encoder_, seq_key).value_or(0) + 1;

  auto mutations = std::move(admission);
  mutations.push_back(dwn::storage::mutation{
      dwn::schema::key::make_event_key(tenant, sequence),
      encoder_.encode(dwn::schema::event_t{sequence, message_cid})});
  mutations.push_back(
      dwn::storage::mutation{seq_key, encoder_.encode(sequence)});
  storage_.apply(mutations);
  spdlog::debug("Appended event {} for tenant '{}'", sequence, tenant);
  return sequence;
}

std::vector<dwn::schema::event_t> rocksdb_event_log::query(
    const std::string_view tenant,
    const std::optional<uint64_t> watermark) const {
  auto prefix = dwn::schema::key::make_event_prefix(tenant);
  auto after = watermark.value_or(0);
  auto events = std::vector<dwn::schema::event_t>{};
  for (const auto& [key, value] : storage_.list_by_prefix(prefix)) {
    if (key.size() != prefix.size() + sizeof(uint64_t)) {
      continue;
    }
    auto sequence = boost::endian::load_big_u64(key.data() + prefix.size());
    if (sequence <= after) {
      continue;
    }
    auto event = encoder_.try_decode<dwn::schema::event_t>(
        dwn::schema::bytes_view_t{value.data(), value.size()});
    if (!event) {
      throw dwn::storage::storage_error{"Failed to decode event log entry"};
    }
    events.push_back(*event);
  }
  return events;
}

}  // namespace dwn::store
