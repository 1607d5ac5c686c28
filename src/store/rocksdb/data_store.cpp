#include <dwn/schema/key/store_keys.hpp>
#include <dwn/store/rocksdb/data_store.hpp>

namespace dwn::store {

rocksdb_data_store::rocksdb_data_store(
    dwn::storage::storage<dwn::storage::rocksdb_storage_tag>& storage)
    : storage_{storage} {}

void rocksdb_data_store::put(const std::string_view tenant,
                             const dwn::schema::content_id_t& message_cid,
                             const dwn::schema::bytes_view_t& data) {
  storage_.apply({stage_put(tenant, message_cid, data)});
}

dwn::storage::mutation rocksdb_data_store::stage_put(
    const std::string_view tenant,
    const dwn::schema::content_id_t& message_cid,
    const dwn::schema::bytes_view_t& data) const {
  return dwn::storage::mutation{
      dwn::schema::key::make_data_key(tenant, message_cid),
      dwn::schema::make_bytes(data)};
}

std::optional<dwn::schema::bytes_t> rocksdb_data_store::get(
    const std::string_view tenant,
    const dwn::schema::content_id_t& message_cid) const {
  return storage_.get_raw(dwn::schema::key::make_data_key(tenant, message_cid));
}

void rocksdb_data_store::remove(const std::string_view tenant,
                                const dwn::schema::content_id_t& message_cid) {
  storage_.apply({dwn::storage::mutation{
      dwn::schema::key::make_data_key(tenant, message_cid), std::nullopt}});
}

}  // namespace dwn::store
