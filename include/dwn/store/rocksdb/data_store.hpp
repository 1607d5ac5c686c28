#pragma once

#include <dwn/storage/rocksdb/storage.hpp>
#include <dwn/store/data_store.hpp>

namespace dwn::store {

class rocksdb_data_store final : public data_store {
 public:
  explicit rocksdb_data_store(
      dwn::storage::storage<dwn::storage::rocksdb_storage_tag>& storage);

  void put(std::string_view tenant,
           const dwn::schema::content_id_t& message_cid,
           const dwn::schema::bytes_view_t& data) override;

  dwn::storage::mutation stage_put(
      std::string_view tenant,
      const dwn::schema::content_id_t& message_cid,
      const dwn::schema::bytes_view_t& data) const override;

  std::optional<dwn::schema::bytes_t> get(
      std::string_view tenant,
      const dwn::schema::content_id_t& message_cid) const override;

  void remove(std::string_view tenant,
              const dwn::schema::content_id_t& message_cid) override;

 private:
  dwn::storage::storage<dwn::storage::rocksdb_storage_tag>& storage_;
};

}  // namespace dwn::store
