#pragma once

#include <dwn/schema/encoding/scale/encoder.hpp>
#include <dwn/storage/rocksdb/storage.hpp>
#include <dwn/store/message_store.hpp>
#include <mutex>

namespace dwn::store {

class rocksdb_message_store final : public message_store {
 public:
  explicit rocksdb_message_store(
      dwn::storage::storage<dwn::storage::rocksdb_storage_tag>& storage);

  std::vector<message_entry> query(
      std::string_view tenant,
      const dwn::schema::index_row_t& filter) const override;

  std::optional<dwn::schema::stored_message_t> get(
      std::string_view tenant,
      const dwn::schema::content_id_t& message_cid) const override;

  void put(std::string_view tenant,
           const dwn::schema::content_id_t& message_cid,
           const dwn::schema::raw_message_t& message,
           const dwn::schema::index_row_t& indexes) override;

  std::vector<dwn::storage::mutation> stage_put(
      std::string_view tenant,
      const dwn::schema::content_id_t& message_cid,
      const dwn::schema::raw_message_t& message,
      const dwn::schema::index_row_t& indexes) const override;

  void remove(std::string_view tenant,
              const dwn::schema::content_id_t& message_cid) override;

 private:
  dwn::storage::storage<dwn::storage::rocksdb_storage_tag>& storage_;
  mutable dwn::schema::encoding::encoder<
      dwn::schema::encoding::scale_encoder_tag>
      encoder_{};
  std::mutex mutex_;
};

}  // namespace dwn::store
