#pragma once

#include <dwn/schema/encoding/scale/encoder.hpp>
#include <dwn/storage/rocksdb/storage.hpp>
#include <dwn/store/event_log.hpp>
#include <mutex>

namespace dwn::store {

/// The sequence counter is persisted next to the entries and advanced in the
/// same batch, so a restart continues where the log left off.
class rocksdb_event_log final : public event_log {
 public:
  explicit rocksdb_event_log(
      dwn::storage::storage<dwn::storage::rocksdb_storage_tag>& storage);

  uint64_t append(std::string_view tenant,
                  const dwn::schema::content_id_t& message_cid,
                  std::vector<dwn::storage::mutation> admission = {}) override;

  std::vector<dwn::schema::event_t> query(
      std::string_view tenant,
      std::optional<uint64_t> watermark) const override;

 private:
  dwn::storage::storage<dwn::storage::rocksdb_storage_tag>& storage_;
  mutable dwn::schema::encoding::encoder<
      dwn::schema::encoding::scale_encoder_tag>
      encoder_{};
  std::mutex mutex_;
};

}  // namespace dwn::store
