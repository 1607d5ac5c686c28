#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <dwn/common/critical.hpp>
#include <dwn/schema/encoding/scale/encoder.hpp>
#include <dwn/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>

namespace dwn::storage {

namespace detail {

inline dwn::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const dwn::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

[[noreturn]] inline void fail(const std::string_view what,
                              const ROCKSDB_NAMESPACE::Status& status) {
  spdlog::error("{}: {}", what, status.ToString());
  throw storage_error{std::string{what} + ": " + status.ToString()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder, const dwn::schema::bytes_view_t& key);

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const dwn::schema::bytes_view_t& key,
           const T& value);

  std::optional<dwn::schema::bytes_t> get_raw(
      const dwn::schema::bytes_view_t& key) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const dwn::schema::bytes_view_t& prefix) const;
  void apply(const std::vector<mutation>& mutations) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline std::optional<dwn::schema::bytes_t> storage<rocksdb_storage_tag>::get_raw(
    const dwn::schema::bytes_view_t& key) const {
  if (!database) {
    dwn::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    detail::fail("Failed to get value from RocksDB", status);
  }
  return dwn::schema::bytes_t(std::begin(value), std::end(value));
}

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const dwn::schema::bytes_view_t& key) {
  auto value = get_raw(key);
  if (!value) {
    return std::nullopt;
  }
  auto decoded = encoder.template try_decode<T>(
      dwn::schema::bytes_view_t{value->data(), value->size()});
  if (!decoded) {
    throw storage_error{"Failed to decode value stored in RocksDB"};
  }
  return decoded;
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const dwn::schema::bytes_view_t& key,
                                       const T& value) {
  if (!database) {
    dwn::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(dwn::schema::bytes_view_t{encoded_value.data(),
                                                 encoded_value.size()}));
  if (!status.ok()) {
    detail::fail("Failed to put value into RocksDB", status);
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const dwn::schema::bytes_view_t& prefix) const {
  if (!database) {
    dwn::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    detail::fail("Failed to scan RocksDB prefix", iterator->status());
  }
  return entries;
}

inline void storage<rocksdb_storage_tag>::apply(
    const std::vector<mutation>& mutations) const {
  if (!database) {
    dwn::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : mutations) {
    auto key_slice =
        detail::to_slice(dwn::schema::bytes_view_t{key.data(), key.size()});
    auto status =
        value ? batch.Put(key_slice,
                          detail::to_slice(dwn::schema::bytes_view_t{
                              value->data(), value->size()}))
              : batch.Delete(key_slice);
    if (!status.ok()) {
      detail::fail("Failed to stage RocksDB batch", status);
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    detail::fail("Failed to commit RocksDB batch", write_status);
  }
}

}  // namespace dwn::storage
