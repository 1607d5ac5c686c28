#pragma once
#include <dwn/schema/primitives.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dwn::storage {

using key_value_entry_t = std::pair<dwn::schema::bytes_t, dwn::schema::bytes_t>;

/// Raised when the backend cannot read or write. Never converted into a
/// message reply.
class storage_error final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// One step of an atomic batch: a put when value is set, a delete otherwise.
struct mutation final {
  dwn::schema::bytes_t key;
  std::optional<dwn::schema::bytes_t> value;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder, const dwn::schema::bytes_view_t& key);

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const dwn::schema::bytes_view_t& key,
           const T& value);

  /// Raw bytes at key, or std::nullopt when missing.
  std::optional<dwn::schema::bytes_t> get_raw(
      const dwn::schema::bytes_view_t& key) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const dwn::schema::bytes_view_t& prefix) const;

  /// Apply every mutation or none of them.
  void apply(const std::vector<mutation>& mutations) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace dwn::storage
