#pragma once
#include <boost/endian/conversion.hpp>
#include <dwn/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace dwn::schema::key {

struct builder final {
  dwn::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  builder& hash(const std::string_view& str);
  builder& hash(const std::span<const uint8_t>& bytes);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
      data.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
    return *this;
  }

  /// Big endian integers keep RocksDB's bytewise order equal to numeric
  /// order.
  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write_ordered(T value) {
    auto bytes = std::array<uint8_t, sizeof(T)>{};
    boost::endian::endian_store<T, sizeof(T), boost::endian::order::big>(
        bytes.data(), value);
    return write(std::span<const uint8_t>{bytes.data(), bytes.size()});
  }
};

}  // namespace dwn::schema::key
