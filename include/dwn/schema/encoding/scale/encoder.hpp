#pragma once
#include <dwn/common/critical.hpp>
#include <dwn/schema/encoding/encoder.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace dwn::schema::encoding {

struct scale_encoder_tag {};

// Schema types are plain aggregates, SCALE encodes their fields in
// declaration order.
template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  dwn::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, dwn::schema::bytes_t& out);

  template <typename T>
  T decode(const dwn::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const dwn::schema::bytes_view_t& bytes);
};

template <typename T>
dwn::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    dwn::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        dwn::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(const dwn::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    dwn::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

// Untrusted input goes through try_decode; trailing bytes are rejected by
// comparing the re-encoding at the call site.
template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const dwn::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace dwn::schema::encoding
