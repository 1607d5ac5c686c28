#pragma once
#include <dwn/schema/primitives.hpp>
#include <optional>
#include <span>

namespace dwn::schema::encoding {

// The wire codec is a build time choice: callers name the library through a
// tag, e.g. encoder<scale_encoder_tag>.
template <typename Library>
struct encoder {
  template <typename T>
  dwn::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, dwn::schema::bytes_t& out);

  template <typename T>
  T decode(const dwn::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const dwn::schema::bytes_view_t& bytes);
};

}  // namespace dwn::schema::encoding
