#include <algorithm>
#include <dwn/blake3/hash.hpp>
#include <dwn/schema/key/builder.hpp>
#include <iterator>
#include <ranges>

using namespace dwn::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::hash(const std::string_view& str) {
  auto digest = dwn::blake3::hash(str);
  std::ranges::copy(digest, std::back_inserter(data));
  return *this;
}

builder& builder::hash(const std::span<const uint8_t>& bytes) {
  auto digest = dwn::blake3::hash(bytes);
  std::ranges::copy(digest, std::back_inserter(data));
  return *this;
}
