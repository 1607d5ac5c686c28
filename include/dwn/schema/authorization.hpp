#pragma once

#include <dwn/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: authorization.
// Detached signature over the descriptor. The signed payload commits to the
// descriptor by content id; each signature names the key that produced it as
// `<did>#<fragment>`.
namespace dwn::schema {

template <uint16_t Version>
struct authorization_payload;

template <>
struct authorization_payload<1> final {
  content_id_t descriptor_cid{};
};

using authorization_payload_t = authorization_payload<1>;

template <uint16_t Version>
struct signature_entry;

template <>
struct signature_entry<1> final {
  std::string key_id;
  signature_t signature;
};

using signature_entry_t = signature_entry<1>;

template <uint16_t Version>
struct authorization;

template <>
struct authorization<1> final {
  authorization_payload_t payload;
  std::vector<signature_entry_t> signatures;
};

using authorization_t = authorization<1>;

}  // namespace dwn::schema
