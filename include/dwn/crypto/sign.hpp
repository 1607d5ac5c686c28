#pragma once

#include <dwn/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <optional>

// Client side signing used by the message builder tool and tests. The node
// itself only verifies.
namespace dwn::crypto {

using ed25519_private_key_t = std::array<uint8_t, 32>;

struct ed25519_key_pair final {
  ed25519_private_key_t private_key{};
  dwn::schema::ed25519_public_key_t public_key{};
};

std::optional<ed25519_key_pair> generate_ed25519_key_pair();

/// Rebuild the key pair of a raw 32 byte private key (seed).
std::optional<ed25519_key_pair> make_ed25519_key_pair(
    const ed25519_private_key_t& private_key);

std::optional<dwn::schema::ed25519_signature_t> sign_ed25519(
    const dwn::schema::bytes_view_t& message,
    const ed25519_private_key_t& private_key);

}  // namespace dwn::crypto
