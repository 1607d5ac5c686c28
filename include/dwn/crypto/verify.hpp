#pragma once

#include <dwn/schema/primitives.hpp>

namespace dwn::crypto {

bool available();

bool verify_signature(const dwn::schema::bytes_view_t& message,
                      const dwn::schema::public_key_t& public_key,
                      const dwn::schema::signature_t& signature);

}  // namespace dwn::crypto
