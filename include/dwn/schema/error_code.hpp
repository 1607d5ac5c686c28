#pragma once

#include <cstdint>

namespace dwn::schema {

enum class error_code_t : uint32_t {
  malformed_message = 1,
  authentication_failure = 2,
  authorization_denied = 3,
  tenant_not_served = 4,
  superseded_by_newer = 5,
  record_not_found = 6,
};

/// Reply status for each rejection class.
inline constexpr uint32_t status_code_of(const error_code_t code) {
  switch (code) {
    case error_code_t::malformed_message:
      return 400;
    case error_code_t::authentication_failure:
    case error_code_t::authorization_denied:
    case error_code_t::tenant_not_served:
      return 401;
    case error_code_t::superseded_by_newer:
      return 409;
    case error_code_t::record_not_found:
      return 404;
  }
  return 400;
}

}  // namespace dwn::schema
