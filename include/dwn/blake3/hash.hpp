#pragma once
#include <dwn/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace dwn::blake3 {

dwn::schema::hash32_t hash(const std::string_view& str);
dwn::schema::hash32_t hash(const dwn::schema::bytes_view_t& bytes);

}  // namespace dwn::blake3
