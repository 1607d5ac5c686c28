#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

// Message timestamps are fixed width RFC 3339 UTC strings with microsecond
// precision, `YYYY-MM-DDTHH:MM:SS.ffffffZ`, so string order is time order.
namespace dwn::schema {

inline constexpr std::size_t kTimestampLength = 27;

bool is_valid_timestamp(std::string_view value);

std::string make_timestamp(std::chrono::system_clock::time_point time);

std::string current_timestamp();

}  // namespace dwn::schema
