#pragma once

#include <dwn/schema/primitives.hpp>
#include <dwn/schema/timestamp.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace dwn::testing {

inline dwn::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = dwn::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Content id whose every byte is `fill`.
inline dwn::schema::content_id_t make_filled_cid(const uint8_t fill) {
  auto out = dwn::schema::content_id_t{};
  out.fill(fill);
  return out;
}

/// Fixed test clock: 2024-01-01T00:00:00 plus `seconds`.
inline std::string make_time(const int64_t seconds) {
  constexpr auto kBase = int64_t{1704067200};
  return dwn::schema::make_timestamp(std::chrono::system_clock::time_point{
      std::chrono::seconds{kBase + seconds}});
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace dwn::testing
