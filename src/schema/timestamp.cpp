#include <dwn/schema/timestamp.hpp>

#include <spdlog/fmt/fmt.h>

#include <cctype>
#include <ctime>

namespace dwn::schema {

namespace {

bool digits(const std::string_view value, const std::size_t offset,
            const std::size_t count) {
  for (auto i = offset; i < offset + count; ++i) {
    if (std::isdigit(static_cast<unsigned char>(value[i])) == 0) {
      return false;
    }
  }
  return true;
}

int number(const std::string_view value, const std::size_t offset,
           const std::size_t count) {
  auto out = 0;
  for (auto i = offset; i < offset + count; ++i) {
    out = (out * 10) + (value[i] - '0');
  }
  return out;
}

}  // namespace

bool is_valid_timestamp(const std::string_view value) {
  if (value.size() != kTimestampLength) {
    return false;
  }
  if (value[4] != '-' || value[7] != '-' || value[10] != 'T' ||
      value[13] != ':' || value[16] != ':' || value[19] != '.' ||
      value[26] != 'Z') {
    return false;
  }
  if (!digits(value, 0, 4) || !digits(value, 5, 2) || !digits(value, 8, 2) ||
      !digits(value, 11, 2) || !digits(value, 14, 2) ||
      !digits(value, 17, 2) || !digits(value, 20, 6)) {
    return false;
  }
  auto month = number(value, 5, 2);
  auto day = number(value, 8, 2);
  auto hour = number(value, 11, 2);
  auto minute = number(value, 14, 2);
  auto second = number(value, 17, 2);
  return month >= 1 && month <= 12 && day >= 1 && day <= 31 && hour <= 23 &&
         minute <= 59 && second <= 60;
}

std::string make_timestamp(const std::chrono::system_clock::time_point time) {
  auto since_epoch = std::chrono::duration_cast<std::chrono::microseconds>(
      time.time_since_epoch());
  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
  auto micros = (since_epoch - seconds).count();
  auto raw = static_cast<std::time_t>(seconds.count());
  auto utc = std::tm{};
  gmtime_r(&raw, &utc);
  return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}Z",
                     utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                     utc.tm_hour, utc.tm_min, utc.tm_sec, micros);
}

std::string current_timestamp() {
  return make_timestamp(std::chrono::system_clock::now());
}

}  // namespace dwn::schema
