#include <dwn/schema/url.hpp>

#include <algorithm>
#include <cctype>

namespace dwn::schema {

namespace {

constexpr auto kSchemeSeparator = std::string_view{"://"};

void lower(std::string& value, const std::size_t from, const std::size_t to) {
  std::transform(std::begin(value) + static_cast<std::ptrdiff_t>(from),
                 std::begin(value) + static_cast<std::ptrdiff_t>(to),
                 std::begin(value) + static_cast<std::ptrdiff_t>(from),
                 [](const unsigned char ch) {
                   return static_cast<char>(std::tolower(ch));
                 });
}

}  // namespace

std::string normalize_url(const std::string_view url) {
  auto out = std::string{url};
  auto scheme_end = out.find(kSchemeSeparator);
  if (scheme_end == std::string::npos) {
    out.insert(0, "http://");
    scheme_end = 4;
  }
  auto host_begin = scheme_end + kSchemeSeparator.size();
  auto host_end = out.find('/', host_begin);
  if (host_end == std::string::npos) {
    host_end = out.size();
  }
  lower(out, 0, host_end);
  while (out.size() > host_begin && out.back() == '/') {
    out.pop_back();
  }
  return out;
}

bool is_normalized_url(const std::string_view url) {
  return !url.empty() && normalize_url(url) == url;
}

}  // namespace dwn::schema
