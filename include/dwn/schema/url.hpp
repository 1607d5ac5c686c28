#pragma once

#include <string>
#include <string_view>

// Protocol and schema URLs are compared as strings, so they are kept in one
// normalized spelling: explicit scheme, lower case scheme and host, no
// trailing '/'.
namespace dwn::schema {

std::string normalize_url(std::string_view url);

bool is_normalized_url(std::string_view url);

}  // namespace dwn::schema
