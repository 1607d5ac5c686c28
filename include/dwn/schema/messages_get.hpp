#pragma once

#include <dwn/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: messages get descriptor.
namespace dwn::schema {

template <uint16_t Version>
struct messages_get_descriptor;

template <>
struct messages_get_descriptor<1> final {
  std::string date_created;
  std::vector<content_id_t> message_cids;
};

using messages_get_descriptor_t = messages_get_descriptor<1>;

}  // namespace dwn::schema
