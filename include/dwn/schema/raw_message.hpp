#pragma once

#include <dwn/schema/authorization.hpp>
#include <dwn/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: raw message.
// Wire envelope accepted by the dispatcher. Interface and method stay plain
// strings so shape checks can run before any method specific decoding;
// `fields` carries the SCALE encoded method descriptor.
namespace dwn::schema {

template <uint16_t Version>
struct raw_descriptor;

template <>
struct raw_descriptor<1> final {
  std::string interface_name;
  std::string method;
  bytes_t fields;
};

using raw_descriptor_t = raw_descriptor<1>;

template <uint16_t Version>
struct raw_message;

template <>
struct raw_message<1> final {
  raw_descriptor_t descriptor;
  std::optional<authorization_t> authorization;
};

using raw_message_t = raw_message<1>;

}  // namespace dwn::schema
