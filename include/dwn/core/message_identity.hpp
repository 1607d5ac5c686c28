#pragma once

#include <dwn/schema/authorization.hpp>
#include <dwn/schema/primitives.hpp>
#include <dwn/schema/raw_message.hpp>
#include <dwn/schema/records_write.hpp>
#include <optional>
#include <string>
#include <string_view>

// Content addressing of messages. Every id is BLAKE3 over a SCALE encoding,
// so equal logical messages hash equal on every node.
namespace dwn::core {

/// Content id of the whole message: descriptor and authorization.
dwn::schema::content_id_t identity_of(
    const dwn::schema::raw_message_t& message);

/// Content id of the descriptor alone; the authorization payload signs it.
dwn::schema::content_id_t descriptor_cid_of(
    const dwn::schema::raw_descriptor_t& descriptor);

/// Bytes covered by a message signature.
dwn::schema::bytes_t signing_bytes_of(
    const dwn::schema::authorization_payload_t& payload);

/// Entry id of a RecordsWrite: its descriptor with `record_id` cleared,
/// bound to the author.
dwn::schema::content_id_t entry_id_of(
    const dwn::schema::records_write_descriptor_t& descriptor,
    std::string_view author);

/// A RecordsWrite starts its record when the record id is its own entry id.
bool is_initial_write(const dwn::schema::records_write_descriptor_t& descriptor,
                      std::string_view author);

/// DID part of a `<did>#<fragment>` key id. Both parts must be non empty.
std::optional<std::string> author_of_key_id(std::string_view key_id);

/// Signer DID of the message's first signature, when it has one.
std::optional<std::string> author_of(const dwn::schema::raw_message_t& message);

}  // namespace dwn::core
