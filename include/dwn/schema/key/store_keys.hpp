#pragma once

#include <dwn/schema/index_row.hpp>
#include <dwn/schema/key/builder.hpp>
#include <dwn/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <variant>

// Schema key type: store keys.
// Every key starts with a keyspace prefix and the hashed tenant, so a tenant
// prefix scan can never reach another tenant's rows.
namespace dwn::schema::key {

inline constexpr std::string_view kMessageKeyPrefix{"MSG|"};
inline constexpr std::string_view kIndexKeyPrefix{"IDX|"};
inline constexpr std::string_view kDataKeyPrefix{"DATA|"};
inline constexpr std::string_view kEventKeyPrefix{"EVT|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"EVTSEQ|"};

inline constexpr uint8_t kIndexValueString = 0;
inline constexpr uint8_t kIndexValueNumber = 1;
inline constexpr uint8_t kIndexValueBool = 2;

inline builder tenant_prefix(const std::string_view prefix,
                             const std::string_view tenant) {
  auto out = builder{};
  out.write(prefix).hash(tenant);
  return out;
}

inline bytes_t make_message_prefix(const std::string_view tenant) {
  return tenant_prefix(kMessageKeyPrefix, tenant).data;
}

inline bytes_t make_message_key(const std::string_view tenant,
                                const content_id_t& cid) {
  return tenant_prefix(kMessageKeyPrefix, tenant)
      .write(std::span<const uint8_t>{cid.data(), cid.size()})
      .data;
}

/// Prefix of every row carrying `entry` for the tenant; message cids follow.
inline bytes_t make_index_prefix(const std::string_view tenant,
                                 const index_entry_t& entry) {
  auto out = tenant_prefix(kIndexKeyPrefix, tenant);
  out.hash(entry.name);
  std::visit(overloaded{[&out](const std::string& value) {
                          out.write(kIndexValueString).hash(value);
                        },
                        [&out](const uint64_t value) {
                          out.write(kIndexValueNumber).write_ordered(value);
                        },
                        [&out](const bool value) {
                          out.write(kIndexValueBool)
                              .write(static_cast<uint8_t>(value ? 1 : 0));
                        }},
             entry.value);
  return out.data;
}

inline bytes_t make_index_key(const std::string_view tenant,
                              const index_entry_t& entry,
                              const content_id_t& cid) {
  auto out = make_index_prefix(tenant, entry);
  out.insert(std::end(out), std::begin(cid), std::end(cid));
  return out;
}

inline bytes_t make_data_key(const std::string_view tenant,
                             const content_id_t& cid) {
  return tenant_prefix(kDataKeyPrefix, tenant)
      .write(std::span<const uint8_t>{cid.data(), cid.size()})
      .data;
}

inline bytes_t make_event_prefix(const std::string_view tenant) {
  return tenant_prefix(kEventKeyPrefix, tenant).data;
}

inline bytes_t make_event_key(const std::string_view tenant,
                              const uint64_t sequence) {
  return tenant_prefix(kEventKeyPrefix, tenant).write_ordered(sequence).data;
}

inline bytes_t make_event_seq_key(const std::string_view tenant) {
  return tenant_prefix(kEventSeqKeyPrefix, tenant).data;
}

}  // namespace dwn::schema::key
