#include <dwn/core/index_projector.hpp>
#include <dwn/core/message_identity.hpp>
#include <dwn/core/parse.hpp>
#include <dwn/handlers/record_state.hpp>
#include <dwn/schema/method_name.hpp>

#include <spdlog/spdlog.h>

namespace dwn::handlers {

namespace {

std::string index_string(const dwn::schema::index_row_t& row,
                         const std::string_view name) {
  const auto* value = dwn::schema::find_index(row, name);
  if (value == nullptr || !std::holds_alternative<std::string>(*value)) {
    return {};
  }
  return std::get<std::string>(*value);
}

}  // namespace

std::optional<stored_write> decode_write(
    const dwn::store::message_entry& entry) {
  const auto& descriptor = entry.stored.message.descriptor;
  if (descriptor.method !=
      dwn::schema::to_string(dwn::schema::method_name_t::write)) {
    return std::nullopt;
  }
  auto error = std::string{};
  auto decoded =
      dwn::core::decode_descriptor<dwn::schema::records_write_descriptor_t>(
          descriptor, error);
  if (!decoded) {
    spdlog::error("Stored write {} does not decode: {}",
                  dwn::schema::to_hex(entry.message_cid), error);
    return std::nullopt;
  }
  return stored_write{entry.message_cid, std::move(*decoded),
                      index_string(entry.stored.indexes,
                                   dwn::schema::kIndexAuthor)};
}

std::vector<dwn::core::message_version> versions_of(
    const std::vector<dwn::store::message_entry>& entries) {
  auto versions = std::vector<dwn::core::message_version>{};
  versions.reserve(entries.size());
  for (const auto& entry : entries) {
    const auto& method = entry.stored.message.descriptor.method;
    auto version = dwn::core::message_version{};
    version.date_created =
        index_string(entry.stored.indexes, dwn::schema::kIndexDateCreated);
    version.message_cid = entry.message_cid;
    if (method == dwn::schema::to_string(dwn::schema::method_name_t::delete_)) {
      version.is_delete = true;
    } else if (auto write = decode_write(entry)) {
      version.is_initial_write =
          dwn::core::is_initial_write(write->descriptor, write->author);
    } else {
      continue;
    }
    versions.push_back(std::move(version));
  }
  return versions;
}

std::optional<stored_write> find_initial_write(
    const std::vector<dwn::store::message_entry>& entries) {
  for (const auto& entry : entries) {
    auto write = decode_write(entry);
    if (write && dwn::core::is_initial_write(write->descriptor, write->author)) {
      return write;
    }
  }
  return std::nullopt;
}

void apply_prune(const std::string_view tenant,
                 const dwn::core::prune_plan& plan,
                 dwn::store::message_store& messages,
                 dwn::store::data_store& data) {
  for (const auto& cid : plan.remove) {
    data.remove(tenant, cid);
    messages.remove(tenant, cid);
    spdlog::debug("Pruned message {}", dwn::schema::to_hex(cid));
  }
  if (!plan.tombstone) {
    return;
  }
  data.remove(tenant, *plan.tombstone);
  auto anchor = messages.get(tenant, *plan.tombstone);
  if (!anchor) {
    return;
  }
  messages.put(tenant, *plan.tombstone, anchor->message,
               dwn::core::with_latest_base_state(std::move(anchor->indexes),
                                                 false));
}

}  // namespace dwn::handlers
