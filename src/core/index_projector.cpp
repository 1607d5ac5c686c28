#include <dwn/core/index_projector.hpp>
#include <dwn/schema/interface_name.hpp>
#include <dwn/schema/method_name.hpp>

#include <algorithm>
#include <utility>

namespace dwn::core {

namespace {

using dwn::schema::index_entry_t;
using dwn::schema::index_row_t;

void add(index_row_t& row,
         const std::string_view name,
         dwn::schema::index_value_t value) {
  row.push_back(index_entry_t{std::string{name}, std::move(value)});
}

void add_optional(index_row_t& row,
                  const std::string_view name,
                  const std::optional<std::string>& value) {
  if (value) {
    add(row, name, dwn::schema::index_value_t{*value});
  }
}

index_row_t base_row(const dwn::schema::interface_name_t interface_name,
                     const dwn::schema::method_name_t method) {
  auto row = index_row_t{};
  add(row, dwn::schema::kIndexInterface,
      std::string{dwn::schema::to_string(interface_name)});
  add(row, dwn::schema::kIndexMethod,
      std::string{dwn::schema::to_string(method)});
  return row;
}

}  // namespace

index_row_t project_records_write(
    const dwn::schema::records_write_descriptor_t& descriptor,
    const std::string_view author,
    const bool is_latest_base_state) {
  auto row = base_row(dwn::schema::interface_name_t::records,
                      dwn::schema::method_name_t::write);
  add(row, dwn::schema::kIndexDateCreated, descriptor.date_created);
  add(row, dwn::schema::kIndexRecordId, descriptor.record_id);
  add(row, dwn::schema::kIndexAuthor, std::string{author});
  add_optional(row, dwn::schema::kIndexProtocol, descriptor.protocol);
  add_optional(row, dwn::schema::kIndexProtocolPath, descriptor.protocol_path);
  add_optional(row, dwn::schema::kIndexSchema, descriptor.schema);
  add_optional(row, dwn::schema::kIndexRecipient, descriptor.recipient);
  add(row, dwn::schema::kIndexDataFormat, descriptor.data_format);
  add(row, dwn::schema::kIndexDataCid,
      dwn::schema::to_hex(descriptor.data_cid));
  add(row, dwn::schema::kIndexDataSize, descriptor.data_size);
  add(row, dwn::schema::kIndexPublished, descriptor.published);
  add(row, dwn::schema::kIndexIsLatestBaseState, is_latest_base_state);
  return row;
}

index_row_t project_records_delete(
    const dwn::schema::records_delete_descriptor_t& descriptor,
    const std::string_view author,
    const dwn::schema::content_id_t& initial_write) {
  auto row = base_row(dwn::schema::interface_name_t::records,
                      dwn::schema::method_name_t::delete_);
  add(row, dwn::schema::kIndexDateCreated, descriptor.date_created);
  add(row, dwn::schema::kIndexRecordId, descriptor.record_id);
  add(row, dwn::schema::kIndexAuthor, std::string{author});
  add(row, dwn::schema::kIndexInitialWrite, dwn::schema::to_hex(initial_write));
  return row;
}

index_row_t project_protocols_configure(
    const dwn::schema::protocols_configure_descriptor_t& descriptor,
    const std::string_view author,
    const bool is_latest_base_state) {
  auto row = base_row(dwn::schema::interface_name_t::protocols,
                      dwn::schema::method_name_t::configure);
  add(row, dwn::schema::kIndexDateCreated, descriptor.date_created);
  add(row, dwn::schema::kIndexProtocol, descriptor.definition.protocol);
  add(row, dwn::schema::kIndexAuthor, std::string{author});
  add(row, dwn::schema::kIndexIsLatestBaseState, is_latest_base_state);
  return row;
}

index_row_t with_latest_base_state(index_row_t row, const bool value) {
  auto found = std::find_if(std::begin(row), std::end(row),
                            [](const index_entry_t& entry) {
                              return entry.name ==
                                     dwn::schema::kIndexIsLatestBaseState;
                            });
  if (found == std::end(row)) {
    return row;
  }
  found->value = value;
  return row;
}

index_row_t current_records_filter(const dwn::schema::records_filter_t& filter) {
  // The store scans on the first entry, so the record id leads when given.
  auto row = index_row_t{};
  add_optional(row, dwn::schema::kIndexRecordId, filter.record_id);
  for (auto& entry : base_row(dwn::schema::interface_name_t::records,
                              dwn::schema::method_name_t::write)) {
    row.push_back(std::move(entry));
  }
  add(row, dwn::schema::kIndexIsLatestBaseState, true);
  add_optional(row, dwn::schema::kIndexProtocol, filter.protocol);
  add_optional(row, dwn::schema::kIndexProtocolPath, filter.protocol_path);
  add_optional(row, dwn::schema::kIndexSchema, filter.schema);
  add_optional(row, dwn::schema::kIndexRecipient, filter.recipient);
  add_optional(row, dwn::schema::kIndexDataFormat, filter.data_format);
  return row;
}

index_row_t record_messages_filter(const std::string_view record_id) {
  auto row = index_row_t{};
  add(row, dwn::schema::kIndexRecordId, std::string{record_id});
  add(row, dwn::schema::kIndexInterface,
      std::string{dwn::schema::to_string(dwn::schema::interface_name_t::records)});
  return row;
}

index_row_t configurations_filter(const std::optional<std::string>& protocol) {
  auto row = base_row(dwn::schema::interface_name_t::protocols,
                      dwn::schema::method_name_t::configure);
  add_optional(row, dwn::schema::kIndexProtocol, protocol);
  return row;
}

}  // namespace dwn::core
