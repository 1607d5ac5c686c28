#pragma once

#include <dwn/schema/index_row.hpp>
#include <dwn/schema/protocols_configure.hpp>
#include <dwn/schema/records_delete.hpp>
#include <dwn/schema/records_query.hpp>
#include <dwn/schema/records_write.hpp>
#include <optional>
#include <string>
#include <string_view>

// Flat index rows of admitted messages.
//
// isLatestBaseState is only ever written on write and configure rows. A
// delete row never carries it, so once a delete is the newest message of a
// record no row of that record matches isLatestBaseState=true.
namespace dwn::core {

dwn::schema::index_row_t project_records_write(
    const dwn::schema::records_write_descriptor_t& descriptor,
    std::string_view author,
    bool is_latest_base_state);

/// `initial_write` is the content id of the record's anchor.
dwn::schema::index_row_t project_records_delete(
    const dwn::schema::records_delete_descriptor_t& descriptor,
    std::string_view author,
    const dwn::schema::content_id_t& initial_write);

dwn::schema::index_row_t project_protocols_configure(
    const dwn::schema::protocols_configure_descriptor_t& descriptor,
    std::string_view author,
    bool is_latest_base_state);

/// Copy of `row` with isLatestBaseState set to `value`. Used to demote a
/// write row that already carried the marker.
dwn::schema::index_row_t with_latest_base_state(dwn::schema::index_row_t row,
                                                bool value);

/// Equality filter matching the current writes selected by `filter`.
dwn::schema::index_row_t current_records_filter(
    const dwn::schema::records_filter_t& filter);

/// Equality filter over every message of a record.
dwn::schema::index_row_t record_messages_filter(std::string_view record_id);

/// Equality filter over the configurations of one protocol, or all of them.
dwn::schema::index_row_t configurations_filter(
    const std::optional<std::string>& protocol);

}  // namespace dwn::core
