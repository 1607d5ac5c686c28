#include <gtest/gtest.h>
#include <dwn/schema/interface_name.hpp>
#include <dwn/schema/message_kind.hpp>
#include <dwn/schema/method_name.hpp>
#include <dwn/schema/records_query.hpp>

#include <cstddef>

TEST(wire_names, parse_and_print_interfaces) {
  using dwn::schema::interface_name_t;
  EXPECT_EQ(dwn::schema::try_from_string<interface_name_t>("Records"),
            interface_name_t::records);
  EXPECT_EQ(dwn::schema::try_from_string<interface_name_t>("Messages"),
            interface_name_t::messages);
  EXPECT_EQ(dwn::schema::to_string(interface_name_t::protocols), "Protocols");
  EXPECT_EQ(dwn::schema::to_string(interface_name_t::events), "Events");
}

TEST(wire_names, parse_and_print_methods) {
  using dwn::schema::method_name_t;
  EXPECT_EQ(dwn::schema::try_from_string<method_name_t>("Delete"),
            method_name_t::delete_);
  EXPECT_EQ(dwn::schema::try_from_string<method_name_t>("Get"),
            method_name_t::get);
  EXPECT_EQ(dwn::schema::to_string(method_name_t::configure), "Configure");
  EXPECT_EQ(dwn::schema::to_string(method_name_t::get), "Get");
}

TEST(wire_names, parse_and_print_date_sort) {
  using dwn::schema::date_sort_t;
  EXPECT_EQ(dwn::schema::try_from_string<date_sort_t>("createdDescending"),
            date_sort_t::created_descending);
  EXPECT_EQ(dwn::schema::to_string(date_sort_t::created_ascending),
            "createdAscending");
}

TEST(wire_names, unknown_or_miscased_names_are_rejected) {
  EXPECT_FALSE(
      dwn::schema::try_from_string<dwn::schema::interface_name_t>("records"));
  EXPECT_FALSE(
      dwn::schema::try_from_string<dwn::schema::method_name_t>("Subscribe"));
  EXPECT_FALSE(dwn::schema::try_from_string<dwn::schema::date_sort_t>(""));
}

TEST(wire_names, every_message_kind_classifies_back_to_itself) {
  for (std::size_t i = 0; i < dwn::schema::kMessageKindCount; ++i) {
    auto kind = static_cast<dwn::schema::message_kind_t>(i);
    auto [interface_name, method] = dwn::schema::names_of(kind);
    EXPECT_EQ(dwn::schema::classify(interface_name, method), kind);
  }
  EXPECT_FALSE(dwn::schema::classify(dwn::schema::interface_name_t::events,
                                     dwn::schema::method_name_t::write));
}
