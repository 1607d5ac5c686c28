#include <dwn/core/auth.hpp>
#include <dwn/core/index_projector.hpp>
#include <dwn/core/parse.hpp>
#include <dwn/testing/node_fixture.hpp>
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

namespace {

dwn::core::static_key_registry make_registry(
    const dwn::testing::identity& who) {
  auto registry = dwn::core::static_key_registry{};
  registry.add(who.key_id, dwn::schema::public_key_t{who.keys.public_key});
  return registry;
}

dwn::schema::raw_message_t make_read(const dwn::testing::identity& who) {
  return dwn::testing::sign(
      who, dwn::schema::records_read_descriptor_t{
               .date_created = dwn::testing::make_time(1), .record_id = "r1"});
}

dwn::schema::protocol_definition_t make_chat_protocol() {
  auto definition = dwn::schema::protocol_definition_t{};
  definition.protocol = "https://example.com/chat";
  definition.types.push_back(dwn::schema::protocol_type_t{
      .name = "thread",
      .schema = std::string{"https://example.com/schemas/thread"},
      .data_formats = {"application/json"}});
  definition.types.push_back(dwn::schema::protocol_type_t{
      .name = "reply", .schema = std::nullopt, .data_formats = {}});
  definition.rules.push_back(dwn::schema::protocol_rule_t{
      .protocol_path = "thread/reply", .anyone_can = {"write", "read"}});
  return definition;
}

dwn::core::parsed_message<dwn::schema::records_write_descriptor_t>
make_protocol_write(const dwn::testing::identity& author,
                    const std::string& path,
                    const std::optional<std::string>& schema) {
  auto payload = dwn::testing::make_payload("{}");
  auto descriptor = dwn::testing::make_initial_write(
      author, dwn::testing::make_time(1), payload);
  descriptor.protocol = "https://example.com/chat";
  descriptor.protocol_path = path;
  descriptor.schema = schema;
  dwn::core::assign_initial_record_id(descriptor, author.did);
  auto message = dwn::testing::sign(author, descriptor);
  auto error = std::string{};
  auto parsed =
      dwn::core::parse<dwn::schema::records_write_descriptor_t>(message, error);
  EXPECT_TRUE(parsed.has_value()) << error;
  return parsed.value_or(
      dwn::core::parsed_message<dwn::schema::records_write_descriptor_t>{});
}

}  // namespace

TEST(authenticator, accepts_a_valid_signature) {
  auto alice = dwn::testing::make_identity("alice");
  auto authenticator =
      dwn::core::authenticator{make_registry(alice).resolver(), true};
  EXPECT_FALSE(authenticator.authenticate(make_read(alice)).has_value());
}

TEST(authenticator, rejects_unknown_keys_and_forged_signatures) {
  auto alice = dwn::testing::make_identity("alice");
  auto mallory = dwn::testing::make_identity("mallory");
  auto authenticator =
      dwn::core::authenticator{make_registry(alice).resolver(), true};

  auto unknown = authenticator.authenticate(make_read(mallory));
  ASSERT_TRUE(unknown.has_value());
  EXPECT_EQ(unknown->status.code, 401u);

  // Mallory signs while claiming Alice's key id.
  auto forged_signer = dwn::testing::make_signer(mallory);
  forged_signer.key_id = alice.key_id;
  auto forged = dwn::core::make_message(
      dwn::schema::records_read_descriptor_t{
          .date_created = dwn::testing::make_time(1), .record_id = "r1"},
      forged_signer);
  ASSERT_TRUE(forged.has_value());
  auto rejected = authenticator.authenticate(*forged);
  ASSERT_TRUE(rejected.has_value());
  EXPECT_EQ(rejected->status.code, 401u);
  EXPECT_EQ(rejected->status.detail, "signature verification failed");
}

TEST(authenticator, resolver_failures_fail_closed) {
  auto alice = dwn::testing::make_identity("alice");
  auto authenticator = dwn::core::authenticator{
      [](std::string_view) -> std::optional<dwn::schema::public_key_t> {
        throw std::runtime_error{"resolver offline"};
      },
      true};
  auto rejected = authenticator.authenticate(make_read(alice));
  ASSERT_TRUE(rejected.has_value());
  EXPECT_EQ(rejected->status.code, 401u);
}

TEST(authenticator, non_strict_mode_still_requires_a_known_key) {
  auto alice = dwn::testing::make_identity("alice");
  auto mallory = dwn::testing::make_identity("mallory");
  auto authenticator =
      dwn::core::authenticator{make_registry(alice).resolver(), false};

  auto forged_signer = dwn::testing::make_signer(mallory);
  forged_signer.key_id = alice.key_id;
  auto forged = dwn::core::make_message(
      dwn::schema::records_read_descriptor_t{
          .date_created = dwn::testing::make_time(1), .record_id = "r1"},
      forged_signer);
  ASSERT_TRUE(forged.has_value());
  EXPECT_FALSE(authenticator.authenticate(*forged).has_value());
  EXPECT_TRUE(authenticator.authenticate(make_read(mallory)).has_value());
}

TEST(authenticator, custom_verifier_is_used_in_strict_mode) {
  auto alice = dwn::testing::make_identity("alice");
  auto authenticator =
      dwn::core::authenticator{make_registry(alice).resolver(), true};
  authenticator.set_signature_verifier(
      [](const dwn::schema::bytes_view_t&, const dwn::schema::public_key_t&,
         const dwn::schema::signature_t&) { return false; });
  EXPECT_TRUE(authenticator.authenticate(make_read(alice)).has_value());

  authenticator.set_signature_verifier(
      [](const dwn::schema::bytes_view_t&, const dwn::schema::public_key_t&,
         const dwn::schema::signature_t&) -> bool {
        throw std::runtime_error{"verifier crashed"};
      });
  EXPECT_TRUE(authenticator.authenticate(make_read(alice)).has_value());
}

TEST(authorization, tenant_only_methods_reject_other_authors) {
  EXPECT_FALSE(dwn::core::authorize_tenant_only("did:example:alice",
                                                "did:example:alice")
                   .has_value());
  auto denied =
      dwn::core::authorize_tenant_only("did:example:alice", "did:example:bob");
  ASSERT_TRUE(denied.has_value());
  EXPECT_EQ(denied->status.code, 401u);
}

TEST(authorization, protocol_rules_grant_writes_to_anyone) {
  auto bob = dwn::testing::make_identity("bob");
  auto definition = std::optional{make_chat_protocol()};

  auto reply = make_protocol_write(bob, "thread/reply", std::nullopt);
  EXPECT_FALSE(dwn::core::authorize_records_write("did:example:alice", reply,
                                                  definition)
                   .has_value());

  auto thread = make_protocol_write(
      bob, "thread", std::string{"https://example.com/schemas/thread"});
  EXPECT_TRUE(dwn::core::authorize_records_write("did:example:alice", thread,
                                                 definition)
                  .has_value());

  EXPECT_TRUE(dwn::core::authorize_records_write("did:example:alice", reply,
                                                 std::nullopt)
                  .has_value());
}

TEST(authorization, protocol_types_constrain_schema_even_for_the_tenant) {
  auto alice = dwn::testing::make_identity("alice");
  auto definition = std::optional{make_chat_protocol()};

  auto matching = make_protocol_write(
      alice, "thread", std::string{"https://example.com/schemas/thread"});
  EXPECT_FALSE(dwn::core::authorize_records_write(alice.did, matching,
                                                  definition)
                   .has_value());

  auto wrong_schema = make_protocol_write(
      alice, "thread", std::string{"https://example.com/schemas/other"});
  EXPECT_TRUE(dwn::core::authorize_records_write(alice.did, wrong_schema,
                                                 definition)
                  .has_value());

  auto undeclared = make_protocol_write(alice, "thread/image", std::nullopt);
  EXPECT_TRUE(dwn::core::authorize_records_write(alice.did, undeclared,
                                                 definition)
                  .has_value());
}

TEST(authorization, read_access_follows_ownership_and_publication) {
  auto record = dwn::schema::records_write_descriptor_t{};
  record.recipient = "did:example:carol";

  EXPECT_TRUE(dwn::core::can_read("did:example:alice", "did:example:alice",
                                  record, "did:example:bob", std::nullopt));
  EXPECT_TRUE(dwn::core::can_read("did:example:alice", "did:example:bob",
                                  record, "did:example:bob", std::nullopt));
  EXPECT_TRUE(dwn::core::can_read("did:example:alice", "did:example:carol",
                                  record, "did:example:bob", std::nullopt));
  EXPECT_FALSE(dwn::core::can_read("did:example:alice", "did:example:dave",
                                   record, "did:example:bob", std::nullopt));

  record.published = true;
  EXPECT_TRUE(dwn::core::can_read("did:example:alice", "did:example:dave",
                                  record, "did:example:bob", std::nullopt));

  record.published = false;
  record.protocol = "https://example.com/chat";
  record.protocol_path = "thread/reply";
  EXPECT_TRUE(dwn::core::can_read("did:example:alice", "did:example:dave",
                                  record, "did:example:bob",
                                  make_chat_protocol()));
}

TEST(authorization, query_visibility_uses_the_index_row) {
  auto descriptor = dwn::schema::records_write_descriptor_t{};
  descriptor.date_created = dwn::testing::make_time(1);
  descriptor.record_id = "r1";
  descriptor.data_format = "text/plain";
  descriptor.recipient = "did:example:carol";
  auto row =
      dwn::core::project_records_write(descriptor, "did:example:bob", true);

  EXPECT_TRUE(dwn::core::is_visible_to("did:example:alice", "did:example:alice",
                                       row, std::nullopt));
  EXPECT_TRUE(dwn::core::is_visible_to("did:example:alice", "did:example:bob",
                                       row, std::nullopt));
  EXPECT_TRUE(dwn::core::is_visible_to("did:example:alice",
                                       "did:example:carol", row, std::nullopt));
  EXPECT_FALSE(dwn::core::is_visible_to("did:example:alice",
                                        "did:example:dave", row, std::nullopt));

  descriptor.published = true;
  auto published =
      dwn::core::project_records_write(descriptor, "did:example:bob", true);
  EXPECT_TRUE(dwn::core::is_visible_to("did:example:alice", "did:example:dave",
                                       published, std::nullopt));
}

TEST(authorization, query_visibility_matches_read_access_for_protocol_rules) {
  auto descriptor = dwn::schema::records_write_descriptor_t{};
  descriptor.date_created = dwn::testing::make_time(1);
  descriptor.record_id = "r1";
  descriptor.data_format = "text/plain";
  descriptor.protocol = "https://example.com/chat";
  descriptor.protocol_path = "thread/reply";
  auto reply =
      dwn::core::project_records_write(descriptor, "did:example:bob", true);
  auto definition = make_chat_protocol();

  EXPECT_TRUE(dwn::core::can_read("did:example:alice", "did:example:dave",
                                  descriptor, "did:example:bob", definition));
  EXPECT_TRUE(dwn::core::is_visible_to("did:example:alice", "did:example:dave",
                                       reply, definition));
  EXPECT_FALSE(dwn::core::is_visible_to("did:example:alice",
                                        "did:example:dave", reply,
                                        std::nullopt));

  descriptor.protocol_path = "thread";
  auto thread =
      dwn::core::project_records_write(descriptor, "did:example:bob", true);
  EXPECT_FALSE(dwn::core::can_read("did:example:alice", "did:example:dave",
                                   descriptor, "did:example:bob", definition));
  EXPECT_FALSE(dwn::core::is_visible_to("did:example:alice",
                                        "did:example:dave", thread, definition));
}
