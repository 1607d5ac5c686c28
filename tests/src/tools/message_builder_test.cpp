#include <dwn/core/message_identity.hpp>
#include <dwn/core/parse.hpp>
#include <dwn/schema/encoding/scale/encoder.hpp>
#include <dwn/schema/primitives.hpp>
#include <dwn/schema/raw_message.hpp>
#include <dwn/schema/records_write.hpp>
#include <gtest/gtest.h>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <sys/wait.h>

#ifndef DWN_MESSAGE_BUILDER_PATH
#define DWN_MESSAGE_BUILDER_PATH ""
#endif

namespace {

using encoder_t =
    dwn::schema::encoding::encoder<dwn::schema::encoding::scale_encoder_tag>;

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1 || WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

std::vector<std::string> split_words(const std::string& text) {
  auto stream = std::istringstream{text};
  auto words = std::vector<std::string>{};
  for (auto word = std::string{}; stream >> word;) {
    words.push_back(word);
  }
  return words;
}

std::string builder_path() {
  return std::string{DWN_MESSAGE_BUILDER_PATH};
}

std::string run_builder(const std::string_view args) {
  auto command = shell_quote(builder_path()) + " " + std::string{args};
  auto [exit_code, output] = run_capture(command);
  EXPECT_EQ(exit_code, 0) << "command failed: " << command << '\n' << output;
  return output;
}

struct generated_key final {
  std::string private_key;
  std::string public_key;
  std::string did_key;
};

generated_key keygen(const std::string& key_id) {
  auto words = split_words(run_builder("keygen --key-id " + shell_quote(key_id)));
  auto key = generated_key{};
  for (std::size_t i = 0; i + 1 < words.size(); i += 2) {
    if (words[i] == "private-key") {
      key.private_key = words[i + 1];
    } else if (words[i] == "public-key") {
      key.public_key = words[i + 1];
    } else if (words[i] == "did-key") {
      key.did_key = words[i + 1];
    }
  }
  return key;
}

}  // namespace

TEST(message_builder, keygen_prints_a_usable_key) {
  if (builder_path().empty() || !std::filesystem::exists(builder_path())) {
    GTEST_SKIP() << "message_builder binary not available: " << builder_path();
  }

  auto key = keygen("did:example:alice#key-1");
  EXPECT_EQ(key.private_key.size(), 64u);
  EXPECT_EQ(key.public_key.size(), 64u);
  EXPECT_EQ(key.did_key, "did:example:alice#key-1=ed25519:" + key.public_key);
}

TEST(message_builder, records_write_line_decodes) {
  if (builder_path().empty() || !std::filesystem::exists(builder_path())) {
    GTEST_SKIP() << "message_builder binary not available: " << builder_path();
  }

  auto key = keygen("did:example:alice#key-1");
  auto output = run_builder(
      "message --method records-write --tenant did:example:alice"
      " --key-id 'did:example:alice#key-1' --private-key " +
      key.private_key +
      " --date-created 2024-01-01T00:00:00.000000Z --data hello"
      " --data-format text/plain --published");
  auto words = split_words(output);
  ASSERT_EQ(words.size(), 3u) << output;
  EXPECT_EQ(words[0], "did:example:alice");

  auto encoded = dwn::schema::try_from_base64(words[1]);
  ASSERT_TRUE(encoded.has_value());
  auto message = encoder_t{}.try_decode<dwn::schema::raw_message_t>(
      dwn::schema::bytes_view_t{encoded->data(), encoded->size()});
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(message->descriptor.interface_name, "Records");
  EXPECT_EQ(message->descriptor.method, "Write");

  auto error = std::string{};
  auto write =
      dwn::core::parse<dwn::schema::records_write_descriptor_t>(*message, error);
  ASSERT_TRUE(write.has_value()) << error;
  EXPECT_EQ(write->author, "did:example:alice");
  EXPECT_EQ(write->descriptor.data_format, "text/plain");
  EXPECT_TRUE(write->descriptor.published);
  EXPECT_TRUE(dwn::core::is_initial_write(write->descriptor, write->author));

  auto payload = dwn::schema::try_from_base64(words[2]);
  ASSERT_TRUE(payload.has_value());
  EXPECT_EQ(*payload, dwn::schema::make_bytes(std::string_view{"hello"}));
}

TEST(message_builder, events_get_line_has_no_payload) {
  if (builder_path().empty() || !std::filesystem::exists(builder_path())) {
    GTEST_SKIP() << "message_builder binary not available: " << builder_path();
  }

  auto key = keygen("did:example:alice#key-1");
  auto output = run_builder(
      "message --method events-get --key-id 'did:example:alice#key-1'"
      " --private-key " +
      key.private_key + " --watermark 7");
  auto words = split_words(output);
  ASSERT_EQ(words.size(), 2u) << output;
  EXPECT_EQ(words[0], "-");

  auto encoded = dwn::schema::try_from_base64(words[1]);
  ASSERT_TRUE(encoded.has_value());
  auto message = encoder_t{}.try_decode<dwn::schema::raw_message_t>(
      dwn::schema::bytes_view_t{encoded->data(), encoded->size()});
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(message->descriptor.interface_name, "Events");
  EXPECT_EQ(message->descriptor.method, "Get");
}

TEST(message_builder, missing_option_is_fatal_and_logged) {
  if (builder_path().empty() || !std::filesystem::exists(builder_path())) {
    GTEST_SKIP() << "message_builder binary not available: " << builder_path();
  }

  auto [exit_code, output] = run_capture(
      shell_quote(builder_path()) +
      " message --method events-get --key-id 'did:example:alice#key-1' 2>&1");
  EXPECT_NE(exit_code, 0) << output;
  EXPECT_NE(output.find("missing required option --private-key"),
            std::string::npos)
      << output;
}
