#include <boost/program_options.hpp>
#include <dwn/blake3/hash.hpp>
#include <dwn/common/critical.hpp>
#include <dwn/core/message_builder.hpp>
#include <dwn/crypto/sign.hpp>
#include <dwn/schema/encoding/scale/encoder.hpp>
#include <dwn/schema/timestamp.hpp>
#include <dwn/schema/url.hpp>

#include <algorithm>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using encoder_t = dwn::schema::encoding::encoder<
    dwn::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

void print_help(const po::options_description& options) {
  std::cout << "usage: message_builder <keygen|message> [options]\n"
            << "  keygen   prints a new ed25519 private key, its public key\n"
            << "           and the matching --did-key value for dwn_node\n"
            << "  message  prints `<tenant> <base64 message> [<base64 data>]`\n"
            << options << '\n';
}

std::optional<std::string> get_optional(const po::variables_map& vm,
                                        const std::string& name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  return vm[name].as<std::string>();
}

std::string get_required(const po::variables_map& vm, const std::string& name) {
  auto value = get_optional(vm, name);
  if (!value) {
    dwn::common::critical("missing required option --" + name);
  }
  return *value;
}

std::optional<std::string> get_url(const po::variables_map& vm,
                                   const std::string& name) {
  auto value = get_optional(vm, name);
  if (!value) {
    return std::nullopt;
  }
  return dwn::schema::normalize_url(*value);
}

dwn::crypto::ed25519_key_pair load_key_pair(const po::variables_map& vm) {
  auto bytes = dwn::schema::try_from_hex(get_required(vm, "private-key"));
  auto private_key = dwn::crypto::ed25519_private_key_t{};
  if (!bytes || bytes->size() != private_key.size()) {
    dwn::common::critical("private-key must be 32 hex encoded bytes");
  }
  std::copy(std::begin(*bytes), std::end(*bytes), std::begin(private_key));
  auto pair = dwn::crypto::make_ed25519_key_pair(private_key);
  if (!pair) {
    dwn::common::critical("private-key is not a valid ed25519 key");
  }
  return *pair;
}

dwn::core::message_signer make_signer(const po::variables_map& vm) {
  auto pair = load_key_pair(vm);
  return dwn::core::message_signer{
      .key_id = get_required(vm, "key-id"),
      .sign = [private_key = pair.private_key](
                  const dwn::schema::bytes_view_t& message)
          -> std::optional<dwn::schema::signature_t> {
        auto signature = dwn::crypto::sign_ed25519(message, private_key);
        if (!signature) {
          return std::nullopt;
        }
        return dwn::schema::signature_t{*signature};
      }};
}

// `name` or `name|schema|format,format`.
dwn::schema::protocol_type_t parse_protocol_type(const std::string& spec) {
  auto type = dwn::schema::protocol_type_t{};
  auto first = spec.find('|');
  type.name = spec.substr(0, first);
  if (first == std::string::npos) {
    return type;
  }
  auto second = spec.find('|', first + 1);
  auto schema = spec.substr(first + 1, second - first - 1);
  if (!schema.empty()) {
    type.schema = dwn::schema::normalize_url(schema);
  }
  if (second == std::string::npos) {
    return type;
  }
  auto formats = std::string_view{spec}.substr(second + 1);
  while (!formats.empty()) {
    auto comma = formats.find(',');
    type.data_formats.emplace_back(formats.substr(0, comma));
    if (comma == std::string_view::npos) {
      break;
    }
    formats.remove_prefix(comma + 1);
  }
  return type;
}

// `path=action,action`.
dwn::schema::protocol_rule_t parse_protocol_rule(const std::string& spec) {
  auto equals = spec.find('=');
  if (equals == std::string::npos) {
    dwn::common::critical("rule must look like <path>=<action>[,<action>]");
  }
  auto rule = dwn::schema::protocol_rule_t{};
  rule.protocol_path = spec.substr(0, equals);
  auto actions = std::string_view{spec}.substr(equals + 1);
  while (!actions.empty()) {
    auto comma = actions.find(',');
    rule.anyone_can.emplace_back(actions.substr(0, comma));
    if (comma == std::string_view::npos) {
      break;
    }
    actions.remove_prefix(comma + 1);
  }
  return rule;
}

std::optional<dwn::schema::raw_message_t> build_message(
    const po::variables_map& vm,
    const std::string& method,
    const std::optional<dwn::schema::bytes_t>& data) {
  auto signer = make_signer(vm);
  auto date_created = get_optional(vm, "date-created")
                          .value_or(dwn::schema::current_timestamp());

  if (method == "records-write") {
    auto descriptor = dwn::schema::records_write_descriptor_t{};
    descriptor.date_created = date_created;
    descriptor.protocol = get_url(vm, "protocol");
    descriptor.protocol_path = get_optional(vm, "protocol-path");
    descriptor.schema = get_url(vm, "schema");
    descriptor.recipient = get_optional(vm, "recipient");
    descriptor.data_format = vm["data-format"].as<std::string>();
    descriptor.published = vm.contains("published");
    if (!data) {
      dwn::common::critical("records-write requires --data");
    }
    descriptor.data_cid = dwn::blake3::hash(
        dwn::schema::bytes_view_t{data->data(), data->size()});
    descriptor.data_size = data->size();
    if (auto record_id = get_optional(vm, "record-id")) {
      descriptor.record_id = *record_id;
    } else {
      auto author = dwn::core::author_of_key_id(signer.key_id);
      if (!author) {
        dwn::common::critical("key-id must look like <did>#<fragment>");
      }
      dwn::core::assign_initial_record_id(descriptor, *author);
    }
    return dwn::core::make_message(descriptor, signer);
  }
  if (method == "records-delete") {
    return dwn::core::make_message(
        dwn::schema::records_delete_descriptor_t{
            .date_created = date_created,
            .record_id = get_required(vm, "record-id")},
        signer);
  }
  if (method == "records-read") {
    return dwn::core::make_message(
        dwn::schema::records_read_descriptor_t{
            .date_created = date_created,
            .record_id = get_required(vm, "record-id")},
        signer);
  }
  if (method == "records-query") {
    auto descriptor = dwn::schema::records_query_descriptor_t{};
    descriptor.date_created = date_created;
    descriptor.filter.record_id = get_optional(vm, "record-id");
    descriptor.filter.protocol = get_url(vm, "protocol");
    descriptor.filter.protocol_path = get_optional(vm, "protocol-path");
    descriptor.filter.schema = get_url(vm, "schema");
    descriptor.filter.recipient = get_optional(vm, "recipient");
    descriptor.date_sort = get_optional(vm, "date-sort");
    return dwn::core::make_message(descriptor, signer);
  }
  if (method == "protocols-configure") {
    auto descriptor = dwn::schema::protocols_configure_descriptor_t{};
    descriptor.date_created = date_created;
    descriptor.definition.protocol =
        dwn::schema::normalize_url(get_required(vm, "protocol"));
    if (vm.contains("type")) {
      for (const auto& spec : vm["type"].as<std::vector<std::string>>()) {
        descriptor.definition.types.push_back(parse_protocol_type(spec));
      }
    }
    if (vm.contains("rule")) {
      for (const auto& spec : vm["rule"].as<std::vector<std::string>>()) {
        descriptor.definition.rules.push_back(parse_protocol_rule(spec));
      }
    }
    return dwn::core::make_message(descriptor, signer);
  }
  if (method == "protocols-query") {
    auto descriptor = dwn::schema::protocols_query_descriptor_t{};
    descriptor.date_created = date_created;
    descriptor.filter.protocol = get_url(vm, "protocol");
    return dwn::core::make_message(descriptor, signer);
  }
  if (method == "events-get") {
    auto descriptor = dwn::schema::events_get_descriptor_t{};
    descriptor.date_created = date_created;
    if (vm.contains("watermark")) {
      descriptor.watermark = vm["watermark"].as<uint64_t>();
    }
    return dwn::core::make_message(descriptor, signer);
  }
  if (method == "messages-get") {
    auto descriptor = dwn::schema::messages_get_descriptor_t{};
    descriptor.date_created = date_created;
    if (vm.contains("message-cid")) {
      for (const auto& hex :
           vm["message-cid"].as<std::vector<std::string>>()) {
        auto cid = dwn::schema::try_make_hash32(hex);
        if (!cid) {
          dwn::common::critical("message-cid must be 32 hex encoded bytes");
        }
        descriptor.message_cids.push_back(*cid);
      }
    }
    return dwn::core::make_message(descriptor, signer);
  }
  dwn::common::critical("unsupported --method " + method);
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"message_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command), "keygen|message")(
      "method", po::value<std::string>(),
      "records-write|records-delete|records-read|records-query|"
      "protocols-configure|protocols-query|events-get|messages-get")(
      "tenant", po::value<std::string>(), "tenant DID the message is sent to")(
      "key-id", po::value<std::string>(), "signing key id <did>#<fragment>")(
      "private-key", po::value<std::string>(), "ed25519 private key hex")(
      "date-created", po::value<std::string>(),
      "timestamp, defaults to now")("record-id", po::value<std::string>(),
                                    "record id, new record when omitted")(
      "protocol", po::value<std::string>(), "protocol URL")(
      "protocol-path", po::value<std::string>(), "protocol path")(
      "schema", po::value<std::string>(), "schema URL")(
      "recipient", po::value<std::string>(), "recipient DID")(
      "data-format",
      po::value<std::string>()->default_value("application/octet-stream"),
      "payload media type")("data", po::value<std::string>(),
                            "payload text")("published", "publish the record")(
      "date-sort", po::value<std::string>(),
      "createdAscending|createdDescending")(
      "type", po::value<std::vector<std::string>>()->multitoken(),
      "protocol type name[|schema[|format,...]]")(
      "rule", po::value<std::vector<std::string>>()->multitoken(),
      "protocol rule path=action[,action]")(
      "watermark", po::value<uint64_t>(), "events after this watermark")(
      "message-cid", po::value<std::vector<std::string>>()->multitoken(),
      "message content id hex");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "keygen") {
    auto pair = dwn::crypto::generate_ed25519_key_pair();
    if (!pair) {
      dwn::common::critical("failed to generate an ed25519 key");
    }
    auto public_hex = dwn::schema::to_hex(pair->public_key.public_key);
    std::cout << "private-key " << dwn::schema::to_hex(pair->private_key)
              << '\n'
              << "public-key  " << public_hex << '\n';
    if (auto key_id = get_optional(vm, "key-id")) {
      std::cout << "did-key     " << *key_id << "=ed25519:" << public_hex
                << '\n';
    }
    return 0;
  }

  if (command == "message") {
    auto data = std::optional<dwn::schema::bytes_t>{};
    if (auto text = get_optional(vm, "data")) {
      data = dwn::schema::make_bytes(*text);
    }
    auto message = build_message(vm, get_required(vm, "method"), data);
    if (!message) {
      dwn::common::critical("failed to sign message");
    }
    auto encoded = encoder_t{}.encode(*message);
    std::cout << get_optional(vm, "tenant").value_or("-") << ' '
              << dwn::schema::to_base64(encoded);
    if (data) {
      std::cout << ' ' << dwn::schema::to_base64(*data);
    }
    std::cout << '\n';
    return 0;
  }

  dwn::common::critical("command must be keygen|message");
}
