#include <dwn/core/message_identity.hpp>
#include <dwn/node/config.hpp>

#include <boost/program_options.hpp>

#include <algorithm>
#include <array>
#include <fstream>
#include <sstream>

namespace dwn::node {

namespace po = boost::program_options;

namespace {

template <std::size_t N>
std::optional<std::array<uint8_t, N>> fixed_key(const std::string_view hex) {
  auto bytes = dwn::schema::try_from_hex(hex);
  if (!bytes || bytes->size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(std::begin(*bytes), std::end(*bytes), std::begin(out));
  return out;
}

}  // namespace

std::optional<std::pair<std::string, dwn::schema::public_key_t>>
parse_key_spec(const std::string_view spec, std::string& error) {
  auto equals = spec.find('=');
  if (equals == std::string_view::npos) {
    error = "did key '" + std::string{spec} +
            "' must look like <key_id>=<type>:<hex>";
    return std::nullopt;
  }
  auto key_id = std::string{spec.substr(0, equals)};
  if (!dwn::core::author_of_key_id(key_id)) {
    error = "key id '" + key_id + "' is not of the form <did>#<fragment>";
    return std::nullopt;
  }

  auto material = spec.substr(equals + 1);
  auto colon = material.find(':');
  if (colon == std::string_view::npos) {
    error = "did key '" + std::string{spec} + "' is missing a key type";
    return std::nullopt;
  }
  auto type = material.substr(0, colon);
  auto hex = material.substr(colon + 1);
  if (type == "ed25519") {
    if (auto key = fixed_key<32>(hex)) {
      return std::pair{key_id, dwn::schema::public_key_t{
                                   dwn::schema::ed25519_public_key_t{*key}}};
    }
    error = "ed25519 key of '" + key_id + "' must be 32 hex encoded bytes";
    return std::nullopt;
  }
  if (type == "secp256k1") {
    if (auto key = fixed_key<33>(hex)) {
      return std::pair{key_id, dwn::schema::public_key_t{
                                   dwn::schema::secp256k1_public_key_t{*key}}};
    }
    error = "secp256k1 key of '" + key_id +
            "' must be 33 hex encoded bytes (compressed)";
    return std::nullopt;
  }
  error = "unknown key type '" + std::string{type} + "'";
  return std::nullopt;
}

std::optional<node_config> parse_config(const int argc,
                                        const char* const argv[],
                                        std::string& error) {
  auto config = node_config{};
  auto config_file = std::string{};
  auto did_keys = std::vector<std::string>{};
  auto log_level = std::string{};
  auto strict_crypto = true;

  auto description = po::options_description{"dwn_node"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_file),
      "INI file with any of the options below")(
      "db-path,d", po::value<std::string>(&config.db_path)->default_value("dwn.db"),
      "RocksDB directory")(
      "tenant,t", po::value<std::vector<std::string>>(&config.tenants),
      "Served tenant DID (repeatable, default: every tenant)")(
      "did-key,k", po::value<std::vector<std::string>>(&did_keys),
      "Signing key <key_id>=<ed25519|secp256k1>:<hex> (repeatable)")(
      "strict-crypto", po::value<bool>(&strict_crypto)->default_value(true),
      "Verify message signatures")(
      "log-level,l", po::value<std::string>(&log_level)->default_value("info"),
      "trace, debug, info, warn, error, critical or off")(
      "log-file", po::value<std::string>(&config.log_file)->default_value("dwn.log"),
      "Log file path")(
      "input,i", po::value<std::string>(&config.input_file),
      "File of base64 messages, one per line, optional payload after a space");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto stream = std::ifstream{path};
      if (!stream) {
        error = "cannot open config file " + path;
        return std::nullopt;
      }
      po::store(po::parse_config_file(stream, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    error = e.what();
    return std::nullopt;
  }

  if (vm.contains("help")) {
    auto usage = std::ostringstream{};
    usage << description;
    config.show_help = true;
    config.usage = usage.str();
    return config;
  }

  for (const auto& spec : did_keys) {
    auto key = parse_key_spec(spec, error);
    if (!key) {
      return std::nullopt;
    }
    config.did_keys.push_back(std::move(*key));
  }

  config.log_level = spdlog::level::from_str(log_level);
  if (config.log_level == spdlog::level::off && log_level != "off") {
    error = "unknown log level '" + log_level + "'";
    return std::nullopt;
  }
  config.require_strict_crypto = strict_crypto;
  return config;
}

dwn::core::static_key_registry make_key_registry(const node_config& config) {
  auto registry = dwn::core::static_key_registry{};
  for (const auto& [key_id, public_key] : config.did_keys) {
    registry.add(key_id, public_key);
  }
  return registry;
}

}  // namespace dwn::node
