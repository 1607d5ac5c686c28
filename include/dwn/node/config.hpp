#pragma once

#include <dwn/core/auth.hpp>
#include <dwn/schema/primitives.hpp>
#include <spdlog/common.h>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dwn::node {

/// Runtime settings of a node process.
struct node_config final {
  std::string db_path{"dwn.db"};
  /// Served tenants; empty serves every tenant.
  std::vector<std::string> tenants;
  std::vector<std::pair<std::string, dwn::schema::public_key_t>> did_keys;
  bool require_strict_crypto{true};
  spdlog::level::level_enum log_level{spdlog::level::info};
  std::string log_file{"dwn.log"};
  std::string input_file;
  bool show_help{};
  std::string usage;
};

/// Parse `<key_id>=<ed25519|secp256k1>:<hex public key>`.
std::optional<std::pair<std::string, dwn::schema::public_key_t>>
parse_key_spec(std::string_view spec, std::string& error);

/// Command line first, then the optional `--config` INI file for anything
/// the command line left unset.
std::optional<node_config> parse_config(int argc,
                                        const char* const argv[],
                                        std::string& error);

dwn::core::static_key_registry make_key_registry(const node_config& config);

}  // namespace dwn::node
