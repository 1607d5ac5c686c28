#include <csignal>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <dwn/core/tenant_gate.hpp>
#include <dwn/node/config.hpp>
#include <dwn/node/dispatcher.hpp>
#include <dwn/storage/rocksdb/storage.hpp>
#include <dwn/store/rocksdb/data_store.hpp>
#include <dwn/store/rocksdb/event_log.hpp>
#include <dwn/store/rocksdb/message_store.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

namespace {

// One request per line: `<tenant> <base64 message> [<base64 payload>]`.
dwn::schema::message_reply_t process_line(dwn::node::dispatcher& node,
                                          const std::string& line) {
  auto fields = std::istringstream{line};
  auto tenant = std::string{};
  auto encoded_message = std::string{};
  auto encoded_payload = std::string{};
  fields >> tenant >> encoded_message >> encoded_payload;

  auto message = dwn::schema::try_from_base64(encoded_message);
  if (tenant.empty() || !message) {
    return dwn::schema::make_error_reply(
        dwn::schema::error_code_t::malformed_message,
        "expected <tenant> <base64 message> [<base64 payload>]");
  }
  auto payload = std::optional<dwn::schema::bytes_t>{};
  if (!encoded_payload.empty()) {
    payload = dwn::schema::try_from_base64(encoded_payload);
    if (!payload) {
      return dwn::schema::make_error_reply(
          dwn::schema::error_code_t::malformed_message,
          "payload is not base64");
    }
  }
  return node.process_message(
      tenant, dwn::schema::bytes_view_t{message->data(), message->size()},
      payload);
}

void run(dwn::node::dispatcher& node, std::istream& input) {
  auto line = std::string{};
  while (!shutdown_requested() && std::getline(input, line)) {
    if (line.empty() || line.starts_with('#')) {
      continue;
    }
    auto reply = process_line(node, line);
    std::cout << reply.status.code << " " << reply.status.detail << std::endl;
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);

  auto error = std::string{};
  auto config = dwn::node::parse_config(argc, argv, error);
  if (!config) {
    std::cerr << error << std::endl;
    return 1;
  }
  if (config->show_help) {
    std::cout << config->usage << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      config->log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "dwn", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(config->log_level);

  try {
    auto storage = dwn::storage::make_storage<dwn::storage::rocksdb_storage_tag>(
        config->db_path);
    auto messages = dwn::store::rocksdb_message_store{storage};
    auto data = dwn::store::rocksdb_data_store{storage};
    auto events = dwn::store::rocksdb_event_log{storage};

    auto gate = config->tenants.empty()
                    ? dwn::core::allow_all_tenants()
                    : dwn::core::allow_listed_tenants(config->tenants);
    auto node = dwn::node::dispatcher{
        messages, data, events,
        dwn::node::make_key_registry(*config).resolver(),
        config->require_strict_crypto, std::move(gate)};
    spdlog::info("Node ready on {} with {} key(s)", config->db_path,
                 config->did_keys.size());

    if (config->input_file.empty()) {
      run(node, std::cin);
    } else {
      auto input = std::ifstream{config->input_file};
      if (!input) {
        spdlog::error("Cannot open input file {}", config->input_file);
        spdlog::shutdown();
        return 1;
      }
      run(node, input);
    }
  } catch (const dwn::storage::storage_error& e) {
    spdlog::critical("Storage failure: {}", e.what());
    spdlog::shutdown();
    return 2;
  }

  spdlog::shutdown();
  return 0;
}
