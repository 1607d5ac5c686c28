#pragma once

#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace dwn::common {

/// Broken invariant or unusable input in a tool: log it, flush every sink
/// (the node's logger is asynchronous) and stop the process.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("Fatal: {}", message);
  spdlog::shutdown();
  std::terminate();
}

}  // namespace dwn::common
