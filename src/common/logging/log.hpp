#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace ax::log {

using spdlog::trace;
using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;
using spdlog::critical;

/// Install the process logger configured from the --log_* flags.
void init();

void shutdown();

/// True between init() and shutdown().
auto initialized() -> bool;

void info(std::string_view event, std::unordered_map<std::string, std::string> fields);

}  // namespace ax::log
