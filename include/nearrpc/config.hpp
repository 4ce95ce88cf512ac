// SPDX-License-Identifier: MIT
// nearrpc - Configuration
// Copyright (c) 2024-2026 nearrpc Contributors

#pragma once

#include <chrono>
#include <string>

namespace nearrpc
{

// Named constants
namespace constants
{
constexpr long RPC_TIMEOUT_SECONDS = 30;
constexpr long CONNECT_TIMEOUT_SECONDS = 10;
constexpr int FAST_FORWARD_POLL_INTERVAL_MS = 500;
constexpr int FAST_FORWARD_MAX_ATTEMPTS = 120;
constexpr const char *JSONRPC_VERSION = "2.0";
constexpr const char *API_KEY_HEADER = "x-api-key";
constexpr const char *AUTHORIZATION_HEADER = "Authorization";
constexpr const char *LOGGER_NAME = "nearrpc";
constexpr const char *VERSION = "0.1.0";
}

/// libcurl transport configuration
struct TransportConfig
{
  long timeout_seconds = constants::RPC_TIMEOUT_SECONDS; // 0 = no limit
  long connect_timeout_seconds = constants::CONNECT_TIMEOUT_SECONDS;
  std::string user_agent = std::string ("nearrpc/") + constants::VERSION;
  bool verify_tls = true;
};

/// Sandbox fast-forward poll loop configuration
struct FastForwardOptions
{
  std::chrono::milliseconds poll_interval{
    constants::FAST_FORWARD_POLL_INTERVAL_MS
  };
  int max_attempts = constants::FAST_FORWARD_MAX_ATTEMPTS;
};

/// Which handler-error form the resolver tries first when an error carries
/// both a `cause` wrapper and a flat `data` payload
enum class CausePrecedence
{
  CauseFirst,
  DataFirst
};

} // namespace nearrpc
