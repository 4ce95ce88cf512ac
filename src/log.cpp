// SPDX-License-Identifier: MIT
// nearrpc - Logging Implementation
// Copyright (c) 2024-2026 nearrpc Contributors

#include "nearrpc/config.hpp"
#include "nearrpc/log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace nearrpc
{

namespace
{
constexpr const char *DEFAULT_PATTERN = "%^%-5l %Y-%m-%dT%T.%e %n ] %v%$";

std::shared_ptr<spdlog::logger>
make_logger ()
{
  if (auto existing = spdlog::get (constants::LOGGER_NAME))
    return existing;

  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt> ();
  auto log = std::make_shared<spdlog::logger> (constants::LOGGER_NAME, sink);
  log->set_pattern (DEFAULT_PATTERN);
  log->set_level (spdlog::level::info);
  spdlog::register_logger (log);
  return log;
}
}

std::shared_ptr<spdlog::logger>
logger ()
{
  static const std::shared_ptr<spdlog::logger> log = make_logger ();
  return log;
}

} // namespace nearrpc
