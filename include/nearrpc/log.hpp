// SPDX-License-Identifier: MIT
// nearrpc - Logging
// Copyright (c) 2024-2026 nearrpc Contributors

#pragma once

#include <memory>
#include <spdlog/spdlog.h>

namespace nearrpc
{

/// Library logger
///
/// Reuses a logger already registered with spdlog under
/// `constants::LOGGER_NAME`, so applications can route nearrpc output into
/// their own sinks. Otherwise a stderr logger is created on first use.
std::shared_ptr<spdlog::logger> logger ();

} // namespace nearrpc
