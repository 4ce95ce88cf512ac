// SPDX-License-Identifier: MIT
// nearrpc - Sandbox Helpers
// Copyright (c) 2024-2026 nearrpc Contributors

#pragma once

#include "nearrpc/client.hpp"
#include "nearrpc/config.hpp"
#include "nearrpc/errors.hpp"
#include "nearrpc/log.hpp"
#include "nearrpc/methods.hpp"
#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <thread>

namespace nearrpc
{

/// Advance a sandbox node by `delta_height` blocks and wait for it
///
/// Reads the current height, sends `sandbox_fast_forward`, then polls
/// `status` every `options.poll_interval` until the node reports the target
/// height. Transport failures while polling use up an attempt.
/// @param client Client for a sandbox node
/// @param delta_height Number of blocks to produce
/// @param options Poll interval and attempt budget
/// @return Latest block height observed, at least start + delta_height
/// @throws PollTimeout when the budget runs out, or any CallError from the
///         initial status and fast-forward requests
/// @throws std::invalid_argument if the target height does not fit in 64
///         bits (nothing is sent to the node)
template <typename AuthState>
std::uint64_t
fast_forward (const BasicClient<AuthState> &client, std::uint64_t delta_height,
              const FastForwardOptions &options = {})
{
  const std::uint64_t start
      = client.call (methods::Status{}).sync_info.latest_block_height;
  if (delta_height > std::numeric_limits<std::uint64_t>::max () - start)
    {
      throw std::invalid_argument ("fast_forward by "
                                   + std::to_string (delta_height)
                                   + " overflows block height "
                                   + std::to_string (start));
    }
  const std::uint64_t target = start + delta_height;

  client.call (methods::SandboxFastForward{ FastForwardParams{ delta_height } });
  logger ()->debug ("fast_forward from {} to {}", start, target);

  std::uint64_t last = start;
  for (int attempt = 1; attempt <= options.max_attempts; ++attempt)
    {
      std::this_thread::sleep_for (options.poll_interval);
      try
        {
          last = client.call (methods::Status{}).sync_info.latest_block_height;
        }
      catch (const TransportError &e)
        {
          logger ()->warn ("fast_forward poll {}/{} failed: {}", attempt,
                           options.max_attempts, e.what ());
          continue;
        }

      if (last >= target)
        return last;
    }

  logger ()->warn ("fast_forward gave up at height {} (target {})", last,
                   target);
  throw PollTimeout (target, last, std::max (options.max_attempts, 0));
}

} // namespace nearrpc
