// SPDX-License-Identifier: MIT
// nearrpc - Method Handler Errors Implementation
// Copyright (c) 2024-2026 nearrpc Contributors

#include "nearrpc/handler_error.hpp"
#include <algorithm>
#include <initializer_list>

namespace nearrpc
{

namespace
{
bool
listed (std::initializer_list<std::string_view> names, std::string_view name)
{
  return std::find (names.begin (), names.end (), name) != names.end ();
}

constexpr std::string_view INTERNAL_ERROR = "INTERNAL_ERROR";
constexpr std::string_view UNKNOWN_BLOCK = "UNKNOWN_BLOCK";
constexpr std::string_view LEGACY_UNKNOWN_BLOCK_PREFIX = "DB Not Found Error";
}

namespace error_kind
{

bool
Status::accepts (std::string_view name)
{
  return listed ({ "NODE_IS_SYNCING", "NO_NEW_BLOCKS", "EPOCH_OUT_OF_BOUNDS",
                   INTERNAL_ERROR },
                 name);
}

bool
Block::accepts (std::string_view name)
{
  return listed ({ UNKNOWN_BLOCK, "NOT_SYNCED_YET", INTERNAL_ERROR }, name);
}

bool
Chunk::accepts (std::string_view name)
{
  return listed ({ INTERNAL_ERROR, UNKNOWN_BLOCK, "INVALID_SHARD_ID",
                   "UNKNOWN_CHUNK" },
                 name);
}

bool
GasPrice::accepts (std::string_view name)
{
  return listed ({ INTERNAL_ERROR, UNKNOWN_BLOCK }, name);
}

bool
LightClientProof::accepts (std::string_view name)
{
  return listed ({ UNKNOWN_BLOCK, "INCONSISTENT_STATE", "NOT_CONFIRMED",
                   "UNKNOWN_TRANSACTION_OR_RECEIPT", "UNAVAILABLE_SHARD",
                   INTERNAL_ERROR },
                 name);
}

bool
LightClientNextBlock::accepts (std::string_view name)
{
  return listed ({ INTERNAL_ERROR, UNKNOWN_BLOCK, "EPOCH_OUT_OF_BOUNDS" },
                 name);
}

bool
NetworkInfo::accepts (std::string_view name)
{
  return name == INTERNAL_ERROR;
}

bool
Query::accepts (std::string_view name)
{
  return listed ({ "NO_SYNCED_BLOCKS", "UNAVAILABLE_SHARD",
                   "GARBAGE_COLLECTED_BLOCK", UNKNOWN_BLOCK, "INVALID_ACCOUNT",
                   "UNKNOWN_ACCOUNT", "NO_CONTRACT_CODE",
                   "TOO_LARGE_CONTRACT_STATE", "UNKNOWN_ACCESS_KEY",
                   "CONTRACT_EXECUTION_ERROR", INTERNAL_ERROR },
                 name);
}

bool
Transaction::accepts (std::string_view name)
{
  return listed ({ "INVALID_TRANSACTION", "DOES_NOT_TRACK_SHARD",
                   "REQUEST_ROUTED", "UNKNOWN_TRANSACTION", INTERNAL_ERROR,
                   "TIMEOUT_ERROR" },
                 name);
}

bool
Validator::accepts (std::string_view name)
{
  return listed ({ "UNKNOWN_EPOCH", "VALIDATOR_INFO_UNAVAILABLE",
                   INTERNAL_ERROR },
                 name);
}

bool
Receipt::accepts (std::string_view name)
{
  return listed ({ INTERNAL_ERROR, "UNKNOWN_RECEIPT" }, name);
}

bool
StateChanges::accepts (std::string_view name)
{
  return listed ({ UNKNOWN_BLOCK, "NOT_SYNCED_YET", INTERNAL_ERROR }, name);
}

bool
GenesisConfig::accepts (std::string_view name)
{
  return name == INTERNAL_ERROR;
}

bool
ProtocolConfig::accepts (std::string_view name)
{
  return listed ({ UNKNOWN_BLOCK, INTERNAL_ERROR }, name);
}

bool
Sandbox::accepts (std::string_view name)
{
  return name == INTERNAL_ERROR;
}

} // namespace error_kind

std::optional<BlockError>
ErrorParser<BlockError>::parse (const nlohmann::json &payload)
{
  if (payload.is_string ())
    {
      const std::string text = payload.get<std::string> ();
      if (text.compare (0, LEGACY_UNKNOWN_BLOCK_PREFIX.size (),
                        LEGACY_UNKNOWN_BLOCK_PREFIX)
          == 0)
        {
          return BlockError{ std::string (UNKNOWN_BLOCK),
                             { { "error_message", text } } };
        }
      return std::nullopt;
    }

  try
    {
      return payload.get<BlockError> ();
    }
  catch (const std::exception &)
    {
      return std::nullopt;
    }
}

std::optional<TransactionError>
ErrorParser<TransactionError>::parse (const nlohmann::json &payload)
{
  if (payload.is_object () && payload.contains ("TxExecutionError"))
    {
      const auto &execution = payload["TxExecutionError"];
      if (execution.is_object () && execution.contains ("InvalidTxError"))
        {
          return TransactionError{
            "INVALID_TRANSACTION",
            { { "context", execution["InvalidTxError"] } }
          };
        }
      return std::nullopt;
    }

  try
    {
      return payload.get<TransactionError> ();
    }
  catch (const std::exception &)
    {
      return std::nullopt;
    }
}

} // namespace nearrpc
