// SPDX-License-Identifier: MIT
// nearrpc - Method Handler Errors
// Copyright (c) 2024-2026 nearrpc Contributors

#pragma once

#include "nearrpc/method.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace nearrpc
{

/// Typed `{name, info}` error reported by a node's method handler
///
/// `Kind` lists the names a method can report. Payloads with another name
/// do not parse, so the resolver moves on to the generic shape.
template <typename Kind> struct HandlerError
{
  std::string name; // e.g. "UNKNOWN_BLOCK"
  nlohmann::json info;

  bool
  is (std::string_view other) const
  {
    return name == other;
  }

  /// `info.error_message`, empty for nodes that omit it
  std::string
  error_message () const
  {
    if (info.is_object ())
      {
        auto it = info.find ("error_message");
        if (it != info.end () && it->is_string ())
          return it->template get<std::string> ();
      }
    return {};
  }
};

template <typename Kind>
void
to_json (nlohmann::json &j, const HandlerError<Kind> &error)
{
  j = { { "name", error.name }, { "info", error.info } };
}

template <typename Kind>
void
from_json (const nlohmann::json &j, HandlerError<Kind> &error)
{
  std::string name = j.at ("name").template get<std::string> ();
  if (!Kind::accepts (name))
    throw std::invalid_argument ("unexpected error name '" + name + "'");

  auto info = j.find ("info");
  error.name = std::move (name);
  error.info = info == j.end () ? nlohmann::json () : *info;
}

/// Name tables, one per error family
namespace error_kind
{
struct Status
{
  static bool accepts (std::string_view name);
};
struct Block
{
  static bool accepts (std::string_view name);
};
struct Chunk
{
  static bool accepts (std::string_view name);
};
struct GasPrice
{
  static bool accepts (std::string_view name);
};
struct LightClientProof
{
  static bool accepts (std::string_view name);
};
struct LightClientNextBlock
{
  static bool accepts (std::string_view name);
};
struct NetworkInfo
{
  static bool accepts (std::string_view name);
};
struct Query
{
  static bool accepts (std::string_view name);
};
struct Transaction
{
  static bool accepts (std::string_view name);
};
struct Validator
{
  static bool accepts (std::string_view name);
};
struct Receipt
{
  static bool accepts (std::string_view name);
};
struct StateChanges
{
  static bool accepts (std::string_view name);
};
struct GenesisConfig
{
  static bool accepts (std::string_view name);
};
struct ProtocolConfig
{
  static bool accepts (std::string_view name);
};
struct Sandbox
{
  static bool accepts (std::string_view name);
};
} // namespace error_kind

using StatusError = HandlerError<error_kind::Status>;
using BlockError = HandlerError<error_kind::Block>;
using ChunkError = HandlerError<error_kind::Chunk>;
using GasPriceError = HandlerError<error_kind::GasPrice>;
using LightClientProofError = HandlerError<error_kind::LightClientProof>;
using LightClientNextBlockError
    = HandlerError<error_kind::LightClientNextBlock>;
using NetworkInfoError = HandlerError<error_kind::NetworkInfo>;
using QueryError = HandlerError<error_kind::Query>;
using TransactionError = HandlerError<error_kind::Transaction>;
using ValidatorError = HandlerError<error_kind::Validator>;
using ReceiptError = HandlerError<error_kind::Receipt>;
using StateChangesError = HandlerError<error_kind::StateChanges>;
using GenesisConfigError = HandlerError<error_kind::GenesisConfig>;
using ProtocolConfigError = HandlerError<error_kind::ProtocolConfig>;
using SandboxError = HandlerError<error_kind::Sandbox>;

/// Also accepts the pre-1.0 `"DB Not Found Error: ..."` string as
/// UNKNOWN_BLOCK
template <> struct ErrorParser<BlockError>
{
  static std::optional<BlockError> parse (const nlohmann::json &payload);
};

/// Also accepts `{"TxExecutionError": {"InvalidTxError": context}}` as
/// INVALID_TRANSACTION
template <> struct ErrorParser<TransactionError>
{
  static std::optional<TransactionError>
  parse (const nlohmann::json &payload);
};

} // namespace nearrpc
