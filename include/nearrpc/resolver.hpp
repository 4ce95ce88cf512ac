// SPDX-License-Identifier: MIT
// nearrpc - Error Resolver
// Copyright (c) 2024-2026 nearrpc Contributors

#pragma once

#include "nearrpc/config.hpp"
#include "nearrpc/errors.hpp"
#include "nearrpc/log.hpp"
#include "nearrpc/method.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace nearrpc
{

/// Which interpretation of a server error succeeded
enum class ResolvedKind
{
  Handler,     // method-specific typed error
  Generic,     // plain JSON-RPC {code, message, data}
  Unrecognized // nothing matched, raw value only
};

const char *to_string (ResolvedKind kind);

/// JSON-RPC error object with `data` left untyped
struct GenericRpcError
{
  std::int64_t code = 0;
  std::string message;
  nlohmann::json data;             // null when absent
  std::optional<std::string> name; // NEAR error class, e.g. "HANDLER_ERROR"
  nlohmann::json cause;            // {name, info} when present
};

namespace detail
{
/// Handler-error candidate payloads of an `error` value, in the order
/// they should be tried
std::vector<nlohmann::json> handler_candidates (const nlohmann::json &error,
                                                CausePrecedence precedence);

/// Strict parse of the JSON-RPC error structure
std::optional<GenericRpcError> parse_generic (const nlohmann::json &error);

/// `error.data` if present, otherwise the error value itself
nlohmann::json raw_payload (const nlohmann::json &error);
}

/// Classified server error; always keeps the verbatim `error` value
template <typename E> class ResolvedError
{
public:
  static ResolvedError
  handler (E error, nlohmann::json raw,
           std::optional<GenericRpcError> envelope)
  {
    return ResolvedError (Value (std::in_place_index<0>, std::move (error)),
                          std::move (raw), std::move (envelope));
  }

  static ResolvedError
  generic (GenericRpcError error, nlohmann::json raw)
  {
    GenericRpcError envelope = error;
    return ResolvedError (Value (std::in_place_index<1>, std::move (error)),
                          std::move (raw), std::move (envelope));
  }

  static ResolvedError
  unrecognized (nlohmann::json raw)
  {
    return ResolvedError (Value (std::in_place_index<2>), std::move (raw),
                          std::nullopt);
  }

  ResolvedKind
  kind () const
  {
    return static_cast<ResolvedKind> (value_.index ());
  }

  /// Typed error, or nullptr unless kind() == Handler
  const E *
  handler_error () const
  {
    return std::get_if<0> (&value_);
  }

  /// Generic error, or nullptr unless kind() == Generic
  const GenericRpcError *
  generic_error () const
  {
    return std::get_if<1> (&value_);
  }

  /// The {code, message, ...} envelope, whenever it parsed (Handler or
  /// Generic)
  const std::optional<GenericRpcError> &
  envelope () const
  {
    return envelope_;
  }

  /// The `error` member exactly as received
  const nlohmann::json &
  raw () const
  {
    return raw_;
  }

  /// `error.data`, or the whole error for legacy shapes without `data`
  nlohmann::json
  payload () const
  {
    return detail::raw_payload (raw_);
  }

  std::string
  describe () const
  {
    std::string text = std::string (to_string (kind ())) + " error";
    if (envelope_)
      {
        text += " " + std::to_string (envelope_->code) + ": "
                + envelope_->message;
      }
    text += " " + raw_.dump ();
    return text;
  }

private:
  struct Unrecognized
  {
  };

  using Value = std::variant<E, GenericRpcError, Unrecognized>;

  ResolvedError (Value value, nlohmann::json raw,
                 std::optional<GenericRpcError> envelope)
      : value_ (std::move (value)), raw_ (std::move (raw)),
        envelope_ (std::move (envelope))
  {
  }

  Value value_;
  nlohmann::json raw_;
  std::optional<GenericRpcError> envelope_;
};

/// Classify a raw `error` value
///
/// 1. method-specific error from the cause-wrapped or flat payload,
/// 2. generic {code, message, data},
/// 3. unrecognized.
/// Never throws on malformed input.
template <typename E>
ResolvedError<E>
resolve_error (const nlohmann::json &error,
               CausePrecedence precedence = CausePrecedence::CauseFirst)
{
  auto envelope = detail::parse_generic (error);

  for (const auto &candidate : detail::handler_candidates (error, precedence))
    {
      if (auto typed = decode_handler_error<E> (candidate))
        {
          return ResolvedError<E>::handler (std::move (*typed), error,
                                            std::move (envelope));
        }
    }

  if (envelope)
    {
      logger ()->debug ("error payload has no {} form, using generic error",
                        type_name<E> ());
      return ResolvedError<E>::generic (std::move (*envelope), error);
    }

  logger ()->debug ("unrecognized error payload: {}", error.dump ());
  return ResolvedError<E>::unrecognized (error);
}

} // namespace nearrpc
