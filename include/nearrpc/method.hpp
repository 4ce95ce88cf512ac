// SPDX-License-Identifier: MIT
// nearrpc - Method Descriptor Contract
// Copyright (c) 2024-2026 nearrpc Contributors

#pragma once

#include "nearrpc/config.hpp"
#include "nearrpc/errors.hpp"
#include <boost/core/demangle.hpp>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <typeinfo>

namespace nearrpc
{

using RequestId = std::uint64_t;

/// Human-readable name of T, used in DecodeError
template <typename T>
std::string
type_name ()
{
  return boost::core::demangle (typeid (T).name ());
}

/// Turns a `result` value into T
///
/// Specialize for result types that need more than `from_json`. Throwing
/// any std::exception means "shape mismatch".
template <typename T> struct ResultParser
{
  static T
  parse (const nlohmann::json &value)
  {
    return value.get<T> ();
  }
};

/// Escape hatch, never fails
template <> struct ResultParser<nlohmann::json>
{
  static nlohmann::json
  parse (const nlohmann::json &value)
  {
    return value;
  }
};

/// Methods that answer `null`
template <> struct ResultParser<std::nullptr_t>
{
  static std::nullptr_t
  parse (const nlohmann::json &value)
  {
    if (!value.is_null ())
      throw std::invalid_argument ("expected null, got "
                                   + std::string (value.type_name ()));
    return nullptr;
  }
};

/// Best-effort parse of a handler error payload into E
///
/// Returns nullopt instead of throwing so that the error resolver can fall
/// back to the generic shape. Specialize for error types whose servers emit
/// legacy or partially serialized payloads.
template <typename E> struct ErrorParser
{
  static std::optional<E>
  parse (const nlohmann::json &payload)
  {
    try
      {
        return payload.get<E> ();
      }
    catch (const std::exception &)
      {
        return std::nullopt;
      }
  }
};

template <> struct ErrorParser<nlohmann::json>
{
  static std::optional<nlohmann::json>
  parse (const nlohmann::json &payload)
  {
    return payload;
  }
};

/// ErrorParser<E> with any escaping exception mapped to nullopt
template <typename E>
std::optional<E>
decode_handler_error (const nlohmann::json &payload)
{
  try
    {
      return ErrorParser<E>::parse (payload);
    }
  catch (const std::exception &)
    {
      return std::nullopt;
    }
}

/// Generic implementation of the method descriptor contract
///
/// A descriptor M declares `result_type`, `error_type`,
/// `std::string method_name () const` and `nlohmann::json params () const`.
/// Decoding is shared by every descriptor through ResultParser and
/// ErrorParser.
template <typename M> struct MethodTraits
{
  using result_type = typename M::result_type;
  using error_type = typename M::error_type;

  static std::string
  method_name (const M &method)
  {
    return method.method_name ();
  }

  static nlohmann::json
  encode_params (const M &method)
  {
    return method.params ();
  }

  /// @throws DecodeError when the value does not match result_type
  static result_type
  decode_result (const nlohmann::json &value)
  {
    try
      {
        return ResultParser<result_type>::parse (value);
      }
    catch (const DecodeError &)
      {
        throw;
      }
    catch (const std::exception &e)
      {
        throw DecodeError (type_name<result_type> (), value, e.what ());
      }
  }

  static std::optional<error_type>
  decode_handler_error (const nlohmann::json &payload)
  {
    return nearrpc::decode_handler_error<error_type> (payload);
  }
};

/// Render the request envelope a client would send for `method`
template <typename M>
nlohmann::json
to_request_json (const M &method, RequestId id = 0)
{
  return { { "jsonrpc", constants::JSONRPC_VERSION },
           { "id", id },
           { "method", MethodTraits<M>::method_name (method) },
           { "params", MethodTraits<M>::encode_params (method) } };
}

/// Catalog entry for a method without parameters
template <const char *Name, typename Result, typename Error>
struct NullaryMethod
{
  using result_type = Result;
  using error_type = Error;

  std::string
  method_name () const
  {
    return Name;
  }

  nlohmann::json
  params () const
  {
    return nullptr;
  }
};

/// Catalog entry whose params are the JSON form of `Params`
template <const char *Name, typename Params, typename Result, typename Error>
struct Method
{
  using params_type = Params;
  using result_type = Result;
  using error_type = Error;

  Params request;

  std::string
  method_name () const
  {
    return Name;
  }

  nlohmann::json
  params () const
  {
    return request;
  }
};

} // namespace nearrpc
