// SPDX-License-Identifier: MIT
// nearrpc - Untyped Method
// Copyright (c) 2024-2026 nearrpc Contributors

#pragma once

#include "nearrpc/method.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

namespace nearrpc
{

/// Method descriptor with a runtime name and caller-chosen types
///
/// For methods missing from the catalog or still EXPERIMENTAL on the node.
/// With the default `Result = nlohmann::json` decoding never fails.
template <typename Result = nlohmann::json, typename Error = nlohmann::json>
struct AnyMethod
{
  using result_type = Result;
  using error_type = Error;

  std::string method;
  nlohmann::json params_value;

  std::string
  method_name () const
  {
    return method;
  }

  nlohmann::json
  params () const
  {
    return params_value;
  }
};

/// Build an AnyMethod
/// @param method Wire method name, e.g. "EXPERIMENTAL_protocol_config"
/// @param params Wire params, `null` for methods without parameters
template <typename Result = nlohmann::json, typename Error = nlohmann::json>
AnyMethod<Result, Error>
any (std::string method, nlohmann::json params = nullptr)
{
  return AnyMethod<Result, Error>{ std::move (method), std::move (params) };
}

} // namespace nearrpc
