// SPDX-License-Identifier: MIT
// nearrpc - Auth Providers
// Copyright (c) 2024-2026 nearrpc Contributors

#pragma once

#include "nearrpc/transport.hpp"
#include <string>

namespace nearrpc
{

/// `x-api-key: <key>`, as issued by hosted RPC providers
class ApiKey
{
public:
  /// @throws InvalidHeader if the key is empty or contains control
  ///         characters
  explicit ApiKey (std::string key);

  Header header () const;

  const std::string &
  key () const
  {
    return key_;
  }

private:
  std::string key_;
};

/// `Authorization: Bearer <token>`
class BearerToken
{
public:
  /// @throws InvalidHeader if the token is empty or contains control
  ///         characters
  explicit BearerToken (std::string token);

  Header header () const;

private:
  std::string token_;
};

/// `Authorization: Basic base64(username:password)`
class BasicAuth
{
public:
  /// @param username Must not contain ':'
  /// @param password May be empty
  /// @throws InvalidHeader on an unusable credential
  BasicAuth (std::string username, std::string password = "");

  Header header () const;

private:
  std::string username_;
  std::string password_;
};

} // namespace nearrpc
