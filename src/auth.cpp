// SPDX-License-Identifier: MIT
// nearrpc - Auth Providers Implementation
// Copyright (c) 2024-2026 nearrpc Contributors

#include "nearrpc/auth.hpp"
#include "nearrpc/config.hpp"
#include "nearrpc/errors.hpp"
#include "nearrpc/utils.hpp"
#include <utility>
#include <vector>

namespace nearrpc
{

namespace
{
void
require_credential (const std::string &value, const char *what)
{
  if (value.empty ())
    throw InvalidHeader (std::string (what) + " must not be empty");
  if (!is_header_value_safe (value))
    throw InvalidHeader (std::string (what) + " contains control characters");
}
}

ApiKey::ApiKey (std::string key) : key_ (std::move (key))
{
  require_credential (key_, "API key");
}

Header
ApiKey::header () const
{
  return { constants::API_KEY_HEADER, key_ };
}

BearerToken::BearerToken (std::string token) : token_ (std::move (token))
{
  require_credential (token_, "bearer token");
}

Header
BearerToken::header () const
{
  return { constants::AUTHORIZATION_HEADER, "Bearer " + token_ };
}

BasicAuth::BasicAuth (std::string username, std::string password)
    : username_ (std::move (username)), password_ (std::move (password))
{
  require_credential (username_, "username");
  if (username_.find (':') != std::string::npos)
    throw InvalidHeader ("username must not contain ':'");
  if (!is_header_value_safe (password_))
    throw InvalidHeader ("password contains control characters");
}

Header
BasicAuth::header () const
{
  const std::string text = username_ + ":" + password_;
  const std::vector<uint8_t> credentials (text.begin (), text.end ());
  return { constants::AUTHORIZATION_HEADER,
           "Basic " + base64_encode (credentials.data (), credentials.size ()) };
}

} // namespace nearrpc
