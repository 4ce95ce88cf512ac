// SPDX-License-Identifier: MIT
// nearrpc - Endpoint URL
// Copyright (c) 2024-2026 nearrpc Contributors

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace nearrpc
{

/// Parsed http(s) endpoint
class Url
{
public:
  /// Parse endpoint text
  /// @param text e.g. "https://rpc.testnet.near.org" or "localhost:3030"
  ///             (text without a scheme defaults to https)
  /// @throws InvalidEndpoint if the text is not an http or https URL
  explicit Url (std::string_view text);

  /// Normalized URL as sent to the transport
  const std::string &
  str () const
  {
    return url_;
  }

  const std::string &
  scheme () const
  {
    return scheme_;
  }

  const std::string &
  host () const
  {
    return host_;
  }

  std::optional<long>
  port () const
  {
    return port_;
  }

  const std::string &
  path () const
  {
    return path_;
  }

private:
  std::string url_;
  std::string scheme_;
  std::string host_;
  std::optional<long> port_;
  std::string path_;
};

inline bool
operator== (const Url &a, const Url &b)
{
  return a.str () == b.str ();
}

} // namespace nearrpc
