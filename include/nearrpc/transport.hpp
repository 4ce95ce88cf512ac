// SPDX-License-Identifier: MIT
// nearrpc - HTTP Transport
// Copyright (c) 2024-2026 nearrpc Contributors

#pragma once

#include "nearrpc/config.hpp"
#include <string>
#include <utility>
#include <vector>

namespace nearrpc
{

using Header = std::pair<std::string, std::string>;
using HeaderList = std::vector<Header>;

/// Outgoing HTTP POST
struct HttpRequest
{
  std::string url;
  HeaderList headers; // Content-Type is added by the transport
  std::string body;
};

/// Raw HTTP reply
struct HttpResponse
{
  long status = 0;
  std::string body;
};

/// HTTP transport capability
///
/// Implementations own connection handling, TLS and timeouts, and must be
/// safe to call from several threads at once.
class Transport
{
public:
  virtual ~Transport () = default;

  /// Send one request
  /// @param request Target URL, headers and JSON body
  /// @return Status and body of whatever the server answered
  /// @throws TransportError when no HTTP response was obtained
  virtual HttpResponse post (const HttpRequest &request) = 0;
};

/// libcurl implementation, one easy handle per request
class CurlTransport : public Transport
{
public:
  explicit CurlTransport (TransportConfig config = {});

  HttpResponse post (const HttpRequest &request) override;

  const TransportConfig &
  config () const
  {
    return config_;
  }

private:
  TransportConfig config_;
};

} // namespace nearrpc
