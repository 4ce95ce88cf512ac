// SPDX-License-Identifier: MIT
// nearrpc - Error Types Implementation
// Copyright (c) 2024-2026 nearrpc Contributors

#include "nearrpc/errors.hpp"
#include <utility>

namespace nearrpc
{

InvalidEndpoint::InvalidEndpoint (std::string endpoint,
                                  const std::string &reason)
    : Error ("invalid endpoint [" + endpoint + "]: " + reason),
      endpoint_ (std::move (endpoint))
{
}

const char *
to_string (TransportErrorKind kind)
{
  switch (kind)
    {
    case TransportErrorKind::Connection:
      return "connection";
    case TransportErrorKind::Timeout:
      return "timeout";
    case TransportErrorKind::Tls:
      return "tls";
    case TransportErrorKind::BadRequest:
      return "bad request";
    case TransportErrorKind::Unauthorized:
      return "unauthorized";
    case TransportErrorKind::RequestTimeout:
      return "request timeout";
    case TransportErrorKind::TooManyRequests:
      return "too many requests";
    case TransportErrorKind::InternalServerError:
      return "internal server error";
    case TransportErrorKind::ServiceUnavailable:
      return "service unavailable";
    case TransportErrorKind::HttpStatus:
      return "http status";
    }
  return "unknown";
}

TransportError::TransportError (TransportErrorKind kind,
                                const std::string &detail, long http_status,
                                std::string body)
    : CallError (std::string ("transport error (") + to_string (kind)
                 + "): " + detail),
      kind_ (kind), http_status_ (http_status), body_ (std::move (body))
{
}

TransportError
TransportError::from_http_status (long status, std::string body)
{
  TransportErrorKind kind;
  switch (status)
    {
    case 400:
      kind = TransportErrorKind::BadRequest;
      break;
    case 401:
      kind = TransportErrorKind::Unauthorized;
      break;
    case 408:
      kind = TransportErrorKind::RequestTimeout;
      break;
    case 429:
      kind = TransportErrorKind::TooManyRequests;
      break;
    case 500:
      kind = TransportErrorKind::InternalServerError;
      break;
    case 503:
      kind = TransportErrorKind::ServiceUnavailable;
      break;
    default:
      kind = TransportErrorKind::HttpStatus;
      break;
    }
  return TransportError (kind,
                         "server returned HTTP " + std::to_string (status),
                         status, std::move (body));
}

ProtocolError::ProtocolError (const std::string &detail, std::string raw_body)
    : CallError ("malformed JSON-RPC response: " + detail),
      raw_body_ (std::move (raw_body))
{
}

DecodeError::DecodeError (std::string expected_type, nlohmann::json raw,
                          const std::string &detail)
    : CallError ("cannot decode result as " + expected_type + ": " + detail),
      expected_type_ (std::move (expected_type)), raw_ (std::move (raw))
{
}

PollTimeout::PollTimeout (std::uint64_t target_height,
                          std::uint64_t last_height, int attempts)
    : Error ("node did not reach height " + std::to_string (target_height)
             + " after " + std::to_string (attempts)
             + " polls (last seen " + std::to_string (last_height) + ")"),
      target_height_ (target_height), last_height_ (last_height),
      attempts_ (attempts)
{
}

} // namespace nearrpc
