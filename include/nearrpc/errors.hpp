// SPDX-License-Identifier: MIT
// nearrpc - Error Types
// Copyright (c) 2024-2026 nearrpc Contributors

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace nearrpc
{

/// Root of every exception thrown by nearrpc
class Error : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/// Endpoint text could not be parsed as an http(s) URL
class InvalidEndpoint : public Error
{
public:
  InvalidEndpoint (std::string endpoint, const std::string &reason);

  const std::string &
  endpoint () const
  {
    return endpoint_;
  }

private:
  std::string endpoint_;
};

/// Header name, value or credential that cannot be put on the wire
class InvalidHeader : public Error
{
public:
  using Error::Error;
};

/// Failure of a single `call`
class CallError : public Error
{
public:
  using Error::Error;
};

enum class TransportErrorKind
{
  Connection,
  Timeout,
  Tls,
  BadRequest,          // 400
  Unauthorized,        // 401
  RequestTimeout,      // 408
  TooManyRequests,     // 429
  InternalServerError, // 500
  ServiceUnavailable,  // 503
  HttpStatus           // any other non-2xx status
};

const char *to_string (TransportErrorKind kind);

/// The HTTP exchange itself failed, or the server answered with a non-2xx
/// status
class TransportError : public CallError
{
public:
  TransportError (TransportErrorKind kind, const std::string &detail,
                  long http_status = 0, std::string body = {});

  /// Classify a non-2xx HTTP status
  static TransportError from_http_status (long status, std::string body);

  TransportErrorKind
  kind () const
  {
    return kind_;
  }

  /// HTTP status, or 0 when no response was received
  long
  http_status () const
  {
    return http_status_;
  }

  const std::string &
  body () const
  {
    return body_;
  }

private:
  TransportErrorKind kind_;
  long http_status_;
  std::string body_;
};

/// The HTTP exchange succeeded but the body is not a well-formed JSON-RPC
/// response envelope
class ProtocolError : public CallError
{
public:
  ProtocolError (const std::string &detail, std::string raw_body);

  const std::string &
  raw_body () const
  {
    return raw_body_;
  }

private:
  std::string raw_body_;
};

/// `result` was present but did not match the method's result type
class DecodeError : public CallError
{
public:
  DecodeError (std::string expected_type, nlohmann::json raw,
               const std::string &detail);

  const std::string &
  expected_type () const
  {
    return expected_type_;
  }

  const nlohmann::json &
  raw () const
  {
    return raw_;
  }

private:
  std::string expected_type_;
  nlohmann::json raw_;
};

/// Sandbox fast-forward gave up before the node reached the target height
class PollTimeout : public Error
{
public:
  PollTimeout (std::uint64_t target_height, std::uint64_t last_height,
               int attempts);

  std::uint64_t
  target_height () const
  {
    return target_height_;
  }

  std::uint64_t
  last_height () const
  {
    return last_height_;
  }

  int
  attempts () const
  {
    return attempts_;
  }

private:
  std::uint64_t target_height_;
  std::uint64_t last_height_;
  int attempts_;
};

} // namespace nearrpc
