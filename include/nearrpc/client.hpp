// SPDX-License-Identifier: MIT
// nearrpc - JSON-RPC Client
// Copyright (c) 2024-2026 nearrpc Contributors

#pragma once

#include "nearrpc/errors.hpp"
#include "nearrpc/method.hpp"
#include "nearrpc/resolver.hpp"
#include "nearrpc/transport.hpp"
#include "nearrpc/url.hpp"
#include <future>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace nearrpc
{

/// Auth marker: no credentials attached
struct Unauthenticated
{
};

/// Auth marker: one auth provider header attached
struct Authenticated
{
};

/// The server answered with a JSON-RPC `error`
///
/// Catch this to handle server errors of any method; catch ServerError<E>
/// for the typed view.
class ServerErrorBase : public CallError
{
public:
  ServerErrorBase (const std::string &method, ResolvedKind kind,
                   const std::string &description, nlohmann::json raw_error,
                   std::string raw_body);

  const std::string &
  method () const
  {
    return method_;
  }

  ResolvedKind
  kind () const
  {
    return kind_;
  }

  /// The `error` member exactly as received
  const nlohmann::json &
  raw_error () const
  {
    return raw_error_;
  }

  const std::string &
  raw_body () const
  {
    return raw_body_;
  }

private:
  std::string method_;
  ResolvedKind kind_;
  nlohmann::json raw_error_;
  std::string raw_body_;
};

template <typename E> class ServerError : public ServerErrorBase
{
public:
  ServerError (const std::string &method, ResolvedError<E> resolved,
               std::string raw_body)
      : ServerErrorBase (method, resolved.kind (), resolved.describe (),
                         resolved.raw (), std::move (raw_body)),
        resolved_ (std::move (resolved))
  {
  }

  const ResolvedError<E> &
  resolved () const
  {
    return resolved_;
  }

  /// Shortcut for resolved ().handler_error ()
  const E *
  handler_error () const
  {
    return resolved_.handler_error ();
  }

private:
  ResolvedError<E> resolved_;
};

namespace detail
{

/// Next process-wide request id
RequestId next_request_id ();

/// Outcome of one envelope exchange
struct Reply
{
  bool is_error = false;
  nlohmann::json value; // `result` or `error`
  std::string body;
};

/// Validate a response body against the request id
/// @throws ProtocolError if the body is not a JSON-RPC 2.0 response to
///         `expected_id`
Reply parse_response (RequestId expected_id, std::string body);

/// Untyped state shared by every client flavor
class ClientCore
{
public:
  ClientCore (Url url, std::shared_ptr<Transport> transport);

  /// @throws InvalidHeader, also for the auth header names
  ClientCore with_header (std::string name, std::string value) const;

  /// with_header for the one header an auth provider contributes
  /// @throws InvalidHeader
  ClientCore with_auth_header (std::string name, std::string value) const;

  ClientCore with_cause_precedence (CausePrecedence precedence) const;

  /// Send one request envelope and validate the reply
  /// @throws TransportError, ProtocolError
  Reply exchange (const std::string &method,
                  const nlohmann::json &params) const;

  const Url &
  url () const
  {
    return url_;
  }

  const HeaderList &
  headers () const
  {
    return headers_;
  }

  const std::shared_ptr<Transport> &
  transport () const
  {
    return transport_;
  }

  CausePrecedence
  cause_precedence () const
  {
    return precedence_;
  }

private:
  Url url_;
  HeaderList headers_;
  std::shared_ptr<Transport> transport_;
  CausePrecedence precedence_ = CausePrecedence::CauseFirst;
};

} // namespace detail

/// Immutable JSON-RPC client for one node endpoint
///
/// Copies share the transport. All members are const, so one instance can
/// serve any number of concurrent calls.
template <typename AuthState> class BasicClient
{
public:
  /// Create a client
  /// @param endpoint e.g. "https://rpc.mainnet.near.org"
  /// @param transport Transport to use, a CurlTransport when null
  /// @throws InvalidEndpoint
  static BasicClient
  connect (std::string_view endpoint,
           std::shared_ptr<Transport> transport = nullptr)
  {
    return connect (Url (endpoint), std::move (transport));
  }

  static BasicClient
  connect (const Url &endpoint, std::shared_ptr<Transport> transport = nullptr)
  {
    static_assert (std::is_same<AuthState, Unauthenticated>::value,
                   "connect () creates an unauthenticated client, use auth ()");
    if (!transport)
      transport = std::make_shared<CurlTransport> ();
    return BasicClient (detail::ClientCore (endpoint, std::move (transport)));
  }

  /// Copy with one more static header, replacing any header of the same
  /// name (case-insensitive)
  /// @throws InvalidHeader, including for `x-api-key` and `Authorization`,
  ///         which only auth () may set
  BasicClient
  with_header (std::string name, std::string value) const
  {
    return BasicClient (core_.with_header (std::move (name), std::move (value)));
  }

  /// Copy that resolves handler errors flat `data` first instead of
  /// `cause` first
  BasicClient
  with_cause_precedence (CausePrecedence precedence) const
  {
    return BasicClient (core_.with_cause_precedence (precedence));
  }

  /// Attach credentials
  /// @param provider ApiKey, BearerToken, BasicAuth or anything with
  ///                 `Header header () const`
  template <typename Provider, typename State = AuthState,
            typename = std::enable_if_t<
                std::is_same<State, Unauthenticated>::value> >
  BasicClient<Authenticated>
  auth (const Provider &provider) const
  {
    Header header = provider.header ();
    return BasicClient<Authenticated> (
        core_.with_auth_header (std::move (header.first),
                                std::move (header.second)));
  }

  /// Perform one call
  /// @return Decoded `result`
  /// @throws TransportError, ProtocolError, DecodeError,
  ///         ServerError<error_type>
  template <typename M>
  typename MethodTraits<M>::result_type
  call (const M &method) const
  {
    using Traits = MethodTraits<M>;
    std::string name = Traits::method_name (method);

    detail::Reply reply
        = core_.exchange (name, Traits::encode_params (method));
    if (reply.is_error)
      {
        throw ServerError<typename Traits::error_type> (
            name,
            resolve_error<typename Traits::error_type> (
                reply.value, core_.cause_precedence ()),
            std::move (reply.body));
      }
    return Traits::decode_result (reply.value);
  }

  /// Perform one call on its own thread
  template <typename M>
  std::future<typename MethodTraits<M>::result_type>
  call_async (M method) const
  {
    return std::async (std::launch::async,
                       [client = *this, method = std::move (method)] {
                         return client.call (method);
                       });
  }

  const Url &
  server_addr () const
  {
    return core_.url ();
  }

  const HeaderList &
  headers () const
  {
    return core_.headers ();
  }

  CausePrecedence
  cause_precedence () const
  {
    return core_.cause_precedence ();
  }

  static constexpr bool
  is_authenticated ()
  {
    return std::is_same<AuthState, Authenticated>::value;
  }

private:
  template <typename> friend class BasicClient;

  explicit BasicClient (detail::ClientCore core) : core_ (std::move (core)) {}

  detail::ClientCore core_;
};

using Client = BasicClient<Unauthenticated>;
using AuthenticatedClient = BasicClient<Authenticated>;

/// Method-driven form of BasicClient::call
template <typename M, typename AuthState>
typename MethodTraits<M>::result_type
call_on (const M &method, const BasicClient<AuthState> &client)
{
  return client.call (method);
}

} // namespace nearrpc
