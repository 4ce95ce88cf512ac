// SPDX-License-Identifier: MIT
// nearrpc - JSON-RPC Client Implementation
// Copyright (c) 2024-2026 nearrpc Contributors

#include "nearrpc/client.hpp"
#include "nearrpc/config.hpp"
#include "nearrpc/log.hpp"
#include "nearrpc/utils.hpp"
#include <algorithm>
#include <atomic>
#include <boost/algorithm/string/predicate.hpp>

namespace nearrpc
{

ServerErrorBase::ServerErrorBase (const std::string &method, ResolvedKind kind,
                                  const std::string &description,
                                  nlohmann::json raw_error,
                                  std::string raw_body)
    : CallError ("server error on " + method + ": " + description),
      method_ (method), kind_ (kind), raw_error_ (std::move (raw_error)),
      raw_body_ (std::move (raw_body))
{
}

namespace detail
{

RequestId
next_request_id ()
{
  static std::atomic<RequestId> counter{ 0 };
  return ++counter;
}

Reply
parse_response (RequestId expected_id, std::string body)
{
  nlohmann::json response;
  try
    {
      response = nlohmann::json::parse (body);
    }
  catch (const nlohmann::json::parse_error &e)
    {
      throw ProtocolError (std::string ("JSON parse error: ") + e.what (),
                           std::move (body));
    }

  if (!response.is_object ())
    throw ProtocolError ("response is not a JSON object", std::move (body));

  auto version = response.find ("jsonrpc");
  if (version == response.end () || !version->is_string ()
      || version->get<std::string> () != constants::JSONRPC_VERSION)
    throw ProtocolError ("missing or unsupported \"jsonrpc\" version",
                         std::move (body));

  auto result = response.find ("result");
  auto error = response.find ("error");
  bool has_result = result != response.end ();
  bool has_error = error != response.end ();
  if (has_result == has_error)
    {
      throw ProtocolError (has_result ? "both \"result\" and \"error\" present"
                                      : "neither \"result\" nor \"error\" "
                                        "present",
                           std::move (body));
    }

  auto id = response.find ("id");
  if (id == response.end ())
    throw ProtocolError ("missing \"id\"", std::move (body));

  // A null id is how servers answer requests they could not read
  bool id_ok = *id == nlohmann::json (expected_id)
               || (id->is_null () && has_error);
  if (!id_ok)
    {
      throw ProtocolError ("response id " + id->dump ()
                               + " does not match request id "
                               + std::to_string (expected_id),
                           std::move (body));
    }

  Reply reply;
  reply.is_error = has_error;
  reply.value = has_error ? *error : *result;
  reply.body = std::move (body);
  return reply;
}

ClientCore::ClientCore (Url url, std::shared_ptr<Transport> transport)
    : url_ (std::move (url)), transport_ (std::move (transport))
{
}

ClientCore
ClientCore::with_header (std::string name, std::string value) const
{
  if (boost::algorithm::iequals (name, constants::API_KEY_HEADER)
      || boost::algorithm::iequals (name, constants::AUTHORIZATION_HEADER))
    throw InvalidHeader ("header '" + name + "' is reserved for auth ()");
  return with_auth_header (std::move (name), std::move (value));
}

ClientCore
ClientCore::with_auth_header (std::string name, std::string value) const
{
  if (!is_header_name_valid (name))
    throw InvalidHeader ("invalid header name '" + name + "'");
  if (!is_header_value_safe (value))
    throw InvalidHeader ("value of header '" + name
                         + "' contains control characters");

  ClientCore copy = *this;
  auto existing = std::find_if (
      copy.headers_.begin (), copy.headers_.end (), [&] (const Header &h) {
        return boost::algorithm::iequals (h.first, name);
      });
  if (existing != copy.headers_.end ())
    *existing = Header (std::move (name), std::move (value));
  else
    copy.headers_.emplace_back (std::move (name), std::move (value));
  return copy;
}

ClientCore
ClientCore::with_cause_precedence (CausePrecedence precedence) const
{
  ClientCore copy = *this;
  copy.precedence_ = precedence;
  return copy;
}

Reply
ClientCore::exchange (const std::string &method,
                      const nlohmann::json &params) const
{
  RequestId id = next_request_id ();
  nlohmann::json request = { { "jsonrpc", constants::JSONRPC_VERSION },
                             { "id", id },
                             { "method", method },
                             { "params", params } };

  logger ()->debug ("-> {} id={}", method, id);
  HttpResponse response
      = transport_->post (HttpRequest{ url_.str (), headers_, request.dump () });

  if (response.status < 200 || response.status >= 300)
    throw TransportError::from_http_status (response.status,
                                            std::move (response.body));

  Reply reply = parse_response (id, std::move (response.body));
  logger ()->debug ("<- {} id={} {}", method, id,
                    reply.is_error ? "error" : "result");
  return reply;
}

} // namespace detail

} // namespace nearrpc
