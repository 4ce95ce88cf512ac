// SPDX-License-Identifier: MIT
// nearrpc - Error Resolver Implementation
// Copyright (c) 2024-2026 nearrpc Contributors

#include "nearrpc/resolver.hpp"

namespace nearrpc
{

const char *
to_string (ResolvedKind kind)
{
  switch (kind)
    {
    case ResolvedKind::Handler:
      return "handler";
    case ResolvedKind::Generic:
      return "generic";
    case ResolvedKind::Unrecognized:
      return "unrecognized";
    }
  return "unknown";
}

namespace detail
{

namespace
{
bool
is_cause (const nlohmann::json &value)
{
  return value.is_object () && value.contains ("name")
         && value["name"].is_string ();
}

bool
has_integer_code (const nlohmann::json &error)
{
  auto it = error.find ("code");
  return it != error.end () && it->is_number_integer ();
}
}

std::vector<nlohmann::json>
handler_candidates (const nlohmann::json &error, CausePrecedence precedence)
{
  std::vector<nlohmann::json> candidates;
  if (!error.is_object ())
    return candidates;

  std::vector<nlohmann::json> wrapped;
  if (auto it = error.find ("cause"); it != error.end () && is_cause (*it))
    wrapped.push_back (*it);

  nlohmann::json flat;
  if (auto it = error.find ("data"); it != error.end () && !it->is_null ())
    {
      flat = *it;
      if (it->is_object ())
        {
          auto nested = it->find ("cause");
          if (nested != it->end () && is_cause (*nested)
              && (wrapped.empty () || wrapped.front () != *nested))
            wrapped.push_back (*nested);
        }
    }

  if (precedence == CausePrecedence::DataFirst && !flat.is_null ())
    candidates.push_back (flat);

  candidates.insert (candidates.end (), wrapped.begin (), wrapped.end ());

  if (precedence == CausePrecedence::CauseFirst && !flat.is_null ())
    candidates.push_back (flat);

  // Legacy servers put the handler error where the envelope should be
  if (!has_integer_code (error))
    candidates.push_back (error);

  return candidates;
}

std::optional<GenericRpcError>
parse_generic (const nlohmann::json &error)
{
  if (!error.is_object () || !has_integer_code (error))
    return std::nullopt;

  auto message = error.find ("message");
  if (message == error.end () || !message->is_string ())
    return std::nullopt;

  GenericRpcError generic;
  generic.code = error["code"].get<std::int64_t> ();
  generic.message = message->get<std::string> ();

  if (auto it = error.find ("data"); it != error.end ())
    generic.data = *it;
  if (auto it = error.find ("name"); it != error.end () && it->is_string ())
    generic.name = it->get<std::string> ();
  if (auto it = error.find ("cause"); it != error.end ())
    generic.cause = *it;

  return generic;
}

nlohmann::json
raw_payload (const nlohmann::json &error)
{
  if (error.is_object ())
    {
      if (auto it = error.find ("data"); it != error.end ())
        return *it;
    }
  return error;
}

} // namespace detail

} // namespace nearrpc
