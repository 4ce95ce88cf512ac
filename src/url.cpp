// SPDX-License-Identifier: MIT
// nearrpc - Endpoint URL Implementation
// Copyright (c) 2024-2026 nearrpc Contributors

#include "nearrpc/errors.hpp"
#include "nearrpc/url.hpp"
#include <curl/curl.h>
#include <memory>
#include <new>

namespace nearrpc
{

namespace
{
struct UrlHandleDeleter
{
  void
  operator() (CURLU *handle) const
  {
    curl_url_cleanup (handle);
  }
};

using UrlHandle = std::unique_ptr<CURLU, UrlHandleDeleter>;

std::optional<std::string>
get_part (CURLU *handle, CURLUPart part)
{
  char *value = nullptr;
  if (curl_url_get (handle, part, &value, 0) != CURLUE_OK || !value)
    return std::nullopt;

  std::string result (value);
  curl_free (value);
  return result;
}
}

Url::Url (std::string_view text)
{
  std::string input (text);
  if (input.empty ())
    throw InvalidEndpoint (input, "empty URL");

  UrlHandle handle (curl_url ());
  if (!handle)
    throw std::bad_alloc ();

  CURLUcode rc = curl_url_set (handle.get (), CURLUPART_URL, input.c_str (),
                               CURLU_DEFAULT_SCHEME);
  if (rc != CURLUE_OK)
    {
      throw InvalidEndpoint (input, "cannot parse URL (CURLUcode "
                                        + std::to_string (rc) + ")");
    }

  scheme_ = get_part (handle.get (), CURLUPART_SCHEME).value_or ("");
  if (scheme_ != "http" && scheme_ != "https")
    throw InvalidEndpoint (input, "unsupported scheme '" + scheme_ + "'");

  auto host = get_part (handle.get (), CURLUPART_HOST);
  if (!host || host->empty ())
    throw InvalidEndpoint (input, "missing host");
  host_ = std::move (*host);

  // CURLUPART_PORT only reports an explicit port
  if (auto port = get_part (handle.get (), CURLUPART_PORT))
    port_ = std::stol (*port);

  path_ = get_part (handle.get (), CURLUPART_PATH).value_or ("/");

  auto url = get_part (handle.get (), CURLUPART_URL);
  if (!url)
    throw InvalidEndpoint (input, "cannot normalize URL");
  url_ = std::move (*url);
}

} // namespace nearrpc
