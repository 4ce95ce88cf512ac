// SPDX-License-Identifier: MIT
// nearrpc - HTTP Transport Implementation
// Copyright (c) 2024-2026 nearrpc Contributors

#include "nearrpc/errors.hpp"
#include "nearrpc/log.hpp"
#include "nearrpc/transport.hpp"
#include <curl/curl.h>
#include <mutex>

namespace nearrpc
{

namespace
{
// CURL write callback
size_t
write_callback (void *contents, size_t size, size_t nmemb, std::string *userp)
{
  userp->append (static_cast<char *> (contents), size * nmemb);
  return size * nmemb;
}

TransportErrorKind
kind_for (CURLcode code)
{
  switch (code)
    {
    case CURLE_OPERATION_TIMEDOUT:
      return TransportErrorKind::Timeout;
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_PEER_FAILED_VERIFICATION:
    case CURLE_SSL_CERTPROBLEM:
    case CURLE_SSL_CIPHER:
    case CURLE_SSL_CACERT_BADFILE:
    case CURLE_SSL_ISSUER_ERROR:
    case CURLE_SSL_PINNEDPUBKEYNOTMATCH:
      return TransportErrorKind::Tls;
    default:
      return TransportErrorKind::Connection;
    }
}

std::once_flag curl_init_flag;
}

CurlTransport::CurlTransport (TransportConfig config)
    : config_ (std::move (config))
{
  // Not thread-safe in libcurl itself, so done once before any handle exists
  std::call_once (curl_init_flag,
                  [] { curl_global_init (CURL_GLOBAL_DEFAULT); });
}

HttpResponse
CurlTransport::post (const HttpRequest &request)
{
  CURL *curl = curl_easy_init ();
  if (!curl)
    {
      throw TransportError (TransportErrorKind::Connection,
                            "Failed to initialize CURL");
    }

  std::string response;
  struct curl_slist *headers = nullptr;
  headers = curl_slist_append (headers, "Content-Type: application/json");
  for (const auto &header : request.headers)
    {
      std::string line = header.first + ": " + header.second;
      headers = curl_slist_append (headers, line.c_str ());
    }

  curl_easy_setopt (curl, CURLOPT_URL, request.url.c_str ());
  curl_easy_setopt (curl, CURLOPT_POST, 1L);
  curl_easy_setopt (curl, CURLOPT_POSTFIELDS, request.body.c_str ());
  curl_easy_setopt (curl, CURLOPT_POSTFIELDSIZE,
                    static_cast<long> (request.body.size ()));
  curl_easy_setopt (curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt (curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt (curl, CURLOPT_WRITEDATA, &response);
  curl_easy_setopt (curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt (curl, CURLOPT_TIMEOUT, config_.timeout_seconds);
  curl_easy_setopt (curl, CURLOPT_CONNECTTIMEOUT,
                    config_.connect_timeout_seconds);
  curl_easy_setopt (curl, CURLOPT_USERAGENT, config_.user_agent.c_str ());

  if (!config_.verify_tls)
    {
      curl_easy_setopt (curl, CURLOPT_SSL_VERIFYPEER, 0L);
      curl_easy_setopt (curl, CURLOPT_SSL_VERIFYHOST, 0L);
    }

  CURLcode res = curl_easy_perform (curl);

  long status = 0;
  if (res == CURLE_OK)
    curl_easy_getinfo (curl, CURLINFO_RESPONSE_CODE, &status);

  curl_slist_free_all (headers);
  curl_easy_cleanup (curl);

  if (res != CURLE_OK)
    {
      throw TransportError (kind_for (res),
                            std::string ("CURL error: ")
                                + curl_easy_strerror (res));
    }

  logger ()->debug ("POST {} -> HTTP {} ({} bytes)", request.url, status,
                    response.size ());
  return HttpResponse{ status, std::move (response) };
}

} // namespace nearrpc
