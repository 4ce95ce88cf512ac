// SPDX-License-Identifier: MIT
// nearrpc - Auth Provider Tests
// Copyright (c) 2024-2026 nearrpc Contributors

#include <boost/test/unit_test.hpp>

#include "nearrpc/auth.hpp"
#include "nearrpc/errors.hpp"

using namespace nearrpc;

BOOST_AUTO_TEST_SUITE (auth_tests)

BOOST_AUTO_TEST_CASE (test_api_key_header)
{
  Header header = ApiKey ("0123-abcd").header ();
  BOOST_CHECK_EQUAL (header.first, "x-api-key");
  BOOST_CHECK_EQUAL (header.second, "0123-abcd");
}

BOOST_AUTO_TEST_CASE (test_bearer_header)
{
  Header header = BearerToken ("eyJhbGciOi").header ();
  BOOST_CHECK_EQUAL (header.first, "Authorization");
  BOOST_CHECK_EQUAL (header.second, "Bearer eyJhbGciOi");
}

BOOST_AUTO_TEST_CASE (test_basic_header)
{
  Header header = BasicAuth ("Aladdin", "open sesame").header ();
  BOOST_CHECK_EQUAL (header.first, "Authorization");
  BOOST_CHECK_EQUAL (header.second, "Basic QWxhZGRpbjpvcGVuIHNlc2FtZQ==");
}

BOOST_AUTO_TEST_CASE (test_unusable_credentials)
{
  BOOST_CHECK_THROW (ApiKey (""), InvalidHeader);
  BOOST_CHECK_THROW (ApiKey ("abc\r\nX-Evil: 1"), InvalidHeader);
  BOOST_CHECK_THROW (BearerToken (std::string ("a\0b", 3)), InvalidHeader);
  BOOST_CHECK_THROW (BasicAuth ("user:name", "pw"), InvalidHeader);
  BOOST_CHECK_THROW (BasicAuth ("", "pw"), InvalidHeader);
  BOOST_CHECK_THROW (BasicAuth ("user", "p\nw"), InvalidHeader);
  BOOST_CHECK_NO_THROW (BasicAuth ("user"));
}

BOOST_AUTO_TEST_SUITE_END ()
