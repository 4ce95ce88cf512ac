// SPDX-License-Identifier: MIT
// nearrpc - Error Resolver Tests
// Copyright (c) 2024-2026 nearrpc Contributors

#include <boost/test/unit_test.hpp>

#include "nearrpc/handler_error.hpp"
#include "nearrpc/resolver.hpp"

using nearrpc::BlockError;
using nearrpc::CausePrecedence;
using nearrpc::ResolvedKind;
using nearrpc::TransactionError;
using nearrpc::resolve_error;
using nlohmann::json;

BOOST_AUTO_TEST_SUITE (resolver_tests)

BOOST_AUTO_TEST_CASE (test_flat_data_resolves_to_handler)
{
  json error = { { "code", -32000 },
                 { "message", "Server error" },
                 { "data", { { "name", "UNKNOWN_BLOCK" },
                             { "info", { { "error_message", "gone" } } } } } };

  auto resolved = resolve_error<BlockError> (error);
  BOOST_REQUIRE (resolved.kind () == ResolvedKind::Handler);
  BOOST_REQUIRE (resolved.handler_error () != nullptr);
  BOOST_CHECK_EQUAL (resolved.handler_error ()->name, "UNKNOWN_BLOCK");
  BOOST_CHECK_EQUAL (resolved.handler_error ()->error_message (), "gone");
  BOOST_CHECK (resolved.generic_error () == nullptr);

  // code and message survive next to the typed error
  BOOST_REQUIRE (resolved.envelope ().has_value ());
  BOOST_CHECK_EQUAL (resolved.envelope ()->code, -32000);
  BOOST_CHECK (resolved.raw () == error);
}

BOOST_AUTO_TEST_CASE (test_near_cause_wrapper_resolves_to_handler)
{
  json error = {
    { "name", "HANDLER_ERROR" },
    { "cause",
      { { "name", "UNKNOWN_BLOCK" },
        { "info", { { "block_reference", { { "block_id", 1 } } } } } } },
    { "code", -32000 },
    { "message", "Server error" },
    { "data", "DB Not Found Error: BLOCK HEIGHT: 1 \n Cause: Unknown" }
  };

  auto resolved = resolve_error<BlockError> (error);
  BOOST_REQUIRE (resolved.kind () == ResolvedKind::Handler);
  BOOST_CHECK_EQUAL (resolved.handler_error ()->name, "UNKNOWN_BLOCK");
  BOOST_CHECK (resolved.handler_error ()->info.contains ("block_reference"));
  BOOST_REQUIRE (resolved.envelope ().has_value ());
  BOOST_CHECK_EQUAL (*resolved.envelope ()->name, "HANDLER_ERROR");
  BOOST_CHECK (resolved.payload () == error["data"]);
}

BOOST_AUTO_TEST_CASE (test_cause_nested_inside_data)
{
  json error = { { "code", -32000 },
                 { "message", "Server error" },
                 { "data",
                   { { "cause",
                       { { "name", "UNKNOWN_TRANSACTION" },
                         { "info",
                           { { "requested_transaction_hash", "abc" } } } } } } } };

  auto resolved = resolve_error<TransactionError> (error);
  BOOST_REQUIRE (resolved.kind () == ResolvedKind::Handler);
  BOOST_CHECK_EQUAL (resolved.handler_error ()->name, "UNKNOWN_TRANSACTION");
}

BOOST_AUTO_TEST_CASE (test_precedence_between_cause_and_data)
{
  json error = { { "code", -32000 },
                 { "message", "Server error" },
                 { "cause", { { "name", "NOT_SYNCED_YET" } } },
                 { "data", { { "name", "UNKNOWN_BLOCK" } } } };

  auto cause_first = resolve_error<BlockError> (error);
  BOOST_REQUIRE (cause_first.handler_error () != nullptr);
  BOOST_CHECK_EQUAL (cause_first.handler_error ()->name, "NOT_SYNCED_YET");
  BOOST_CHECK (cause_first.handler_error ()->info.is_null ());

  auto data_first = resolve_error<BlockError> (error, CausePrecedence::DataFirst);
  BOOST_REQUIRE (data_first.handler_error () != nullptr);
  BOOST_CHECK_EQUAL (data_first.handler_error ()->name, "UNKNOWN_BLOCK");
}

BOOST_AUTO_TEST_CASE (test_generic_when_data_is_null)
{
  json error = { { "code", -32000 },
                 { "message", "unknown transaction" },
                 { "data", nullptr } };

  auto resolved = resolve_error<TransactionError> (error);
  BOOST_REQUIRE (resolved.kind () == ResolvedKind::Generic);
  BOOST_REQUIRE (resolved.generic_error () != nullptr);
  BOOST_CHECK_EQUAL (resolved.generic_error ()->code, -32000);
  BOOST_CHECK_EQUAL (resolved.generic_error ()->message,
                     "unknown transaction");
  BOOST_CHECK (resolved.generic_error ()->data.is_null ());
  BOOST_CHECK (resolved.handler_error () == nullptr);
}

BOOST_AUTO_TEST_CASE (test_generic_when_handler_shape_does_not_match)
{
  json error = { { "code", -32602 },
                 { "message", "Invalid params" },
                 { "data", { { "name", "SOMETHING_NEW" }, { "info", 42 } } } };

  auto resolved = resolve_error<BlockError> (error);
  BOOST_REQUIRE (resolved.kind () == ResolvedKind::Generic);
  BOOST_CHECK_EQUAL (resolved.generic_error ()->code, -32602);
  BOOST_CHECK (resolved.generic_error ()->data == error["data"]);
  BOOST_CHECK (resolved.payload () == error["data"]);
}

BOOST_AUTO_TEST_CASE (test_malformed_payloads_are_unrecognized)
{
  const json payloads[] = { json ("boom"),
                            json (nullptr),
                            json (17),
                            json::array ({ 1, 2, 3 }),
                            json ({ { "foo", 1 } }),
                            json ({ { "code", 1.5 }, { "message", "x" } }),
                            json ({ { "code", -1 }, { "message", 7 } }) };

  for (const auto &payload : payloads)
    {
      auto resolved = resolve_error<BlockError> (payload);
      BOOST_CHECK (resolved.kind () == ResolvedKind::Unrecognized);
      BOOST_CHECK_EQUAL (resolved.raw ().dump (), payload.dump ());
      BOOST_CHECK (!resolved.envelope ().has_value ());
    }
}

BOOST_AUTO_TEST_CASE (test_legacy_unknown_block_string)
{
  json error = { { "code", -32000 },
                 { "message", "Server error" },
                 { "data", "DB Not Found Error: BLOCK HEIGHT: 7 \n Cause: Unknown" } };

  auto resolved = resolve_error<BlockError> (error);
  BOOST_REQUIRE (resolved.kind () == ResolvedKind::Handler);
  BOOST_CHECK_EQUAL (resolved.handler_error ()->name, "UNKNOWN_BLOCK");
  BOOST_CHECK (resolved.handler_error ()->error_message ().rfind (
                   "DB Not Found Error", 0)
               == 0);
}

BOOST_AUTO_TEST_CASE (test_legacy_invalid_transaction)
{
  json context = { { "InvalidNonce", { { "tx_nonce", 5 }, { "ak_nonce", 6 } } } };
  json error = { { "code", -32000 },
                 { "message", "Server error" },
                 { "data",
                   { { "TxExecutionError", { { "InvalidTxError", context } } } } } };

  auto resolved = resolve_error<TransactionError> (error);
  BOOST_REQUIRE (resolved.kind () == ResolvedKind::Handler);
  BOOST_CHECK_EQUAL (resolved.handler_error ()->name, "INVALID_TRANSACTION");
  BOOST_CHECK (resolved.handler_error ()->info["context"] == context);
}

BOOST_AUTO_TEST_CASE (test_error_object_without_envelope)
{
  json error = { { "name", "UNKNOWN_BLOCK" }, { "info", json::object () } };

  auto resolved = resolve_error<BlockError> (error);
  BOOST_REQUIRE (resolved.kind () == ResolvedKind::Handler);
  BOOST_CHECK (!resolved.envelope ().has_value ());
  BOOST_CHECK (resolved.payload () == error);
}

BOOST_AUTO_TEST_CASE (test_partial_unknown_block_without_message)
{
  json error = { { "code", -32000 },
                 { "message", "Server error" },
                 { "cause", { { "name", "UNKNOWN_BLOCK" }, { "info", json::object () } } } };

  auto resolved = resolve_error<BlockError> (error);
  BOOST_REQUIRE (resolved.kind () == ResolvedKind::Handler);
  BOOST_CHECK_EQUAL (resolved.handler_error ()->error_message (), "");
}

BOOST_AUTO_TEST_CASE (test_untyped_error_type)
{
  json with_data = { { "code", -32000 },
                     { "message", "Server error" },
                     { "data", { { "anything", true } } } };
  auto handler = resolve_error<json> (with_data);
  BOOST_REQUIRE (handler.kind () == ResolvedKind::Handler);
  BOOST_CHECK (*handler.handler_error () == with_data["data"]);

  json without_data = { { "code", -32601 }, { "message", "Method not found" } };
  auto generic = resolve_error<json> (without_data);
  BOOST_CHECK (generic.kind () == ResolvedKind::Generic);

  auto unrecognized = resolve_error<json> (json ("oops"));
  BOOST_CHECK (unrecognized.kind () == ResolvedKind::Unrecognized);
}

BOOST_AUTO_TEST_CASE (test_describe_names_the_kind)
{
  json error = { { "code", -32000 }, { "message", "unknown transaction" } };
  auto resolved = resolve_error<TransactionError> (error);

  std::string text = resolved.describe ();
  BOOST_CHECK (text.find ("generic") != std::string::npos);
  BOOST_CHECK (text.find ("-32000") != std::string::npos);
  BOOST_CHECK_EQUAL (std::string (nearrpc::to_string (ResolvedKind::Handler)),
                     "handler");
}

BOOST_AUTO_TEST_SUITE_END ()
