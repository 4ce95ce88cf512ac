// SPDX-License-Identifier: MIT
// nearrpc - Method Descriptor Tests
// Copyright (c) 2024-2026 nearrpc Contributors

#include <boost/test/unit_test.hpp>

#include "nearrpc/any.hpp"
#include "nearrpc/methods.hpp"

using namespace nearrpc;
using nlohmann::json;

namespace
{
const char *const HASH = "1thX6LZfHDZZKUs92febYZhYRcXddmzfzF2NvTkPNE";

template <typename M>
json
params_of (const M &method)
{
  return MethodTraits<M>::encode_params (method);
}
}

BOOST_AUTO_TEST_SUITE (method_tests)

BOOST_AUTO_TEST_CASE (test_request_envelope)
{
  json expected = { { "jsonrpc", "2.0" },
                    { "id", 7 },
                    { "method", "status" },
                    { "params", nullptr } };
  BOOST_CHECK_EQUAL (to_request_json (methods::Status{}, 7), expected);
}

BOOST_AUTO_TEST_CASE (test_block_reference_params)
{
  BOOST_CHECK_EQUAL (params_of (methods::Block{ { Finality::Final } }),
                     json ({ { "finality", "final" } }));
  BOOST_CHECK_EQUAL (
      params_of (methods::Block{ { BlockId{ std::uint64_t{ 1000 } } } }),
      json ({ { "block_id", 1000 } }));
  BOOST_CHECK_EQUAL (
      params_of (methods::Block{ { BlockId{ CryptoHash::from_base58 (HASH) } } }),
      json ({ { "block_id", HASH } }));
  BOOST_CHECK_EQUAL (
      params_of (methods::Block{ { SyncCheckpoint::Genesis } }),
      json ({ { "sync_checkpoint", "genesis" } }));
  BOOST_CHECK_EQUAL (
      params_of (methods::ProtocolConfig{ { Finality::NearFinal } }),
      json ({ { "finality", "near-final" } }));
}

BOOST_AUTO_TEST_CASE (test_query_params)
{
  methods::Query view_account{
    { Finality::Final, query::ViewAccount{ "miraclx.near" } }
  };
  BOOST_CHECK_EQUAL (params_of (view_account),
                     json ({ { "finality", "final" },
                             { "request_type", "view_account" },
                             { "account_id", "miraclx.near" } }));

  methods::Query call{ { BlockId{ std::uint64_t{ 5 } },
                         query::CallFunction{ "counter.near", "get", "e30=" } } };
  json params = params_of (call);
  BOOST_CHECK_EQUAL (params["block_id"], 5);
  BOOST_CHECK_EQUAL (params["request_type"], "call_function");
  BOOST_CHECK_EQUAL (params["method_name"], "get");
  BOOST_CHECK_EQUAL (params["args_base64"], "e30=");
}

BOOST_AUTO_TEST_CASE (test_transaction_params)
{
  SignedTransaction tx{ { 1, 2, 3 } };

  BOOST_CHECK_EQUAL (params_of (methods::BroadcastTxAsync{ { tx } }),
                     json::array ({ "AQID" }));
  BOOST_CHECK_EQUAL (params_of (methods::SendTx{ { tx } }),
                     json ({ { "signed_tx_base64", "AQID" },
                             { "wait_until", "EXECUTED_OPTIMISTIC" } }));

  TransactionId id{ CryptoHash::from_base58 (HASH), "alice.near" };
  BOOST_CHECK_EQUAL (
      params_of (methods::Tx{ { id, TxExecutionStatus::Final } }),
      json ({ { "tx_hash", HASH },
              { "sender_account_id", "alice.near" },
              { "wait_until", "FINAL" } }));
  BOOST_CHECK_EQUAL (params_of (methods::TxStatus{ { id } }),
                     json::array ({ HASH, "alice.near" }));
  BOOST_CHECK_EQUAL (params_of (methods::TxStatus{ { tx } }),
                     json::array ({ "AQID" }));
  BOOST_CHECK_EQUAL (params_of (methods::CheckTx{ { tx } }),
                     json::array ({ "AQID" }));
}

BOOST_AUTO_TEST_CASE (test_misc_params)
{
  BOOST_CHECK_EQUAL (params_of (methods::GasPrice{}), json::array ({ nullptr }));
  BOOST_CHECK_EQUAL (
      params_of (methods::GasPrice{ { BlockId{ std::uint64_t{ 9 } } } }),
      json::array ({ 9 }));
  BOOST_CHECK_EQUAL (params_of (methods::Validators{ { LatestEpoch{} } }),
                     json::array ({ nullptr }));
  BOOST_CHECK_EQUAL (params_of (methods::ValidatorsOrdered{}),
                     json ({ { "block_id", nullptr } }));
  BOOST_CHECK_EQUAL (
      params_of (methods::Chunk{ { BlockShardId{ BlockId{ std::uint64_t{ 3 } }, 1 } } }),
      json ({ { "block_id", 3 }, { "shard_id", 1 } }));
  BOOST_CHECK_EQUAL (params_of (methods::SandboxFastForward{ { 5 } }),
                     json ({ { "delta_height", 5 } }));

  StateChangesParams changes{ Finality::Final, "account_changes",
                              { { "account_ids", { "alice.near" } } } };
  json params = params_of (methods::Changes{ changes });
  BOOST_CHECK_EQUAL (params["changes_type"], "account_changes");
  BOOST_CHECK_EQUAL (params["finality"], "final");
  BOOST_CHECK_EQUAL (params["account_ids"], json::array ({ "alice.near" }));
}

BOOST_AUTO_TEST_CASE (test_catalog_method_names)
{
  BOOST_CHECK_EQUAL (methods::Status{}.method_name (), "status");
  BOOST_CHECK_EQUAL (methods::Changes{}.method_name (), "EXPERIMENTAL_changes");
  BOOST_CHECK_EQUAL (methods::CheckTx{}.method_name (), "EXPERIMENTAL_check_tx");
  BOOST_CHECK_EQUAL (methods::SandboxFastForward{}.method_name (),
                     "sandbox_fast_forward");
  BOOST_CHECK_EQUAL (MethodTraits<methods::Tx>::method_name (methods::Tx{}),
                     "tx");
}

BOOST_AUTO_TEST_CASE (test_decode_result)
{
  using Traits = MethodTraits<methods::GasPrice>;
  BOOST_CHECK_EQUAL (Traits::decode_result ({ { "gas_price", "123" } }).gas_price,
                     "123");
  BOOST_CHECK_THROW (Traits::decode_result (json::array ()), DecodeError);
  BOOST_CHECK_THROW (Traits::decode_result ({ { "gas_price", 5 } }), DecodeError);

  BOOST_CHECK (MethodTraits<methods::Health>::decode_result (nullptr) == nullptr);
  BOOST_CHECK_THROW (MethodTraits<methods::Health>::decode_result (0),
                     DecodeError);
}

BOOST_AUTO_TEST_CASE (test_status_round_trip)
{
  StatusResponse status;
  status.chain_id = "testnet";
  status.protocol_version = 67;
  status.latest_protocol_version = 68;
  status.version = { "1.39.0", "abc" };
  status.sync_info.latest_block_hash = CryptoHash::from_base58 (HASH);
  status.sync_info.latest_block_height = 42;
  status.sync_info.syncing = true;

  StatusResponse decoded
      = MethodTraits<methods::Status>::decode_result (json (status));
  BOOST_CHECK_EQUAL (decoded.chain_id, "testnet");
  BOOST_CHECK_EQUAL (decoded.protocol_version, 67u);
  BOOST_CHECK_EQUAL (decoded.latest_protocol_version, 68u);
  BOOST_CHECK_EQUAL (decoded.version.build, "abc");
  BOOST_CHECK (decoded.sync_info.latest_block_hash
               == status.sync_info.latest_block_hash);
  BOOST_CHECK_EQUAL (decoded.sync_info.latest_block_height, 42u);
  BOOST_CHECK (decoded.sync_info.syncing);
}

BOOST_AUTO_TEST_CASE (test_decode_handler_error)
{
  using Traits = MethodTraits<methods::Query>;
  auto known = Traits::decode_handler_error (
      { { "name", "UNKNOWN_ACCOUNT" },
        { "info", { { "requested_account_id", "nobody.near" } } } });
  BOOST_REQUIRE (known.has_value ());
  BOOST_CHECK (known->is ("UNKNOWN_ACCOUNT"));

  BOOST_CHECK (!Traits::decode_handler_error ({ { "name", "NOT_A_QUERY_ERROR" } }));
  BOOST_CHECK (!Traits::decode_handler_error ("plain text"));
  BOOST_CHECK (!Traits::decode_handler_error (nullptr));
}

BOOST_AUTO_TEST_CASE (test_any_method)
{
  auto request = any ("EXPERIMENTAL_maintenance_windows",
                      { { "account_id", "node.near" } });
  BOOST_CHECK_EQUAL (request.method_name (), "EXPERIMENTAL_maintenance_windows");
  BOOST_CHECK_EQUAL (request.params (), json ({ { "account_id", "node.near" } }));

  using Traits = MethodTraits<decltype (request)>;
  json weird = { { "whatever", json::array ({ 1, "two", nullptr }) } };
  BOOST_CHECK_EQUAL (Traits::decode_result (weird), weird);
  BOOST_CHECK_EQUAL (Traits::decode_result ("x"), json ("x"));

  auto typed = any<GasPriceView, GasPriceError> ("gas_price", json::array ({ nullptr }));
  BOOST_CHECK_THROW (MethodTraits<decltype (typed)>::decode_result (json::array ()),
                     DecodeError);
  BOOST_CHECK (to_request_json (typed, 1)["params"] == json::array ({ nullptr }));
}

BOOST_AUTO_TEST_SUITE_END ()
