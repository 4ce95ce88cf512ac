// SPDX-License-Identifier: MIT
// nearrpc - Wire Types Implementation
// Copyright (c) 2024-2026 nearrpc Contributors

#include "nearrpc/types.hpp"
#include "nearrpc/utils.hpp"
#include <algorithm>
#include <stdexcept>

namespace nearrpc
{

namespace
{
template <typename... Ts> struct overloaded : Ts...
{
  using Ts::operator()...;
};
template <typename... Ts> overloaded (Ts...) -> overloaded<Ts...>;

nlohmann::json
transaction_params (const TransactionInfo &info, TxExecutionStatus wait_until)
{
  nlohmann::json j = nlohmann::json::object ();
  std::visit (overloaded{
                  [&] (const SignedTransaction &tx) {
                    j["signed_tx_base64"] = tx.to_base64 ();
                  },
                  [&] (const TransactionId &id) {
                    j["tx_hash"] = id.tx_hash;
                    j["sender_account_id"] = id.sender_account_id;
                  } },
              info);
  j["wait_until"] = wait_until;
  return j;
}

nlohmann::json
block_id_or_null (const std::optional<BlockId> &id)
{
  if (!id)
    return nullptr;
  return *id;
}
}

CryptoHash
CryptoHash::from_base58 (std::string_view text)
{
  std::vector<uint8_t> decoded = base58_decode (text);
  if (decoded.size () != 32)
    {
      throw std::invalid_argument ("hash must be 32 bytes, got "
                                   + std::to_string (decoded.size ()));
    }

  std::array<uint8_t, 32> bytes;
  std::copy (decoded.begin (), decoded.end (), bytes.begin ());
  return CryptoHash (bytes);
}

std::string
CryptoHash::to_base58 () const
{
  return base58_encode (bytes_.data (), bytes_.size ());
}

void
to_json (nlohmann::json &j, const CryptoHash &hash)
{
  j = hash.to_base58 ();
}

void
from_json (const nlohmann::json &j, CryptoHash &hash)
{
  hash = CryptoHash::from_base58 (j.get<std::string> ());
}

void
to_json (nlohmann::json &j, Finality finality)
{
  switch (finality)
    {
    case Finality::Optimistic:
      j = "optimistic";
      break;
    case Finality::NearFinal:
      j = "near-final";
      break;
    case Finality::Final:
      j = "final";
      break;
    }
}

void
from_json (const nlohmann::json &j, Finality &finality)
{
  const std::string text = j.get<std::string> ();
  if (text == "optimistic")
    finality = Finality::Optimistic;
  else if (text == "near-final")
    finality = Finality::NearFinal;
  else if (text == "final")
    finality = Finality::Final;
  else
    throw std::invalid_argument ("unknown finality '" + text + "'");
}

void
to_json (nlohmann::json &j, SyncCheckpoint checkpoint)
{
  j = checkpoint == SyncCheckpoint::Genesis ? "genesis" : "earliest_available";
}

void
to_json (nlohmann::json &j, const BlockId &id)
{
  std::visit ([&] (const auto &value) { j = value; }, id);
}

void
from_json (const nlohmann::json &j, BlockId &id)
{
  if (j.is_number_integer ())
    {
      if (!j.is_number_unsigned () && j.get<std::int64_t> () < 0)
        throw std::invalid_argument ("negative block height " + j.dump ());
      id = j.get<std::uint64_t> ();
    }
  else
    id = j.get<CryptoHash> ();
}

void
to_json (nlohmann::json &j, const BlockReference &reference)
{
  if (!j.is_object ())
    j = nlohmann::json::object ();

  std::visit (overloaded{
                  [&] (const BlockId &id) { j["block_id"] = id; },
                  [&] (Finality finality) { j["finality"] = finality; },
                  [&] (SyncCheckpoint checkpoint) {
                    j["sync_checkpoint"] = checkpoint;
                  } },
              reference);
}

void
to_json (nlohmann::json &j, TxExecutionStatus status)
{
  switch (status)
    {
    case TxExecutionStatus::None:
      j = "NONE";
      break;
    case TxExecutionStatus::Included:
      j = "INCLUDED";
      break;
    case TxExecutionStatus::ExecutedOptimistic:
      j = "EXECUTED_OPTIMISTIC";
      break;
    case TxExecutionStatus::IncludedFinal:
      j = "INCLUDED_FINAL";
      break;
    case TxExecutionStatus::Executed:
      j = "EXECUTED";
      break;
    case TxExecutionStatus::Final:
      j = "FINAL";
      break;
    }
}

void
from_json (const nlohmann::json &j, TxExecutionStatus &status)
{
  const std::string text = j.get<std::string> ();
  if (text == "NONE")
    status = TxExecutionStatus::None;
  else if (text == "INCLUDED")
    status = TxExecutionStatus::Included;
  else if (text == "EXECUTED_OPTIMISTIC")
    status = TxExecutionStatus::ExecutedOptimistic;
  else if (text == "INCLUDED_FINAL")
    status = TxExecutionStatus::IncludedFinal;
  else if (text == "EXECUTED")
    status = TxExecutionStatus::Executed;
  else if (text == "FINAL")
    status = TxExecutionStatus::Final;
  else
    throw std::invalid_argument ("unknown execution status '" + text + "'");
}

std::string
SignedTransaction::to_base64 () const
{
  return base64_encode (borsh.data (), borsh.size ());
}

void
to_json (nlohmann::json &j, const QueryRequest &request)
{
  if (!j.is_object ())
    j = nlohmann::json::object ();

  std::visit (
      overloaded{
          [&] (const query::ViewAccount &r) {
            j["request_type"] = "view_account";
            j["account_id"] = r.account_id;
          },
          [&] (const query::ViewCode &r) {
            j["request_type"] = "view_code";
            j["account_id"] = r.account_id;
          },
          [&] (const query::ViewState &r) {
            j["request_type"] = "view_state";
            j["account_id"] = r.account_id;
            j["prefix_base64"] = r.prefix_base64;
            if (r.include_proof)
              j["include_proof"] = true;
          },
          [&] (const query::ViewAccessKey &r) {
            j["request_type"] = "view_access_key";
            j["account_id"] = r.account_id;
            j["public_key"] = r.public_key;
          },
          [&] (const query::ViewAccessKeyList &r) {
            j["request_type"] = "view_access_key_list";
            j["account_id"] = r.account_id;
          },
          [&] (const query::CallFunction &r) {
            j["request_type"] = "call_function";
            j["account_id"] = r.account_id;
            j["method_name"] = r.method_name;
            j["args_base64"] = r.args_base64;
          } },
      request);
}

void
to_json (nlohmann::json &j, const BlockParams &params)
{
  j = nlohmann::json::object ();
  to_json (j, params.block_reference);
}

void
to_json (nlohmann::json &j, const BroadcastTxParams &params)
{
  j = nlohmann::json::array ({ params.signed_transaction.to_base64 () });
}

void
to_json (nlohmann::json &j, const ChunkParams &params)
{
  j = nlohmann::json::object ();
  std::visit (overloaded{ [&] (const CryptoHash &hash) { j["chunk_id"] = hash; },
                          [&] (const BlockShardId &id) {
                            j["block_id"] = id.block_id;
                            j["shard_id"] = id.shard_id;
                          } },
              params.chunk_id);
}

void
to_json (nlohmann::json &j, const GasPriceParams &params)
{
  j = nlohmann::json::array ({ block_id_or_null (params.block_id) });
}

void
to_json (nlohmann::json &j, const LightClientProofParams &params)
{
  if (params.kind == LightClientProofParams::Kind::Transaction)
    {
      j = { { "type", "transaction" },
            { "transaction_hash", params.id },
            { "sender_id", params.account_id } };
    }
  else
    {
      j = { { "type", "receipt" },
            { "receipt_id", params.id },
            { "receiver_id", params.account_id } };
    }
  j["light_client_head"] = params.light_client_head;
}

void
to_json (nlohmann::json &j, const NextLightClientBlockParams &params)
{
  j = { { "last_block_hash", params.last_block_hash } };
}

void
to_json (nlohmann::json &j, const QueryParams &params)
{
  j = nlohmann::json::object ();
  to_json (j, params.block_reference);
  to_json (j, params.request);
}

void
to_json (nlohmann::json &j, const SendTxParams &params)
{
  j = { { "signed_tx_base64", params.signed_transaction.to_base64 () },
        { "wait_until", params.wait_until } };
}

void
to_json (nlohmann::json &j, const TxParams &params)
{
  j = transaction_params (params.transaction_info, params.wait_until);
}

void
to_json (nlohmann::json &j, const ValidatorsParams &params)
{
  std::visit (overloaded{
                  [&] (const LatestEpoch &) {
                    j = nlohmann::json::array ({ nullptr });
                  },
                  [&] (const EpochId &epoch) {
                    j = { { "epoch_id", epoch.id } };
                  },
                  [&] (const BlockId &id) { j = { { "block_id", id } }; } },
              params.epoch_reference);
}

void
to_json (nlohmann::json &j, const StateChangesParams &params)
{
  j = params.selector.is_object () ? params.selector
                                   : nlohmann::json::object ();
  to_json (j, params.block_reference);
  j["changes_type"] = params.changes_type;
}

void
to_json (nlohmann::json &j, const ReceiptParams &params)
{
  j = { { "receipt_id", params.receipt_id } };
}

void
to_json (nlohmann::json &j, const TxStatusParams &params)
{
  std::visit (overloaded{
                  [&] (const SignedTransaction &tx) {
                    j = nlohmann::json::array ({ tx.to_base64 () });
                  },
                  [&] (const TransactionId &id) {
                    j = nlohmann::json::array (
                        { nlohmann::json (id.tx_hash), id.sender_account_id });
                  } },
              params.transaction_info);
}

void
to_json (nlohmann::json &j, const ValidatorsOrderedParams &params)
{
  j = { { "block_id", block_id_or_null (params.block_id) } };
}

void
to_json (nlohmann::json &j, const PatchStateParams &params)
{
  j = { { "records", params.records } };
}

void
to_json (nlohmann::json &j, const FastForwardParams &params)
{
  j = { { "delta_height", params.delta_height } };
}

} // namespace nearrpc
