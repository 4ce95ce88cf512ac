// SPDX-License-Identifier: MIT
// nearrpc - Wire Types
// Copyright (c) 2024-2026 nearrpc Contributors

#pragma once

#include <array>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace nearrpc
{

/// 32-byte hash, base58 on the wire
class CryptoHash
{
public:
  CryptoHash () = default;
  explicit CryptoHash (const std::array<uint8_t, 32> &bytes) : bytes_ (bytes)
  {
  }

  /// @throws std::invalid_argument unless `text` decodes to 32 bytes
  static CryptoHash from_base58 (std::string_view text);

  std::string to_base58 () const;

  const std::array<uint8_t, 32> &
  bytes () const
  {
    return bytes_;
  }

  bool
  operator== (const CryptoHash &other) const
  {
    return bytes_ == other.bytes_;
  }

  bool
  operator!= (const CryptoHash &other) const
  {
    return !(*this == other);
  }

private:
  std::array<uint8_t, 32> bytes_{};
};

void to_json (nlohmann::json &j, const CryptoHash &hash);
void from_json (const nlohmann::json &j, CryptoHash &hash);

enum class Finality
{
  Optimistic, // "optimistic"
  NearFinal,  // "near-final"
  Final       // "final"
};

void to_json (nlohmann::json &j, Finality finality);
void from_json (const nlohmann::json &j, Finality &finality);

enum class SyncCheckpoint
{
  Genesis,          // "genesis"
  EarliestAvailable // "earliest_available"
};

void to_json (nlohmann::json &j, SyncCheckpoint checkpoint);

/// Block height or block hash
using BlockId = std::variant<std::uint64_t, CryptoHash>;

void to_json (nlohmann::json &j, const BlockId &id);
void from_json (const nlohmann::json &j, BlockId &id);

/// Which block a query is evaluated against
using BlockReference = std::variant<BlockId, Finality, SyncCheckpoint>;

/// Adds `block_id`, `finality` or `sync_checkpoint` to `j`
void to_json (nlohmann::json &j, const BlockReference &reference);

/// How far a transaction must progress before the node answers
enum class TxExecutionStatus
{
  None,
  Included,
  ExecutedOptimistic,
  IncludedFinal,
  Executed,
  Final
};

void to_json (nlohmann::json &j, TxExecutionStatus status);
void from_json (const nlohmann::json &j, TxExecutionStatus &status);

/// Borsh-serialized signed transaction, base64 on the wire
///
/// Signing is out of scope; the bytes come from the caller's signer.
struct SignedTransaction
{
  std::vector<uint8_t> borsh;

  std::string to_base64 () const;
};

/// Look a transaction up by hash and signer
struct TransactionId
{
  CryptoHash tx_hash;
  std::string sender_account_id;
};

using TransactionInfo = std::variant<SignedTransaction, TransactionId>;

/// A chunk by its own hash, or by block and shard
struct BlockShardId
{
  BlockId block_id;
  std::uint64_t shard_id = 0;
};

using ChunkId = std::variant<CryptoHash, BlockShardId>;

/// `request_type` payloads of the `query` method
namespace query
{
struct ViewAccount
{
  std::string account_id;
};

struct ViewCode
{
  std::string account_id;
};

struct ViewState
{
  std::string account_id;
  std::string prefix_base64;
  bool include_proof = false;
};

struct ViewAccessKey
{
  std::string account_id;
  std::string public_key; // "ed25519:..."
};

struct ViewAccessKeyList
{
  std::string account_id;
};

struct CallFunction
{
  std::string account_id;
  std::string method_name;
  std::string args_base64;
};
} // namespace query

using QueryRequest
    = std::variant<query::ViewAccount, query::ViewCode, query::ViewState,
                   query::ViewAccessKey, query::ViewAccessKeyList,
                   query::CallFunction>;

/// Adds `request_type` and its fields to `j`
void to_json (nlohmann::json &j, const QueryRequest &request);

/// Latest epoch, a given epoch, or the epoch of a given block
struct LatestEpoch
{
};

struct EpochId
{
  CryptoHash id;
};

using EpochReference = std::variant<LatestEpoch, EpochId, BlockId>;

// Method params. Each to_json renders exactly the shape the node expects.

struct BlockParams
{
  BlockReference block_reference;
};

void to_json (nlohmann::json &j, const BlockParams &params);

/// broadcast_tx_async and broadcast_tx_commit
struct BroadcastTxParams
{
  SignedTransaction signed_transaction;
};

void to_json (nlohmann::json &j, const BroadcastTxParams &params);

struct ChunkParams
{
  ChunkId chunk_id;
};

void to_json (nlohmann::json &j, const ChunkParams &params);

/// Latest block when `block_id` is empty
struct GasPriceParams
{
  std::optional<BlockId> block_id;
};

void to_json (nlohmann::json &j, const GasPriceParams &params);

struct LightClientProofParams
{
  enum class Kind
  {
    Transaction,
    Receipt
  };

  Kind kind = Kind::Transaction;
  CryptoHash id;          // transaction hash or receipt id
  std::string account_id; // sender id or receiver id
  CryptoHash light_client_head;
};

void to_json (nlohmann::json &j, const LightClientProofParams &params);

struct NextLightClientBlockParams
{
  CryptoHash last_block_hash;
};

void to_json (nlohmann::json &j, const NextLightClientBlockParams &params);

struct QueryParams
{
  BlockReference block_reference;
  QueryRequest request;
};

void to_json (nlohmann::json &j, const QueryParams &params);

struct SendTxParams
{
  SignedTransaction signed_transaction;
  TxExecutionStatus wait_until = TxExecutionStatus::ExecutedOptimistic;
};

void to_json (nlohmann::json &j, const SendTxParams &params);

struct TxParams
{
  TransactionInfo transaction_info;
  TxExecutionStatus wait_until = TxExecutionStatus::ExecutedOptimistic;
};

void to_json (nlohmann::json &j, const TxParams &params);

struct ValidatorsParams
{
  EpochReference epoch_reference;
};

void to_json (nlohmann::json &j, const ValidatorsParams &params);

/// EXPERIMENTAL_changes
///
/// `selector` holds the fields of the chosen `changes_type`, e.g.
/// {"account_ids": [...]} for "account_changes".
struct StateChangesParams
{
  BlockReference block_reference;
  std::string changes_type;
  nlohmann::json selector = nlohmann::json::object ();
};

void to_json (nlohmann::json &j, const StateChangesParams &params);

struct ReceiptParams
{
  CryptoHash receipt_id;
};

void to_json (nlohmann::json &j, const ReceiptParams &params);

/// EXPERIMENTAL_tx_status, positional form
struct TxStatusParams
{
  TransactionInfo transaction_info;
};

void to_json (nlohmann::json &j, const TxStatusParams &params);

struct ValidatorsOrderedParams
{
  std::optional<BlockId> block_id;
};

void to_json (nlohmann::json &j, const ValidatorsOrderedParams &params);

/// State records as accepted by the sandbox node
struct PatchStateParams
{
  nlohmann::json records = nlohmann::json::array ();
};

void to_json (nlohmann::json &j, const PatchStateParams &params);

struct FastForwardParams
{
  std::uint64_t delta_height = 0;
};

void to_json (nlohmann::json &j, const FastForwardParams &params);

} // namespace nearrpc
