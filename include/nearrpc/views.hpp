// SPDX-License-Identifier: MIT
// nearrpc - Result Views
// Copyright (c) 2024-2026 nearrpc Contributors

#pragma once

#include "nearrpc/types.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace nearrpc
{

struct NodeVersion
{
  std::string version;
  std::string build;
};

struct SyncInfo
{
  CryptoHash latest_block_hash;
  std::uint64_t latest_block_height = 0;
  std::string latest_block_time;
  bool syncing = false;
};

/// Result of `status`
struct StatusResponse
{
  std::string chain_id;
  std::uint32_t protocol_version = 0;
  std::uint32_t latest_protocol_version = 0;
  NodeVersion version;
  SyncInfo sync_info;
  nlohmann::json validators; // left as received
};

void to_json (nlohmann::json &j, const NodeVersion &v);
void from_json (const nlohmann::json &j, NodeVersion &v);
void to_json (nlohmann::json &j, const SyncInfo &info);
void from_json (const nlohmann::json &j, SyncInfo &info);
void to_json (nlohmann::json &j, const StatusResponse &status);
void from_json (const nlohmann::json &j, StatusResponse &status);

struct BlockHeaderView
{
  std::uint64_t height = 0;
  CryptoHash hash;
  CryptoHash prev_hash;
  CryptoHash epoch_id;
  std::uint64_t timestamp = 0; // ns since epoch
};

/// Result of `block`
struct BlockView
{
  std::string author;
  BlockHeaderView header;
  nlohmann::json chunks; // chunk headers, left as received
};

void from_json (const nlohmann::json &j, BlockHeaderView &header);
void from_json (const nlohmann::json &j, BlockView &block);

/// Result of `gas_price`; the price is a u128 decimal string
struct GasPriceView
{
  std::string gas_price;
};

void from_json (const nlohmann::json &j, GasPriceView &view);

/// Result of `tx`, `send_tx`, `broadcast_tx_commit` and
/// `EXPERIMENTAL_tx_status`
struct TransactionResponse
{
  /// Absent on nodes that predate `wait_until`
  std::optional<TxExecutionStatus> final_execution_status;
  nlohmann::json status; // e.g. {"SuccessValue": ""}
  nlohmann::json transaction;
  nlohmann::json transaction_outcome;
  nlohmann::json receipts_outcome;

  /// True when `status` reports a successful execution
  bool is_success () const;
};

void from_json (const nlohmann::json &j, TransactionResponse &response);

/// Result of `query`
///
/// `value` keeps the whole result object; its shape depends on the
/// request type (account, access key, call result, ...).
struct QueryResponse
{
  std::uint64_t block_height = 0;
  CryptoHash block_hash;
  nlohmann::json value;
};

void from_json (const nlohmann::json &j, QueryResponse &response);

} // namespace nearrpc
