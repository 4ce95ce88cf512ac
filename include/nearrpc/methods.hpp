// SPDX-License-Identifier: MIT
// nearrpc - Method Catalog
// Copyright (c) 2024-2026 nearrpc Contributors

#pragma once

#include "nearrpc/handler_error.hpp"
#include "nearrpc/method.hpp"
#include "nearrpc/types.hpp"
#include "nearrpc/views.hpp"
#include <cstddef>
#include <nlohmann/json.hpp>

namespace nearrpc
{

namespace methods
{

// Wire method names
namespace names
{
inline constexpr char block[] = "block";
inline constexpr char broadcast_tx_async[] = "broadcast_tx_async";
inline constexpr char broadcast_tx_commit[] = "broadcast_tx_commit";
inline constexpr char chunk[] = "chunk";
inline constexpr char gas_price[] = "gas_price";
inline constexpr char health[] = "health";
inline constexpr char light_client_proof[] = "light_client_proof";
inline constexpr char next_light_client_block[] = "next_light_client_block";
inline constexpr char network_info[] = "network_info";
inline constexpr char query[] = "query";
inline constexpr char send_tx[] = "send_tx";
inline constexpr char status[] = "status";
inline constexpr char tx[] = "tx";
inline constexpr char validators[] = "validators";
inline constexpr char changes[] = "EXPERIMENTAL_changes";
inline constexpr char changes_in_block[] = "EXPERIMENTAL_changes_in_block";
inline constexpr char check_tx[] = "EXPERIMENTAL_check_tx";
inline constexpr char genesis_config[] = "EXPERIMENTAL_genesis_config";
inline constexpr char protocol_config[] = "EXPERIMENTAL_protocol_config";
inline constexpr char receipt[] = "EXPERIMENTAL_receipt";
inline constexpr char tx_status[] = "EXPERIMENTAL_tx_status";
inline constexpr char validators_ordered[]
    = "EXPERIMENTAL_validators_ordered";
inline constexpr char sandbox_patch_state[] = "sandbox_patch_state";
inline constexpr char sandbox_fast_forward[] = "sandbox_fast_forward";
} // namespace names

using Json = nlohmann::json;

using Block = Method<names::block, BlockParams, BlockView, BlockError>;
using BroadcastTxAsync = Method<names::broadcast_tx_async, BroadcastTxParams,
                                CryptoHash, TransactionError>;
using BroadcastTxCommit
    = Method<names::broadcast_tx_commit, BroadcastTxParams,
             TransactionResponse, TransactionError>;
using Chunk = Method<names::chunk, ChunkParams, Json, ChunkError>;
using GasPrice
    = Method<names::gas_price, GasPriceParams, GasPriceView, GasPriceError>;
using Health = NullaryMethod<names::health, std::nullptr_t, StatusError>;
using LightClientProof
    = Method<names::light_client_proof, LightClientProofParams, Json,
             LightClientProofError>;
using NextLightClientBlock
    = Method<names::next_light_client_block, NextLightClientBlockParams, Json,
             LightClientNextBlockError>;
using NetworkInfo
    = NullaryMethod<names::network_info, Json, NetworkInfoError>;
using Query = Method<names::query, QueryParams, QueryResponse, QueryError>;
using SendTx = Method<names::send_tx, SendTxParams, TransactionResponse,
                      TransactionError>;
using Status = NullaryMethod<names::status, StatusResponse, StatusError>;
using Tx = Method<names::tx, TxParams, TransactionResponse, TransactionError>;
using Validators
    = Method<names::validators, ValidatorsParams, Json, ValidatorError>;

// EXPERIMENTAL_*
using Changes
    = Method<names::changes, StateChangesParams, Json, StateChangesError>;
using ChangesInBlock
    = Method<names::changes_in_block, BlockParams, Json, StateChangesError>;
using CheckTx
    = Method<names::check_tx, BroadcastTxParams, Json, TransactionError>;
using GenesisConfig
    = NullaryMethod<names::genesis_config, Json, GenesisConfigError>;
using ProtocolConfig
    = Method<names::protocol_config, BlockParams, Json, ProtocolConfigError>;
using Receipt = Method<names::receipt, ReceiptParams, Json, ReceiptError>;
using TxStatus = Method<names::tx_status, TxStatusParams, TransactionResponse,
                        TransactionError>;
using ValidatorsOrdered = Method<names::validators_ordered,
                                 ValidatorsOrderedParams, Json, ValidatorError>;

// Sandbox nodes only
using SandboxPatchState = Method<names::sandbox_patch_state, PatchStateParams,
                                 Json, SandboxError>;
using SandboxFastForward = Method<names::sandbox_fast_forward,
                                  FastForwardParams, Json, SandboxError>;

} // namespace methods

} // namespace nearrpc
