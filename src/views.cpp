// SPDX-License-Identifier: MIT
// nearrpc - Result Views Implementation
// Copyright (c) 2024-2026 nearrpc Contributors

#include "nearrpc/views.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>

namespace nearrpc
{

namespace
{
/// Member `key` of `j`, or null when absent
nlohmann::json
member_or_null (const nlohmann::json &j, const char *key)
{
  auto it = j.find (key);
  return it == j.end () ? nlohmann::json () : *it;
}

/// Non-negative integer member `key`; `get<uint64_t>` would wrap negatives
std::uint64_t
height_at (const nlohmann::json &j, const char *key)
{
  const nlohmann::json &value = j.at (key);
  if (!value.is_number_integer ()
      || (!value.is_number_unsigned () && value.get<std::int64_t> () < 0))
    {
      throw std::invalid_argument (std::string ("\"") + key
                                   + "\" is not a block height: "
                                   + value.dump ());
    }
  return value.get<std::uint64_t> ();
}
}

void
to_json (nlohmann::json &j, const NodeVersion &v)
{
  j = { { "version", v.version }, { "build", v.build } };
}

void
from_json (const nlohmann::json &j, NodeVersion &v)
{
  j.at ("version").get_to (v.version);
  v.build = j.value ("build", "");
}

void
to_json (nlohmann::json &j, const SyncInfo &info)
{
  j = { { "latest_block_hash", info.latest_block_hash },
        { "latest_block_height", info.latest_block_height },
        { "latest_block_time", info.latest_block_time },
        { "syncing", info.syncing } };
}

void
from_json (const nlohmann::json &j, SyncInfo &info)
{
  j.at ("latest_block_hash").get_to (info.latest_block_hash);
  info.latest_block_height = height_at (j, "latest_block_height");
  info.latest_block_time = j.value ("latest_block_time", "");
  info.syncing = j.value ("syncing", false);
}

void
to_json (nlohmann::json &j, const StatusResponse &status)
{
  j = { { "chain_id", status.chain_id },
        { "protocol_version", status.protocol_version },
        { "latest_protocol_version", status.latest_protocol_version },
        { "version", status.version },
        { "sync_info", status.sync_info },
        { "validators", status.validators } };
}

void
from_json (const nlohmann::json &j, StatusResponse &status)
{
  j.at ("chain_id").get_to (status.chain_id);
  j.at ("sync_info").get_to (status.sync_info);
  status.protocol_version = j.value ("protocol_version", 0u);
  status.latest_protocol_version = j.value ("latest_protocol_version", 0u);
  if (j.contains ("version"))
    j.at ("version").get_to (status.version);
  status.validators = member_or_null (j, "validators");
}

void
from_json (const nlohmann::json &j, BlockHeaderView &header)
{
  header.height = height_at (j, "height");
  j.at ("hash").get_to (header.hash);
  j.at ("prev_hash").get_to (header.prev_hash);
  j.at ("epoch_id").get_to (header.epoch_id);
  header.timestamp = j.value ("timestamp", std::uint64_t{ 0 });
}

void
from_json (const nlohmann::json &j, BlockView &block)
{
  j.at ("author").get_to (block.author);
  j.at ("header").get_to (block.header);
  block.chunks = member_or_null (j, "chunks");
}

void
from_json (const nlohmann::json &j, GasPriceView &view)
{
  j.at ("gas_price").get_to (view.gas_price);
}

bool
TransactionResponse::is_success () const
{
  if (status.is_string ())
    return status.get<std::string> () == "SUCCESS";
  return status.is_object ()
         && (status.contains ("SuccessValue")
             || status.contains ("SuccessReceiptId"));
}

void
from_json (const nlohmann::json &j, TransactionResponse &response)
{
  if (auto it = j.find ("final_execution_status"); it != j.end ())
    response.final_execution_status = it->get<TxExecutionStatus> ();
  else
    response.final_execution_status.reset ();

  response.status = j.at ("status");
  response.transaction = member_or_null (j, "transaction");
  response.transaction_outcome = member_or_null (j, "transaction_outcome");
  response.receipts_outcome = member_or_null (j, "receipts_outcome");
}

void
from_json (const nlohmann::json &j, QueryResponse &response)
{
  response.block_height = height_at (j, "block_height");
  j.at ("block_hash").get_to (response.block_hash);
  response.value = j;
}

} // namespace nearrpc
