#pragma once
// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PST_RPC_ESCROW_RPC_H
#define PST_RPC_ESCROW_RPC_H

#include "escrow/asset_mover.h"
#include "escrow/ledger.h"
#include "escrow/transfer.h"
#include "rpc/request.h"
#include "rpc/server.h"

#include <cstdint>

namespace rpc {

inline constexpr int64_t DEFAULT_AVAILABILITY = 7 * 24 * 60 * 60;

// ---------------------------------------------------------------------------
// EscrowContext -- what the ledger commands operate on
// ---------------------------------------------------------------------------
struct EscrowContext {
    escrow::TransferLedger* ledger = nullptr;

    /// Balance book for deposit/getbalance; null when the ledger runs
    /// against another AssetMover.
    escrow::InMemoryAssetMover* book = nullptr;

    /// Lifetime of a transfer created without an explicit expires_in.
    int64_t availability = DEFAULT_AVAILABILITY;
};

/// Transfer view as returned by every transfer command. Never contains
/// password material.
JsonValue transfer_to_json(const escrow::TransferView& view);

/// "native" for the zero asset, hex otherwise.
std::string asset_to_string(const escrow::AssetId& asset);

// ---------------------------------------------------------------------------
// Ledger RPC command handlers
// ---------------------------------------------------------------------------

/// createtransfer(sender, receiver, asset, amount, password, expires_in?)
RpcResponse rpc_createtransfer(const RpcRequest& req, EscrowContext& ctx);

/// canceltransfer(id, caller)
RpcResponse rpc_canceltransfer(const RpcRequest& req, EscrowContext& ctx);

/// claimtransfer(id, caller, password)
RpcResponse rpc_claimtransfer(const RpcRequest& req, EscrowContext& ctx);

/// reclaimexpired(id, caller)
RpcResponse rpc_reclaimexpired(const RpcRequest& req, EscrowContext& ctx);

/// gettransfer(id)
RpcResponse rpc_gettransfer(const RpcRequest& req, const EscrowContext& ctx);

/// listpending(account?): the account's pending transfers, or all of them.
RpcResponse rpc_listpending(const RpcRequest& req, const EscrowContext& ctx);

/// listhistory(account)
RpcResponse rpc_listhistory(const RpcRequest& req, const EscrowContext& ctx);

/// listtransfers(account, offset?, limit?)
RpcResponse rpc_listtransfers(const RpcRequest& req, const EscrowContext& ctx);

/// counthistory(account)
RpcResponse rpc_counthistory(const RpcRequest& req, const EscrowContext& ctx);

/// liststatus(account, status)
RpcResponse rpc_liststatus(const RpcRequest& req, const EscrowContext& ctx);

/// estimatefee(amount)
RpcResponse rpc_estimatefee(const RpcRequest& req, const EscrowContext& ctx);

/// getfeeschedule()
RpcResponse rpc_getfeeschedule(const RpcRequest& req, const EscrowContext& ctx);

/// deposit(account, asset, amount)
RpcResponse rpc_deposit(const RpcRequest& req, EscrowContext& ctx);

/// getbalance(account, asset?)
RpcResponse rpc_getbalance(const RpcRequest& req, const EscrowContext& ctx);

/// getcollectedfees(asset?)
RpcResponse rpc_getcollectedfees(const RpcRequest& req, const EscrowContext& ctx);

/// Register all ledger RPC commands with the server.
void register_escrow_rpcs(RpcServer& server, EscrowContext& ctx);

} // namespace rpc

#endif // PST_RPC_ESCROW_RPC_H
