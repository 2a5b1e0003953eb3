#pragma once
// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PST_RPC_CONTROL_H
#define PST_RPC_CONTROL_H

#include "rpc/request.h"
#include "rpc/server.h"

#include <cstdint>
#include <functional>

namespace rpc {

// ---------------------------------------------------------------------------
// NodeContext -- opaque reference to the node for control commands
// ---------------------------------------------------------------------------
// Bundles the callbacks the control commands need without a dependency on
// the full node implementation.
// ---------------------------------------------------------------------------

struct NodeContext {
    /// Asks the node to shut down. Must not block on the RPC server.
    std::function<void()> request_shutdown;

    /// The Unix timestamp when the node started.
    int64_t startup_time = 0;
};

// ---------------------------------------------------------------------------
// Control RPC command handlers
// ---------------------------------------------------------------------------

/// stop: request a clean shutdown of the node.
RpcResponse rpc_stop(const RpcRequest& req, NodeContext& ctx);

/// uptime: return the node uptime in seconds.
RpcResponse rpc_uptime(const RpcRequest& req, const NodeContext& ctx);

/// help(command?): list all commands or show help for one.
RpcResponse rpc_help(const RpcRequest& req, const RpcServer& server);

/// logging(include, exclude): get/set log categories.
RpcResponse rpc_logging(const RpcRequest& req);

/// Register all control RPC commands with the server.
void register_control_rpcs(RpcServer& server, NodeContext& ctx);

} // namespace rpc

#endif // PST_RPC_CONTROL_H
