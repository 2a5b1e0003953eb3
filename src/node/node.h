#pragma once
// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Node -- top-level orchestrator for the PST daemon.
//
// The Node class owns all subsystems via unique_ptr and coordinates their
// lifecycle:
//
//   1. Construction:  Stores the NodeConfig.  No subsystem is created yet.
//   2. init():        Creates and starts all subsystems in dependency order.
//   3. run():         Blocks the calling thread until a shutdown signal
//                     is received (SIGINT, SIGTERM, or the stop RPC).
//   4. shutdown():    Tears down all subsystems in reverse order, writing
//                     the ledger snapshot.
//
// Initialization order:
//   logging -> data directory lock -> balance book + ledger
//   -> snapshot load (conditional) -> RPC (conditional)
//
// Thread safety:
//   - init() and shutdown() must be called from the same thread (typically
//     main).
//   - run() blocks the calling thread.
//   - is_running() is safe to call from any thread (atomic).
// ---------------------------------------------------------------------------

#ifndef PST_NODE_NODE_H
#define PST_NODE_NODE_H

#include "core/error.h"
#include "core/fs.h"
#include "node/context.h"
#include "rpc/control.h"
#include "rpc/escrow_rpc.h"

#include <atomic>
#include <memory>

namespace escrow {
    class InMemoryAssetMover;
    class LedgerStore;
    class TransferLedger;
} // namespace escrow

namespace rpc {
    class RpcServer;
} // namespace rpc

namespace node {

class Node {
public:
    // -- Lifecycle -----------------------------------------------------------

    explicit Node(NodeConfig config);

    /// Calls shutdown() if the node is still running.
    ~Node();

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;
    Node(Node&&) = delete;
    Node& operator=(Node&&) = delete;

    /// Initialize all subsystems in order. On failure, anything already
    /// started is torn down before the error is returned.
    [[nodiscard]] core::Result<void> init();

    /// Block the calling thread until a shutdown is requested.
    void run();

    /// Stop RPC, write the snapshot, close the log. Idempotent.
    void shutdown();

    [[nodiscard]] bool is_running() const noexcept;

    // -- Accessors -----------------------------------------------------------

    [[nodiscard]] const NodeConfig& config() const noexcept;

    /// Null before init() and after shutdown().
    [[nodiscard]] escrow::TransferLedger* ledger() const noexcept;
    [[nodiscard]] escrow::InMemoryAssetMover* book() const noexcept;
    [[nodiscard]] rpc::RpcServer* rpc_server() const noexcept;

private:
    void teardown();

    // -- Configuration -------------------------------------------------------
    NodeConfig config_;

    // -- Contexts handed to the RPC commands ---------------------------------
    rpc::NodeContext   node_ctx_;
    rpc::EscrowContext escrow_ctx_;

    // -- Owned subsystem instances -------------------------------------------
    std::unique_ptr<core::fs::FileLock>         datadir_lock_;
    std::unique_ptr<escrow::InMemoryAssetMover> book_;
    std::unique_ptr<escrow::TransferLedger>     ledger_;
    std::unique_ptr<escrow::LedgerStore>        store_;
    std::unique_ptr<rpc::RpcServer>             rpc_server_;

    // -- State ---------------------------------------------------------------
    std::atomic<bool> running_{false};
};

} // namespace node

#endif // PST_NODE_NODE_H
