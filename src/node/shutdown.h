#pragma once
// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Graceful shutdown for the PST daemon.
//
// This module provides:
//   - A thread-safe shutdown signalling mechanism (delegates to core::signal).
//   - Per-subsystem shutdown steps that flush state and release resources.
//
// Shutdown order is the reverse of initialization:
//   rpc -> ledger snapshot -> logging
//
// Each step is safe to call when its subsystem was never started.
// ---------------------------------------------------------------------------

#ifndef PST_NODE_SHUTDOWN_H
#define PST_NODE_SHUTDOWN_H

#include "core/error.h"

namespace escrow {
    class InMemoryAssetMover;
    class LedgerStore;
    class TransferLedger;
} // namespace escrow

namespace rpc {
    class RpcServer;
} // namespace rpc

namespace node {

// ---------------------------------------------------------------------------
// Shutdown signalling
// ---------------------------------------------------------------------------

/// Signal the node to stop. Thread-safe; idempotent. Never blocks, so RPC
/// handlers may call it.
void request_shutdown();

/// Lock-free; safe to call from any thread.
[[nodiscard]] bool shutdown_requested() noexcept;

/// Block the calling thread until shutdown_requested() becomes true.
void wait_for_shutdown();

/// SIGINT, SIGTERM and SIGHUP request shutdown; SIGPIPE is ignored.
/// Safe to call multiple times.
void install_signal_handlers();

// ---------------------------------------------------------------------------
// Per-subsystem shutdown steps
// ---------------------------------------------------------------------------

/// Stops accepting connections and joins the worker threads. Must not be
/// called from an RPC worker.
void shutdown_rpc(rpc::RpcServer* server);

/// Writes the ledger snapshot. Safe with a null store (snapshots off).
[[nodiscard]] core::Result<void> shutdown_ledger(const escrow::LedgerStore* store,
                                                 const escrow::TransferLedger* ledger,
                                                 const escrow::InMemoryAssetMover* book);

/// Flush all logging buffers and close the log file.
///
/// Should be called as the very last step before process exit.
void shutdown_logging();

} // namespace node

#endif // PST_NODE_SHUTDOWN_H
