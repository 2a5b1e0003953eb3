// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "node/shutdown.h"

#include "core/logging.h"
#include "core/signal.h"
#include "core/time.h"
#include "escrow/ledger.h"
#include "escrow/ledger_store.h"
#include "rpc/server.h"

#include <filesystem>
#include <string>

namespace node {

// ---------------------------------------------------------------------------
// Shutdown signalling -- thin wrappers around core::signal
// ---------------------------------------------------------------------------

void request_shutdown() {
    core::request_shutdown();
}

bool shutdown_requested() noexcept {
    return core::shutdown_requested();
}

void wait_for_shutdown() {
    core::wait_for_shutdown();
}

void install_signal_handlers() {
    core::init_signal_handlers();
}

// ---------------------------------------------------------------------------
// Per-subsystem shutdown steps
// ---------------------------------------------------------------------------

void shutdown_rpc(rpc::RpcServer* server) {
    if (!server) return;

    LOG_INFO(core::LogCategory::RPC, "Stopping RPC server...");
    core::StopWatch sw;

    server->stop();

    LOG_INFO(core::LogCategory::RPC,
             "RPC server stopped (" + std::to_string(sw.elapsed_ms()) + " ms)");
}

core::Result<void> shutdown_ledger(const escrow::LedgerStore* store,
                                   const escrow::TransferLedger* ledger,
                                   const escrow::InMemoryAssetMover* book) {
    if (!store || !ledger) return core::make_ok();

    LOG_INFO(core::LogCategory::STORAGE, "Writing ledger snapshot...");
    core::StopWatch sw;

    auto saved = store->save(*ledger, book);
    if (!saved.ok()) {
        LOG_ERROR(core::LogCategory::STORAGE,
                  "Ledger snapshot failed: " + saved.error().format());
        return saved;
    }

    LOG_INFO(core::LogCategory::STORAGE,
             "Ledger snapshot written (" + std::to_string(sw.elapsed_ms()) + " ms)");
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// Logging shutdown
// ---------------------------------------------------------------------------

void shutdown_logging() {
    LOG_INFO(core::LogCategory::NODE, "Shutting down logging...");

    auto& logger = core::Logger::instance();
    logger.flush();

    // Close the log file by setting an empty path.
    logger.set_log_file(std::filesystem::path{});
    logger.set_print_to_file(false);
}

} // namespace node
