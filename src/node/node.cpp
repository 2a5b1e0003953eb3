// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "node/node.h"

#include "node/context.h"
#include "node/logging_init.h"
#include "node/shutdown.h"

#include "core/error.h"
#include "core/fs.h"
#include "core/logging.h"
#include "core/time.h"
#include "escrow/asset_mover.h"
#include "escrow/fee_schedule.h"
#include "escrow/ledger.h"
#include "escrow/ledger_store.h"
#include "rpc/server.h"

#include <memory>
#include <string>

namespace node {

// ---------------------------------------------------------------------------
// Construction / Destruction
// ---------------------------------------------------------------------------

Node::Node(NodeConfig config)
    : config_(std::move(config))
{
}

Node::~Node() {
    if (running_.load(std::memory_order_acquire)) {
        shutdown();
    }
}

// ---------------------------------------------------------------------------
// init
// ---------------------------------------------------------------------------

core::Result<void> Node::init() {
    if (running_.load(std::memory_order_acquire) || ledger_) {
        return core::make_error(core::ErrorCode::INTERNAL_ERROR,
                                "Node is already initialized");
    }

    core::StopWatch total_sw;

    // -----------------------------------------------------------------------
    // Step 1: Signal handlers and logging
    // -----------------------------------------------------------------------
    install_signal_handlers();

    auto log_result = init_logging(config_);
    if (!log_result.ok()) {
        // Console logging still works.
        LOG_ERROR(core::LogCategory::NODE,
                  "Failed to initialize logging: " +
                  log_result.error().message());
    }

    LOG_INFO(core::LogCategory::NODE, "Starting PST daemon initialization...");

    // -----------------------------------------------------------------------
    // Step 2: Data directory
    // -----------------------------------------------------------------------
    if (!core::fs::ensure_directory(config_.datadir)) {
        LOG_FATAL(core::LogCategory::NODE,
                  "Cannot create data directory " + config_.datadir.string());
        return core::make_error(core::ErrorCode::STORAGE_ERROR,
                                "cannot create " + config_.datadir.string());
    }

    datadir_lock_ = std::make_unique<core::fs::FileLock>(config_.datadir / ".lock");
    if (!datadir_lock_->try_lock()) {
        datadir_lock_.reset();
        LOG_FATAL(core::LogCategory::NODE,
                  "Data directory " + config_.datadir.string() +
                  " is in use by another pstd");
        return core::make_error(core::ErrorCode::STORAGE_ERROR,
                                "data directory is locked");
    }

    // -----------------------------------------------------------------------
    // Step 3: Balance book and ledger
    // -----------------------------------------------------------------------
    auto fees = escrow::FeeSchedule::create(config_.fee_tiers, config_.fee_rates,
                                            config_.fee_scaling);
    if (!fees.ok()) {
        LOG_FATAL(core::LogCategory::FEES,
                  "Invalid fee configuration: " + fees.error().message());
        teardown();
        return fees.error();
    }

    escrow::LedgerOptions options;
    options.fees                = fees.value();
    options.cancel_cooldown     = config_.cancel_cooldown;
    options.min_password_length = config_.min_password_length;
    options.password_iterations = config_.password_iterations;
    options.treasury            = config_.treasury;
    options.clock               = core::system_time_source();

    book_   = std::make_unique<escrow::InMemoryAssetMover>();
    ledger_ = std::make_unique<escrow::TransferLedger>(std::move(options), *book_);

    // -----------------------------------------------------------------------
    // Step 4: Snapshot (conditional)
    // -----------------------------------------------------------------------
    if (config_.snapshot) {
        store_ = std::make_unique<escrow::LedgerStore>(config_.snapshot_path());
        if (store_->exists()) {
            auto loaded = store_->load(*ledger_, book_.get());
            if (!loaded.ok()) {
                LOG_FATAL(core::LogCategory::STORAGE,
                          "Cannot load " + store_->file().string() + ": " +
                          loaded.error().format());
                // Keep the unreadable file: shutdown must not overwrite it.
                store_.reset();
                teardown();
                return loaded.error();
            }
        } else {
            LOG_INFO(core::LogCategory::STORAGE,
                     "No snapshot at " + store_->file().string() +
                     ", starting with an empty ledger");
        }
    }

    // -----------------------------------------------------------------------
    // Step 5: RPC (conditional)
    // -----------------------------------------------------------------------
    node_ctx_.startup_time     = core::get_time();
    node_ctx_.request_shutdown = []() { node::request_shutdown(); };

    escrow_ctx_.ledger       = ledger_.get();
    escrow_ctx_.book         = book_.get();
    escrow_ctx_.availability = config_.availability;

    if (config_.rpc_enabled) {
        rpc::RpcServer::Config rc;
        rc.bind_address = config_.rpc_bind;
        rc.port         = config_.rpc_port;
        rc.rpc_user     = config_.rpc_user;
        rc.rpc_password = config_.rpc_password;
        rc.num_threads  = config_.rpc_threads;

        rpc_server_ = std::make_unique<rpc::RpcServer>(std::move(rc));
        rpc::register_control_rpcs(*rpc_server_, node_ctx_);
        rpc::register_escrow_rpcs(*rpc_server_, escrow_ctx_);

        auto started = rpc_server_->start();
        if (!started.ok()) {
            LOG_FATAL(core::LogCategory::RPC,
                      "RPC initialization failed: " + started.error().message());
            teardown();
            return started.error();
        }
    }

    running_.store(true, std::memory_order_release);

    LOG_INFO(core::LogCategory::NODE,
             "Node initialization complete (" +
             std::to_string(total_sw.elapsed_ms()) + " ms), " +
             std::to_string(ledger_->size()) + " transfers loaded");

    return core::make_ok();
}

// ---------------------------------------------------------------------------
// run
// ---------------------------------------------------------------------------

void Node::run() {
    if (!running_.load(std::memory_order_acquire)) {
        LOG_WARN(core::LogCategory::NODE,
                 "Node::run() called but node is not running");
        return;
    }

    LOG_INFO(core::LogCategory::NODE, "Node is running. Press Ctrl+C to stop.");

    wait_for_shutdown();

    LOG_INFO(core::LogCategory::NODE, "Shutdown signal received.");
}

// ---------------------------------------------------------------------------
// shutdown
// ---------------------------------------------------------------------------

void Node::shutdown() {
    bool was_running = running_.exchange(false, std::memory_order_acq_rel);
    if (!was_running) {
        return;
    }

    LOG_INFO(core::LogCategory::NODE, "Node shutting down...");
    core::StopWatch total_sw;

    // No request can reach the ledger once the RPC server has stopped, so
    // the snapshot sees a quiescent ledger.
    shutdown_rpc(rpc_server_.get());
    rpc_server_.reset();

    auto saved = shutdown_ledger(store_.get(), ledger_.get(), book_.get());
    if (!saved.ok()) {
        LOG_WARN(core::LogCategory::NODE,
                 "Changes since the previous snapshot were not persisted");
    }

    teardown();

    LOG_INFO(core::LogCategory::NODE,
             "Node shutdown complete (" +
             std::to_string(total_sw.elapsed_ms()) + " ms)");

    shutdown_logging();
}

void Node::teardown() {
    if (rpc_server_) {
        shutdown_rpc(rpc_server_.get());
        rpc_server_.reset();
    }
    escrow_ctx_ = rpc::EscrowContext{};
    store_.reset();
    ledger_.reset();
    book_.reset();
    datadir_lock_.reset();
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------

bool Node::is_running() const noexcept {
    return running_.load(std::memory_order_acquire);
}

const NodeConfig& Node::config() const noexcept {
    return config_;
}

escrow::TransferLedger* Node::ledger() const noexcept {
    return ledger_.get();
}

escrow::InMemoryAssetMover* Node::book() const noexcept {
    return book_.get();
}

rpc::RpcServer* Node::rpc_server() const noexcept {
    return rpc_server_.get();
}

} // namespace node
