#pragma once
// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// NodeConfig -- all configuration options for the PST daemon.
//
// Built from the command line and the configuration file (command line
// wins). NodeConfig is the single source of truth for every runtime
// parameter of the daemon; the ledger itself never reads configuration.
// ---------------------------------------------------------------------------

#ifndef PST_NODE_CONTEXT_H
#define PST_NODE_CONTEXT_H

#include "core/config.h"
#include "core/error.h"
#include "core/logging.h"
#include "crypto/commitment.h"
#include "escrow/fee_schedule.h"
#include "escrow/types.h"

#include <cstdint>
#include <filesystem>
#include <string>

namespace node {

// ---------------------------------------------------------------------------
// Version constants
// ---------------------------------------------------------------------------

inline constexpr int VERSION_MAJOR = 0;
inline constexpr int VERSION_MINOR = 1;
inline constexpr int VERSION_PATCH = 0;
inline constexpr const char* VERSION_SUFFIX = "alpha";

/// Returns the full version string, e.g. "0.1.0-alpha".
std::string get_version_string();

/// Returns the full client name, e.g. "PST Escrow v0.1.0-alpha".
std::string get_client_name();

inline constexpr const char* DEFAULT_CONF_FILE     = "pst.conf";
inline constexpr const char* DEFAULT_LOG_FILE      = "debug.log";
inline constexpr const char* DEFAULT_SNAPSHOT_FILE = "ledger.dat";

// ---------------------------------------------------------------------------
// NodeConfig
// ---------------------------------------------------------------------------

struct NodeConfig {
    // -- Data directory ------------------------------------------------------
    std::filesystem::path datadir;  // resolved at parse time

    // -- RPC -----------------------------------------------------------------
    bool rpc_enabled = true;
    std::string rpc_bind = "127.0.0.1";
    uint16_t rpc_port = 9645;
    std::string rpc_user;
    std::string rpc_password;
    int rpc_threads = 4;

    // -- Ledger --------------------------------------------------------------
    escrow::FeeTiers fee_tiers;
    escrow::FeeRates fee_rates;
    uint64_t fee_scaling = escrow::DEFAULT_FEE_SCALING;
    int64_t cancel_cooldown = 1800;
    int64_t availability = 604800;
    size_t min_password_length = 7;
    uint32_t password_iterations = crypto::PBKDF2_ITERATIONS;
    escrow::AccountId treasury;
    bool snapshot = true;

    // -- Logging -------------------------------------------------------------
    core::LogLevel log_level = core::LogLevel::INFO;
    core::LogCategory log_categories = core::LogCategory::ALL;
    std::string log_file = DEFAULT_LOG_FILE;   // empty disables the file sink
    bool print_to_console = true;

    // -- Derived helpers -----------------------------------------------------

    /// Returns the full path to the log file.
    [[nodiscard]] std::filesystem::path log_file_path() const;

    /// Returns the full path to the ledger snapshot.
    [[nodiscard]] std::filesystem::path snapshot_path() const;
};

// ---------------------------------------------------------------------------
// Argument / config file parsing
// ---------------------------------------------------------------------------

/// Merges <datadir>/pst.conf (or -conf=<path>) into @p raw below the
/// command-line values already parsed into it. A missing default file is
/// fine; a missing file named with -conf is an error.
[[nodiscard]] core::Result<void> load_config_file(core::Config& raw);

/// Converts raw key/value configuration into a validated NodeConfig.
///
/// Accepted keys:
///   -datadir=<path>        -conf=<file>           -norpc
///   -rpcbind=<addr>        -rpcport=<n>           -rpcuser=<user>
///   -rpcpassword=<pass>    -rpcthreads=<n>
///   -feelimitone=<n>       -feelimittwo=<n>       -feescaling=<n>
///   -feerateone=<n>        -feeratetwo=<n>        -feeratethree=<n>
///   -cancelcooldown=<s>    -availability=<s>      -minpasswordlength=<n>
///   -passworditerations=<n> -treasury=<hex>       -snapshot=<0|1>
///   -loglevel=<level>      -debug=<cat,...>       -logfile=<file>
///   -printtoconsole=<0|1>
///
/// Fails with VALIDATION_ERROR naming the offending key; an invalid fee
/// schedule fails with ESCROW_BAD_FEE_CONFIG.
[[nodiscard]] core::Result<NodeConfig> build_node_config(const core::Config& raw);

/// Print a usage/help message to stdout.
void print_usage();

/// Print version information to stdout.
void print_version();

} // namespace node

#endif // PST_NODE_CONTEXT_H
