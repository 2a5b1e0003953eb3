// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "node/context.h"

#include "core/fs.h"
#include "core/logging.h"
#include "core/types.h"

#include <cctype>
#include <exception>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>

namespace node {

// ---------------------------------------------------------------------------
// Version helpers
// ---------------------------------------------------------------------------

std::string get_version_string() {
    std::ostringstream ss;
    ss << VERSION_MAJOR << '.' << VERSION_MINOR << '.' << VERSION_PATCH;
    if (VERSION_SUFFIX[0] != '\0') {
        ss << '-' << VERSION_SUFFIX;
    }
    return ss.str();
}

std::string get_client_name() {
    return "PST Escrow v" + get_version_string();
}

// ---------------------------------------------------------------------------
// NodeConfig -- derived helpers
// ---------------------------------------------------------------------------

std::filesystem::path NodeConfig::log_file_path() const {
    std::filesystem::path p{log_file};
    return p.is_absolute() ? p : datadir / p;
}

std::filesystem::path NodeConfig::snapshot_path() const {
    return datadir / DEFAULT_SNAPSHOT_FILE;
}

// ---------------------------------------------------------------------------
// Internal: typed lookups
// ---------------------------------------------------------------------------

namespace {

core::Error bad_value(std::string_view key, const std::string& why) {
    return core::make_error(core::ErrorCode::VALIDATION_ERROR,
                            "-" + std::string(key) + ": " + why);
}

/// Unsigned value no larger than @p max; @p out is left alone when the
/// key is absent.
template <typename T>
core::Result<void> read_uint(const core::Config& cfg, std::string_view key,
                             uint64_t max, T& out) {
    if (!cfg.has(key)) return core::make_ok();
    auto v = cfg.get_uint(key);
    if (!v) {
        return bad_value(key, "expected a non-negative integer, got '" +
                              cfg.get_or(key, "") + "'");
    }
    if (*v > max) {
        return bad_value(key, "value " + std::to_string(*v) + " out of range");
    }
    out = static_cast<T>(*v);
    return core::make_ok();
}

std::string_view trim_ws(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
        sv.remove_suffix(1);
    }
    return sv;
}

/// -debug=ledger,rpc -debug=fees: union of every named category. "0" or
/// "none" anywhere clears the mask.
core::Result<core::LogCategory> read_categories(const core::Config& cfg) {
    auto values = cfg.get_list(core::CONF_DEBUG);
    if (values.empty()) return core::LogCategory::ALL;

    core::LogCategory mask = core::LogCategory::NONE;
    for (const auto& value : values) {
        std::string_view rest = value;
        while (!rest.empty()) {
            size_t comma = rest.find(',');
            std::string_view token = trim_ws(rest.substr(0, comma));
            rest = comma == std::string_view::npos ? std::string_view{}
                                                   : rest.substr(comma + 1);
            if (token.empty()) continue;
            if (token == "0" || token == "none") return core::LogCategory::NONE;

            core::LogCategory cat = core::LogCategory::NONE;
            if (!core::parse_log_category(token, cat)) {
                return bad_value(core::CONF_DEBUG,
                                 "unknown category '" + std::string(token) + "'");
            }
            mask |= cat;
        }
    }
    return mask;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// load_config_file
// ---------------------------------------------------------------------------

core::Result<void> load_config_file(core::Config& raw) {
    std::filesystem::path datadir = raw.data_dir();

    bool explicit_conf = raw.has(core::CONF_CONF);
    std::filesystem::path conf_path{raw.get_or(core::CONF_CONF, DEFAULT_CONF_FILE)};
    if (conf_path.is_relative()) conf_path = datadir / conf_path;

    if (!core::fs::file_exists(conf_path)) {
        if (explicit_conf) {
            return core::make_error(core::ErrorCode::STORAGE_NOT_FOUND,
                                    "config file not found: " + conf_path.string());
        }
        return core::make_ok();
    }
    if (!raw.parse_file(conf_path)) {
        return core::make_error(core::ErrorCode::STORAGE_ERROR,
                                "cannot read config file " + conf_path.string());
    }

    LOG_INFO(core::LogCategory::CONFIG,
             "Loaded configuration from " + conf_path.string());
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// build_node_config
// ---------------------------------------------------------------------------

core::Result<NodeConfig> build_node_config(const core::Config& raw) {
    NodeConfig nc;
    nc.datadir = core::fs::absolute(raw.data_dir());

    // RPC
    nc.rpc_enabled  = !raw.get_bool(core::CONF_NORPC, false);
    nc.rpc_bind     = raw.get_or(core::CONF_RPCBIND, nc.rpc_bind);
    nc.rpc_user     = raw.get_or(core::CONF_RPCUSER, "");
    nc.rpc_password = raw.get_or(core::CONF_RPCPASSWORD, "");
    PST_TRY_VOID(read_uint(raw, core::CONF_RPCPORT, 65535, nc.rpc_port));
    PST_TRY_VOID(read_uint(raw, core::CONF_RPCTHREADS, 64, nc.rpc_threads));
    if (nc.rpc_threads == 0) {
        return bad_value(core::CONF_RPCTHREADS, "at least one thread is required");
    }
    if (nc.rpc_user.empty() != nc.rpc_password.empty()) {
        return bad_value(core::CONF_RPCPASSWORD,
                         "rpcuser and rpcpassword must be set together");
    }

    // Fees
    constexpr uint64_t max_amount = static_cast<uint64_t>(escrow::MAX_AMOUNT);
    constexpr uint64_t max_u64    = std::numeric_limits<uint64_t>::max();
    PST_TRY_VOID(read_uint(raw, core::CONF_FEE_LIMIT_ONE, max_amount, nc.fee_tiers.limit_one));
    PST_TRY_VOID(read_uint(raw, core::CONF_FEE_LIMIT_TWO, max_amount, nc.fee_tiers.limit_two));
    PST_TRY_VOID(read_uint(raw, core::CONF_FEE_RATE_ONE, max_u64, nc.fee_rates.rate_one));
    PST_TRY_VOID(read_uint(raw, core::CONF_FEE_RATE_TWO, max_u64, nc.fee_rates.rate_two));
    PST_TRY_VOID(read_uint(raw, core::CONF_FEE_RATE_THREE, max_u64, nc.fee_rates.rate_three));
    PST_TRY_VOID(read_uint(raw, core::CONF_FEE_SCALING, max_u64, nc.fee_scaling));

    // Rejects scaling 0 and crossed tier limits before anything starts.
    auto schedule = escrow::FeeSchedule::create(nc.fee_tiers, nc.fee_rates, nc.fee_scaling);
    if (!schedule.ok()) return schedule.error();

    // Windows
    PST_TRY_VOID(read_uint(raw, core::CONF_CANCEL_COOLDOWN, max_amount, nc.cancel_cooldown));
    PST_TRY_VOID(read_uint(raw, core::CONF_AVAILABILITY, max_amount, nc.availability));
    if (nc.availability == 0) {
        return bad_value(core::CONF_AVAILABILITY, "must be positive");
    }
    PST_TRY_VOID(read_uint(raw, core::CONF_MIN_PASSWORD_LEN, 4096, nc.min_password_length));
    PST_TRY_VOID(read_uint(raw, core::CONF_PASSWORD_ITERS, 100000000, nc.password_iterations));
    if (nc.password_iterations == 0) {
        return bad_value(core::CONF_PASSWORD_ITERS, "must be positive");
    }

    if (auto t = raw.get(core::CONF_TREASURY); t && !t->empty()) {
        try {
            nc.treasury = core::uint160::from_hex(*t);
        } catch (const std::exception& e) {
            return bad_value(core::CONF_TREASURY, e.what());
        }
    }
    nc.snapshot = raw.get_bool(core::CONF_SNAPSHOT, true);

    // Logging
    if (auto lvl = raw.get(core::CONF_LOGLEVEL)) {
        if (!core::parse_log_level(*lvl, nc.log_level)) {
            return bad_value(core::CONF_LOGLEVEL, "unknown level '" + *lvl + "'");
        }
    }
    PST_TRY_ASSIGN(categories, read_categories(raw));
    nc.log_categories   = categories;
    nc.log_file         = raw.get_or(core::CONF_LOGFILE, DEFAULT_LOG_FILE);
    nc.print_to_console = raw.get_bool(core::CONF_PRINTTOCONSOLE, true);

    return nc;
}

// ---------------------------------------------------------------------------
// print_usage
// ---------------------------------------------------------------------------

void print_usage() {
    std::cout
        << get_client_name() << "\n"
        << "\n"
        << "Usage:\n"
        << "  pstd [options]\n"
        << "\n"
        << "Options:\n"
        << "  -h, -help, -?             Show this help message and exit\n"
        << "  -version                  Show version information and exit\n"
        << "  -datadir=<dir>            Data directory (default: ~/.pst)\n"
        << "  -conf=<file>              Config file (default: pst.conf in datadir)\n"
        << "\n"
        << "RPC server:\n"
        << "  -rpcbind=<addr>           RPC bind address (default: 127.0.0.1)\n"
        << "  -rpcport=<port>           JSON-RPC port (default: 9645)\n"
        << "  -rpcuser=<user>           RPC authentication username\n"
        << "  -rpcpassword=<pass>       RPC authentication password\n"
        << "  -rpcthreads=<n>           RPC worker threads (default: 4)\n"
        << "  -norpc                    Disable the JSON-RPC server\n"
        << "\n"
        << "Ledger:\n"
        << "  -feelimitone=<n>          Upper bound of the first fee tier (default: 100)\n"
        << "  -feelimittwo=<n>          Upper bound of the second fee tier (default: 1000)\n"
        << "  -feerateone=<n>           First tier rate (default: 100)\n"
        << "  -feeratetwo=<n>           Second tier rate (default: 50)\n"
        << "  -feeratethree=<n>         Third tier rate (default: 25)\n"
        << "  -feescaling=<n>           Rate denominator (default: 10000)\n"
        << "  -cancelcooldown=<s>       Sender-only cancel window (default: 1800)\n"
        << "  -availability=<s>         Default transfer lifetime (default: 604800)\n"
        << "  -minpasswordlength=<n>    Minimum claim password length (default: 7)\n"
        << "  -passworditerations=<n>   PBKDF2 rounds per password commitment (default: 100000)\n"
        << "  -treasury=<hex>           Fee recipient account (default: zero account)\n"
        << "  -snapshot=<0|1>           Persist the ledger to ledger.dat (default: 1)\n"
        << "\n"
        << "Logging:\n"
        << "  -loglevel=<level>         trace, debug, info, warn, error, fatal, off\n"
        << "  -debug=<cat,...>          ledger, fees, asset, rpc, config, storage,\n"
        << "                            crypto, node, all, none\n"
        << "  -logfile=<file>           Log filename (default: debug.log)\n"
        << "  -printtoconsole=<0|1>     Log to stderr (default: 1)\n"
        << "\n";
}

// ---------------------------------------------------------------------------
// print_version
// ---------------------------------------------------------------------------

void print_version() {
    std::cout
        << get_client_name() << "\n"
        << "Copyright (c) 2024-2026 The PST Developers\n"
        << "Distributed under the MIT software license.\n"
        << "\n"
        << "Snapshot format version: 1\n"
        << "Compiler: "
#if defined(__clang__)
        << "Clang " << __clang_major__ << "." << __clang_minor__
#elif defined(__GNUC__)
        << "GCC " << __GNUC__ << "." << __GNUC_MINOR__
#else
        << "Unknown"
#endif
        << "\n"
        << "C++ standard: " << __cplusplus << "\n";
}

} // namespace node
