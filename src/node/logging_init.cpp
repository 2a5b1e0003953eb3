// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "node/logging_init.h"
#include "node/context.h"

#include "core/fs.h"
#include "core/logging.h"
#include "core/time.h"

#include <filesystem>
#include <sstream>
#include <string>
#include <system_error>

namespace node {

// ---------------------------------------------------------------------------
// init_logging
// ---------------------------------------------------------------------------

core::Result<void> init_logging(const NodeConfig& config) {
    auto& logger = core::Logger::instance();

    logger.set_level(config.log_level);
    logger.set_categories(config.log_categories);
    logger.set_print_to_console(config.print_to_console);

    if (!config.log_file.empty()) {
        std::filesystem::path log_path = config.log_file_path();

        if (log_path.has_parent_path() &&
            !core::fs::ensure_directory(log_path.parent_path())) {
            return core::make_error(core::ErrorCode::STORAGE_ERROR,
                                    "cannot create log directory " +
                                    log_path.parent_path().string());
        }

        rotate_log_file(log_path, MAX_LOG_FILE_SIZE);

        logger.set_log_file(log_path);
        logger.set_print_to_file(true);
    } else {
        logger.set_print_to_file(false);
    }

    LOG_INFO(core::LogCategory::NODE, get_startup_banner(config));
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// rotate_log_file
// ---------------------------------------------------------------------------

bool rotate_log_file(const std::filesystem::path& log_path,
                     uint64_t max_size) {
    auto size_opt = core::fs::file_size(log_path);
    if (!size_opt.has_value() || *size_opt < max_size) {
        return false;
    }

    std::filesystem::path rotated_path =
        log_path.parent_path() / (log_path.filename().string() + ".1");

    std::error_code ec;
    if (std::filesystem::exists(rotated_path, ec)) {
        std::filesystem::remove(rotated_path, ec);
        if (ec) {
            // Non-fatal: rename replaces the target anyway.
            LOG_WARN(core::LogCategory::NODE,
                     "Failed to remove old rotated log: " +
                     rotated_path.string());
        }
    }

    if (!core::fs::rename_safe(log_path, rotated_path)) {
        LOG_WARN(core::LogCategory::NODE,
                 "Failed to rotate log file: " + log_path.string());
        return false;
    }

    LOG_INFO(core::LogCategory::NODE,
             "Rotated log file: " + log_path.string() +
             " -> " + rotated_path.string() +
             " (was " + std::to_string(*size_opt / (1024 * 1024)) + " MB)");
    return true;
}

// ---------------------------------------------------------------------------
// get_startup_banner
// ---------------------------------------------------------------------------

std::string get_startup_banner(const NodeConfig& config) {
    std::ostringstream ss;

    ss << "\n"
       << "============================================================\n"
       << "  " << get_client_name() << "\n"
       << "  Build: " << __DATE__ << " " << __TIME__ << "\n"
       << "  Data directory: " << config.datadir.string() << "\n"
       << "  RPC: " << (config.rpc_enabled ? "enabled" : "disabled");
    if (config.rpc_enabled) {
        ss << " (port " << config.rpc_port
           << ", bind " << config.rpc_bind
           << ", " << config.rpc_threads << " threads)";
    }
    ss << "\n";

    ss << "  Fee tiers: " << config.fee_tiers.limit_one
       << " / " << config.fee_tiers.limit_two
       << ", rates " << config.fee_rates.rate_one
       << " / " << config.fee_rates.rate_two
       << " / " << config.fee_rates.rate_three
       << " over " << config.fee_scaling << "\n"
       << "  Cancel cooldown: " << config.cancel_cooldown << " s"
       << ", availability: " << config.availability << " s\n"
       << "  Snapshot: " << (config.snapshot ? "enabled" : "disabled") << "\n"
       << "  Log level: " << core::log_level_string(config.log_level) << "\n"
       << "  Started: " << core::format_iso8601(core::get_time()) << "\n"
       << "============================================================\n";

    return ss.str();
}

} // namespace node
