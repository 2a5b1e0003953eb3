#pragma once
// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Logging system initialization for the PST daemon.
//
// Configures the global Logger singleton from NodeConfig:
//   - Sets the log level threshold and the category mask.
//   - Opens the log file in the data directory with size-based rotation.
//   - Turns console (stderr) output on or off.
//   - Prints a startup banner with version and configuration.
// ---------------------------------------------------------------------------

#ifndef PST_NODE_LOGGING_INIT_H
#define PST_NODE_LOGGING_INIT_H

#include "core/error.h"

#include <cstdint>
#include <filesystem>
#include <string>

namespace node {

struct NodeConfig;

/// Initialize the logging subsystem based on the node configuration.
///
/// @returns core::make_ok() on success, or STORAGE_ERROR if the log
///          directory cannot be created.
[[nodiscard]] core::Result<void> init_logging(const NodeConfig& config);

/// Maximum log file size before rotation, in bytes.
inline constexpr uint64_t MAX_LOG_FILE_SIZE = 50 * 1024 * 1024;  // 50 MB

/// Rotate the log file at the given path if it exceeds max_size bytes:
/// debug.log.1 is replaced by debug.log, and the logger starts a new file.
///
/// @returns true if rotation was performed, false if not needed or on error.
bool rotate_log_file(const std::filesystem::path& log_path,
                     uint64_t max_size = MAX_LOG_FILE_SIZE);

/// Version, build, data directory and ledger parameters.
[[nodiscard]] std::string get_startup_banner(const NodeConfig& config);

} // namespace node

#endif // PST_NODE_LOGGING_INIT_H
