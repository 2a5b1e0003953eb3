// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.
//
// pstd -- password-secured transfer ledger daemon.

#include "node/context.h"
#include "node/node.h"

#include "core/config.h"
#include "core/logging.h"

#include <cstdlib>
#include <iostream>

int main(int argc, char* argv[]) {
    core::Config raw;
    raw.parse_args(argc, argv);

    if (raw.has("help") || raw.has("h") || raw.has("?")) {
        node::print_usage();
        return EXIT_SUCCESS;
    }
    if (raw.has("version")) {
        node::print_version();
        return EXIT_SUCCESS;
    }

    auto loaded = node::load_config_file(raw);
    if (!loaded.ok()) {
        LOG_FATAL(core::LogCategory::CONFIG, loaded.error().message());
        return EXIT_FAILURE;
    }

    auto config = node::build_node_config(raw);
    if (!config.ok()) {
        LOG_FATAL(core::LogCategory::CONFIG,
                  "Invalid configuration: " + config.error().message());
        return EXIT_FAILURE;
    }

    node::Node pst_node(std::move(config).value());

    auto init_result = pst_node.init();
    if (!init_result.ok()) {
        std::cerr << "Error: " << init_result.error().message() << std::endl;
        return EXIT_FAILURE;
    }

    // Run until SIGINT / SIGTERM or the stop RPC.
    pst_node.run();

    pst_node.shutdown();

    return EXIT_SUCCESS;
}
