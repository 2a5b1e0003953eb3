// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/control.h"
#include "rpc/util.h"

#include "core/logging.h"
#include "core/time.h"

#include <cctype>
#include <cstdint>
#include <string>

namespace rpc {

namespace {

constexpr core::LogCategory NAMED_CATEGORIES[] = {
    core::LogCategory::LEDGER,  core::LogCategory::FEES,
    core::LogCategory::ASSET,   core::LogCategory::RPC,
    core::LogCategory::CONFIG,  core::LogCategory::STORAGE,
    core::LogCategory::CRYPTO,  core::LogCategory::NODE,
};

/// Applies every category name in @p list with @p apply. Unknown names
/// are rejected.
template <typename F>
void apply_categories(const JsonValue& list, F apply) {
    if (!list.is_array()) {
        throw RpcException(RpcError::TYPE_ERROR, "expected an array of categories");
    }
    for (const auto& item : list.get_array()) {
        if (!item.is_string()) {
            throw RpcException(RpcError::TYPE_ERROR, "category must be a string");
        }
        core::LogCategory cat = core::LogCategory::NONE;
        if (!core::parse_log_category(item.get_string(), cat)) {
            throw RpcException(RpcError::INVALID_PARAMETER,
                               "unknown logging category: " + item.get_string());
        }
        apply(cat);
    }
}

} // anonymous namespace

// ===========================================================================
// stop
// ===========================================================================

RpcResponse rpc_stop(const RpcRequest& req, NodeContext& ctx) {
    LOG_INFO(core::LogCategory::RPC, "RPC stop requested");

    if (ctx.request_shutdown) {
        ctx.request_shutdown();
    }

    return make_result(JsonValue("PST server stopping"), req.id);
}

// ===========================================================================
// uptime
// ===========================================================================

RpcResponse rpc_uptime(const RpcRequest& req, const NodeContext& ctx) {
    int64_t uptime = core::get_time() - ctx.startup_time;
    if (uptime < 0) uptime = 0;

    return make_result(JsonValue(uptime), req.id);
}

// ===========================================================================
// help
// ===========================================================================

RpcResponse rpc_help(const RpcRequest& req, const RpcServer& server) {
    if (param_exists(req.params, 0)) {
        std::string command = param_string(req.params, 0);
        std::string text = server.help_text(command);
        if (text.empty()) {
            return make_error(RpcError::METHOD_NOT_FOUND,
                              "help: unknown command: " + command, req.id);
        }
        return make_result(JsonValue(text), req.id);
    }

    std::string listing = server.help_overview();
    if (listing.empty()) {
        listing = "No commands registered.\n";
    }
    return make_result(JsonValue(listing), req.id);
}

// ===========================================================================
// logging
// ===========================================================================

RpcResponse rpc_logging(const RpcRequest& req) {
    auto& logger = core::Logger::instance();

    if (param_exists(req.params, 0)) {
        apply_categories(param_value(req.params, 0),
                         [&](core::LogCategory c) { logger.enable_category(c); });
    }
    if (param_exists(req.params, 1)) {
        apply_categories(param_value(req.params, 1),
                         [&](core::LogCategory c) { logger.disable_category(c); });
    }

    JsonValue result = JsonValue::object();
    auto enabled = logger.enabled_categories();
    for (auto cat : NAMED_CATEGORIES) {
        std::string name(core::log_category_string(cat));
        for (auto& ch : name) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        result[name] = JsonValue((enabled & cat) != core::LogCategory::NONE);
    }
    return make_result(std::move(result), req.id);
}

// ===========================================================================
// Registration
// ===========================================================================

void register_control_rpcs(RpcServer& server, NodeContext& ctx) {
    server.register_commands({
        {"stop",
         [&](const RpcRequest& r) { return rpc_stop(r, ctx); },
         "stop\n"
         "Request a graceful shutdown of the PST server.",
         "control"},

        {"uptime",
         [&](const RpcRequest& r) { return rpc_uptime(r, ctx); },
         "uptime\n"
         "Returns the total uptime of the server in seconds.",
         "control"},

        {"help",
         [&](const RpcRequest& r) { return rpc_help(r, server); },
         "help ( \"command\" )\n"
         "List all commands, or get help for a specified command.\n"
         "\nArguments:\n"
         "1. command    (string, optional) The command to get help on.\n"
         "\nResult:\n"
         "\"text\"       (string) The help text.",
         "control"},

        {"logging",
         [](const RpcRequest& r) { return rpc_logging(r); },
         "logging ( [\"include_category\",...] [\"exclude_category\",...] )\n"
         "Gets and sets the logging configuration.\n"
         "When called without arguments, returns the list of categories\n"
         "with their current status (true/false).\n"
         "\nArguments:\n"
         "1. include    (array, optional) Categories to enable.\n"
         "2. exclude    (array, optional) Categories to disable.\n"
         "\nAvailable categories:\n"
         "  ledger, fees, asset, rpc, config, storage, crypto, node, all",
         "control"},
    });
}

} // namespace rpc
