#pragma once
// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PST_RPC_SERVER_H
#define PST_RPC_SERVER_H

#include "core/error.h"
#include "core/work_queue.h"
#include "rpc/request.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace rpc {

using RpcHandler = std::function<RpcResponse(const RpcRequest&)>;

struct RpcCommand {
    std::string name;
    RpcHandler  handler;
    std::string help;       // first line is the usage summary
    std::string category;
};

// ---------------------------------------------------------------------------
// HttpRequest -- the parts of an HTTP/1.1 request the server looks at
// ---------------------------------------------------------------------------
struct HttpRequest {
    std::string method;
    std::string path;
    std::string auth_header;
    std::string content_type;
    std::string body;
};

/// Parses a complete request (headers plus Content-Length bytes of body).
/// nullopt when the request line is malformed or the body is short.
std::optional<HttpRequest> parse_http_request(std::string_view raw);

// ---------------------------------------------------------------------------
// RpcServer -- JSON-RPC over HTTP
// ---------------------------------------------------------------------------
// One accept thread reads each HTTP request, checks Basic auth and hands
// the body to a fixed pool of workers through a bounded WorkQueue. A full
// queue is answered with 503. Handlers report failures either by returning
// an error RpcResponse or by throwing RpcException.
// ---------------------------------------------------------------------------
class RpcServer {
public:
    struct Config {
        std::string bind_address     = "127.0.0.1";
        uint16_t    port             = 9645;    // 0 picks an ephemeral port
        std::string rpc_user;
        std::string rpc_password;               // auth disabled when both empty
        int         num_threads      = 4;
        size_t      queue_depth      = 256;
        size_t      max_request_size = 1024 * 1024;
    };

    explicit RpcServer(Config config);
    ~RpcServer();

    RpcServer(const RpcServer&)            = delete;
    RpcServer& operator=(const RpcServer&) = delete;

    /// Bind, listen and start the accept and worker threads.
    core::Result<void> start();

    /// Idempotent. Joins every thread.
    void stop();

    [[nodiscard]] bool is_running() const;

    /// The bound port; differs from Config::port when that was 0.
    [[nodiscard]] uint16_t port() const { return bound_port_.load(); }

    void register_command(RpcCommand cmd);
    void register_commands(std::vector<RpcCommand> cmds);

    /// Sorted command names.
    [[nodiscard]] std::vector<std::string> command_names() const;

    /// Full help text, empty for unknown commands.
    [[nodiscard]] std::string help_text(const std::string& name) const;

    /// One usage line per command, grouped by category.
    [[nodiscard]] std::string help_overview() const;

    /// Routes one request to its handler. Never throws.
    RpcResponse execute(const RpcRequest& req) const;

    /// Parses a JSON-RPC body (single request or batch) and returns the
    /// serialized reply.
    std::string handle_body(std::string_view body) const;

private:
    struct Job {
        int         client_fd;
        std::string body;
        int64_t     received_at;
    };

    Config config_;

    std::map<std::string, RpcCommand> commands_;
    mutable std::mutex commands_mutex_;

    int listen_fd_ = -1;
    std::atomic<uint16_t> bound_port_{0};
    std::atomic<bool> running_{false};

    core::WorkQueue<Job>     jobs_;
    std::vector<std::thread> workers_;
    std::thread              acceptor_;

    void accept_loop();
    void worker_loop();

    [[nodiscard]] bool check_auth(std::string_view auth_header) const;

    /// Reads headers and body from a connected socket. nullopt on a
    /// closed connection, timeout or oversized request.
    std::optional<HttpRequest> read_request(int fd) const;

    static void send_response(int fd, int status, std::string_view reason,
                              std::string_view body);
};

} // namespace rpc

#endif // PST_RPC_SERVER_H
