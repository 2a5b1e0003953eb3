// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/server.h"
#include "rpc/util.h"
#include "core/logging.h"
#include "core/time.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstring>

namespace rpc {

namespace {

constexpr size_t MAX_HEADER_BYTES = 64 * 1024;

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
        s.remove_suffix(1);
    }
    return s;
}

/// Content-Length from a header block, 0 when absent, nullopt when garbled.
std::optional<size_t> content_length(std::string_view headers) {
    size_t pos = 0;
    while (pos < headers.size()) {
        size_t eol = headers.find("\r\n", pos);
        std::string_view line = headers.substr(
            pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
        pos = eol == std::string_view::npos ? headers.size() : eol + 2;

        size_t colon = line.find(':');
        if (colon == std::string_view::npos) continue;
        if (lower(trim(line.substr(0, colon))) != "content-length") continue;

        std::string_view value = trim(line.substr(colon + 1));
        size_t len = 0;
        auto [p, ec] = std::from_chars(value.data(), value.data() + value.size(), len);
        if (ec != std::errc{} || p != value.data() + value.size()) return std::nullopt;
        return len;
    }
    return 0;
}

} // namespace

// ===========================================================================
// HTTP parsing
// ===========================================================================

std::optional<HttpRequest> parse_http_request(std::string_view raw) {
    size_t header_end = raw.find("\r\n\r\n");
    if (header_end == std::string_view::npos) return std::nullopt;

    size_t line_end = raw.find("\r\n");
    std::string_view request_line = raw.substr(0, line_end);
    size_t sp1 = request_line.find(' ');
    if (sp1 == std::string_view::npos || sp1 == 0) return std::nullopt;
    size_t sp2 = request_line.find(' ', sp1 + 1);
    if (sp2 == std::string_view::npos) return std::nullopt;

    HttpRequest req;
    req.method = std::string(request_line.substr(0, sp1));
    req.path   = std::string(request_line.substr(sp1 + 1, sp2 - sp1 - 1));

    std::string_view headers = raw.substr(line_end + 2,
                                          header_end > line_end ? header_end - line_end - 2 : 0);
    auto len = content_length(headers);
    if (!len) return std::nullopt;

    size_t pos = 0;
    while (pos < headers.size()) {
        size_t eol = headers.find("\r\n", pos);
        std::string_view line = headers.substr(
            pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
        pos = eol == std::string_view::npos ? headers.size() : eol + 2;

        size_t colon = line.find(':');
        if (colon == std::string_view::npos) continue;
        std::string name = lower(trim(line.substr(0, colon)));
        std::string_view value = trim(line.substr(colon + 1));
        if (name == "authorization") {
            req.auth_header = std::string(value);
        } else if (name == "content-type") {
            req.content_type = std::string(value);
        }
    }

    std::string_view body = raw.substr(header_end + 4);
    if (body.size() < *len) return std::nullopt;
    req.body = std::string(body.substr(0, *len));
    return req;
}

// ===========================================================================
// Lifecycle
// ===========================================================================

RpcServer::RpcServer(Config config)
    : config_(std::move(config))
    , jobs_(config_.queue_depth)
{
}

RpcServer::~RpcServer() {
    stop();
}

core::Result<void> RpcServer::start() {
    if (running_.load()) {
        return core::make_error(core::ErrorCode::RPC_ERROR, "RPC server already running");
    }

    int fd = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (fd < 0) {
        return core::make_error(core::ErrorCode::NETWORK_ERROR,
                                std::string("socket: ") + std::strerror(errno));
    }

    int opt = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port   = htons(config_.port);
    if (config_.bind_address.empty() || config_.bind_address == "0.0.0.0") {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (::inet_pton(AF_INET, config_.bind_address.c_str(), &addr.sin_addr) != 1) {
        ::close(fd);
        return core::make_error(core::ErrorCode::NETWORK_ERROR,
                                "Invalid bind address: " + config_.bind_address);
    }

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        int err = errno;
        ::close(fd);
        return core::make_error(core::ErrorCode::NETWORK_REFUSED,
                                "Failed to bind RPC on " + config_.bind_address + ":" +
                                std::to_string(config_.port) + ": " + std::strerror(err));
    }
    if (::listen(fd, SOMAXCONN) != 0) {
        int err = errno;
        ::close(fd);
        return core::make_error(core::ErrorCode::NETWORK_ERROR,
                                std::string("listen: ") + std::strerror(err));
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_.store(ntohs(bound.sin_port));
    } else {
        bound_port_.store(config_.port);
    }

    listen_fd_ = fd;
    running_.store(true);

    if (config_.rpc_user.empty() && config_.rpc_password.empty()) {
        LOG_WARN(core::LogCategory::RPC,
                 "RPC authentication disabled (no rpcuser/rpcpassword)");
    }
    LOG_INFO(core::LogCategory::RPC,
             "RPC server listening on " + config_.bind_address + ":" +
             std::to_string(bound_port_.load()) + " with " +
             std::to_string(config_.num_threads) + " workers");

    int threads = std::max(1, config_.num_threads);
    for (int i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
    acceptor_ = std::thread([this] { accept_loop(); });

    return core::make_ok();
}

void RpcServer::stop() {
    if (!running_.exchange(false)) return;

    LOG_INFO(core::LogCategory::RPC, "RPC server shutting down");

    // shutdown() wakes a thread blocked in accept(); close() alone does not.
    if (listen_fd_ >= 0) {
        ::shutdown(listen_fd_, SHUT_RDWR);
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    if (acceptor_.joinable()) acceptor_.join();

    jobs_.close();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
}

bool RpcServer::is_running() const {
    return running_.load(std::memory_order_relaxed);
}

// ===========================================================================
// Command registry
// ===========================================================================

void RpcServer::register_command(RpcCommand cmd) {
    std::lock_guard lock(commands_mutex_);
    std::string name = cmd.name;
    commands_[name] = std::move(cmd);
}

void RpcServer::register_commands(std::vector<RpcCommand> cmds) {
    for (auto& cmd : cmds) register_command(std::move(cmd));
}

std::vector<std::string> RpcServer::command_names() const {
    std::lock_guard lock(commands_mutex_);
    std::vector<std::string> names;
    names.reserve(commands_.size());
    for (const auto& [name, _] : commands_) names.push_back(name);
    return names;
}

std::string RpcServer::help_text(const std::string& name) const {
    std::lock_guard lock(commands_mutex_);
    auto it = commands_.find(name);
    return it == commands_.end() ? std::string{} : it->second.help;
}

std::string RpcServer::help_overview() const {
    std::map<std::string, std::vector<std::string>> by_category;
    {
        std::lock_guard lock(commands_mutex_);
        for (const auto& [name, cmd] : commands_) {
            std::string usage = cmd.help.substr(0, cmd.help.find('\n'));
            by_category[cmd.category].push_back(usage.empty() ? name : usage);
        }
    }

    std::string out;
    for (const auto& [category, lines] : by_category) {
        if (!out.empty()) out += '\n';
        out += "== " + (category.empty() ? std::string("misc") : category) + " ==\n";
        for (const auto& line : lines) out += line + '\n';
    }
    return out;
}

// ===========================================================================
// Dispatch
// ===========================================================================

RpcResponse RpcServer::execute(const RpcRequest& req) const {
    RpcHandler handler;
    {
        std::lock_guard lock(commands_mutex_);
        auto it = commands_.find(req.method);
        if (it == commands_.end()) {
            return make_error(RpcError::METHOD_NOT_FOUND,
                              "Method not found: " + req.method, req.id);
        }
        handler = it->second.handler;
    }

    LOG_DEBUG(core::LogCategory::RPC, "RPC call: " + req.method);

    try {
        RpcResponse resp = handler(req);
        resp.id = req.id;
        return resp;
    } catch (const RpcException& e) {
        return make_error(e.code(), e.what(), req.id);
    } catch (const std::exception& e) {
        LOG_ERROR(core::LogCategory::RPC,
                  "RPC " + req.method + " failed: " + e.what());
        return make_error(RpcError::INTERNAL_ERROR,
                          std::string("Internal error: ") + e.what(), req.id);
    }
}

std::string RpcServer::handle_body(std::string_view body) const {
    JsonValue doc;
    try {
        doc = parse_json(body);
    } catch (const std::exception& e) {
        return make_error(RpcError::PARSE_ERROR, e.what()).serialize();
    }

    auto run_one = [this](const JsonValue& item) {
        try {
            return execute(RpcRequest::from_json(item));
        } catch (const std::exception& e) {
            return make_error(RpcError::INVALID_REQUEST, e.what());
        }
    };

    if (!doc.is_array()) return run_one(doc).serialize();

    if (doc.get_array().empty()) {
        return make_error(RpcError::INVALID_REQUEST, "Empty batch request").serialize();
    }
    JsonValue replies = JsonValue::array();
    for (const auto& item : doc.get_array()) {
        replies.push_back(run_one(item).to_json());
    }
    return json_serialize(replies);
}

bool RpcServer::check_auth(std::string_view auth_header) const {
    if (config_.rpc_user.empty() && config_.rpc_password.empty()) return true;
    return verify_auth(auth_header, config_.rpc_user, config_.rpc_password);
}

// ===========================================================================
// Socket I/O
// ===========================================================================

void RpcServer::accept_loop() {
    while (running_.load()) {
        sockaddr_in peer{};
        socklen_t peer_len = sizeof(peer);
        int client = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&peer), &peer_len);
        if (client < 0) {
            if (!running_.load()) break;
            if (errno == EINTR) continue;
            LOG_WARN(core::LogCategory::RPC,
                     std::string("accept failed: ") + std::strerror(errno));
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }

        timeval tv{};
        tv.tv_sec = 5;
        ::setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        auto req = read_request(client);
        if (!req) {
            send_response(client, 400, "Bad Request", R"({"error":"Malformed request"})");
            ::close(client);
            continue;
        }
        if (!check_auth(req->auth_header)) {
            // Slows down password guessing.
            std::this_thread::sleep_for(std::chrono::milliseconds(250));
            send_response(client, 401, "Unauthorized", R"({"error":"Unauthorized"})");
            ::close(client);
            continue;
        }
        if (req->method != "POST") {
            send_response(client, 405, "Method Not Allowed",
                          R"({"error":"Only POST is accepted"})");
            ::close(client);
            continue;
        }

        Job job{client, std::move(req->body), core::get_time_millis()};
        if (!jobs_.try_push(std::move(job))) {
            send_response(client, 503, "Service Unavailable",
                          R"({"error":"Server busy"})");
            ::close(client);
        }
    }
}

void RpcServer::worker_loop() {
    while (!jobs_.finished()) {
        auto job = jobs_.pop_for(std::chrono::milliseconds(500));
        if (!job) continue;

        std::string reply = handle_body(job->body);
        send_response(job->client_fd, 200, "OK", reply);
        ::close(job->client_fd);

        LOG_TRACE(core::LogCategory::RPC,
                  "RPC request served in " +
                  std::to_string(core::get_time_millis() - job->received_at) + " ms");
    }
}

std::optional<HttpRequest> RpcServer::read_request(int fd) const {
    std::string buffer;
    char chunk[4096];
    size_t header_end = std::string::npos;
    size_t needed = 0;

    for (;;) {
        ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n <= 0) return std::nullopt;
        buffer.append(chunk, static_cast<size_t>(n));

        if (header_end == std::string::npos) {
            header_end = buffer.find("\r\n\r\n");
            if (header_end == std::string::npos) {
                if (buffer.size() > MAX_HEADER_BYTES) return std::nullopt;
                continue;
            }
            auto len = content_length(std::string_view(buffer).substr(0, header_end));
            if (!len || *len > config_.max_request_size) return std::nullopt;
            needed = header_end + 4 + *len;
        }
        if (buffer.size() >= needed) break;
    }
    return parse_http_request(buffer);
}

void RpcServer::send_response(int fd, int status, std::string_view reason,
                              std::string_view body) {
    std::string out;
    out.reserve(body.size() + 160);
    out += "HTTP/1.1 " + std::to_string(status) + " ";
    out += reason;
    out += "\r\nContent-Type: application/json\r\nContent-Length: ";
    out += std::to_string(body.size());
    out += "\r\nConnection: close\r\nServer: pstd\r\n\r\n";
    out += body;

    size_t sent = 0;
    while (sent < out.size()) {
        ssize_t n = ::send(fd, out.data() + sent, out.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            if (n < 0 && errno == EINTR) continue;
            LOG_DEBUG(core::LogCategory::RPC, "client went away before reply was sent");
            return;
        }
        sent += static_cast<size_t>(n);
    }
}

} // namespace rpc
