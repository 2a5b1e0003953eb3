// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"

#include "core/logging.h"
#include "core/time.h"
#include "escrow/asset_mover.h"
#include "escrow/ledger.h"
#include "rpc/control.h"
#include "rpc/escrow_rpc.h"
#include "rpc/request.h"
#include "rpc/server.h"
#include "rpc/util.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstring>
#include <set>
#include <string>
#include <vector>

namespace {

constexpr int64_t START = 1700000000;

const std::string ALICE    = "0000000000000000000000000000000000000001";
const std::string BOB      = "0000000000000000000000000000000000000002";
const std::string CAROL    = "0000000000000000000000000000000000000003";
const std::string TREASURY = "00000000000000000000000000000000000000ff";
const std::string TOKEN    = "a000000000000000000000000000000000000001";

// A ledger and RPC server wired the way the daemon wires them, on a
// manual clock. The server is never started; requests go through
// execute() and handle_body().
struct EscrowFixture {
    core::ManualClock          clock{START};
    escrow::InMemoryAssetMover book;
    escrow::TransferLedger     ledger;
    rpc::EscrowContext         ctx;
    rpc::NodeContext           node;
    rpc::RpcServer             server{rpc::RpcServer::Config{}};
    int                        stop_calls = 0;

    EscrowFixture() : ledger(options(), book) {
        ctx.ledger = &ledger;
        ctx.book   = &book;
        node.startup_time     = core::get_time() - 10;
        node.request_shutdown = [this] { ++stop_calls; };
        rpc::register_control_rpcs(server, node);
        rpc::register_escrow_rpcs(server, ctx);
    }

    escrow::LedgerOptions options() {
        escrow::LedgerOptions o;
        o.treasury = core::uint160::from_hex(TREASURY);
        o.password_iterations = 1000;
        o.clock    = clock.source();
        return o;
    }

    rpc::RpcResponse call(const std::string& method,
                          rpc::JsonValue::Array params = {}) {
        rpc::RpcRequest req;
        req.method = method;
        req.params = rpc::JsonValue(std::move(params));
        req.id     = 1;
        return server.execute(req);
    }

    void fund(const std::string& account, int64_t amount) {
        auto resp = call("deposit", {account, "native", amount});
        CHECK(resp.ok());
    }

    int64_t create(int64_t amount, const std::string& to = BOB) {
        auto resp = call("createtransfer", {ALICE, to, "native", amount, "open sesame"});
        return resp.ok() ? resp.result["id"].get_int() : 0;
    }
};

int64_t error_code(const rpc::RpcResponse& resp) {
    return resp.error["code"].get_int();
}

std::string error_kind(const rpc::RpcResponse& resp) {
    return resp.error["data"]["kind"].get_string();
}

// Sends one HTTP request to 127.0.0.1:port and returns the raw reply.
std::string http_exchange(uint16_t port, const std::string& request) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return {};
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port   = htons(port);
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        ::close(fd);
        return {};
    }
    ::send(fd, request.data(), request.size(), 0);

    std::string reply;
    char buf[4096];
    ssize_t n;
    while ((n = ::recv(fd, buf, sizeof(buf), 0)) > 0) {
        reply.append(buf, static_cast<size_t>(n));
    }
    ::close(fd);
    return reply;
}

std::string http_post(const std::string& body, const std::string& auth) {
    std::string req = "POST / HTTP/1.1\r\nHost: 127.0.0.1\r\n"
                      "Content-Type: application/json\r\n";
    if (!auth.empty()) req += "Authorization: Basic " + rpc::base64_encode(auth) + "\r\n";
    req += "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
    return req;
}

} // namespace

// ===================================================================
// JsonValue tests
// ===================================================================

TEST_CASE(JsonValue, TypeConstruction) {
    rpc::JsonValue null_val;
    CHECK(null_val.is_null());

    rpc::JsonValue bool_val(true);
    CHECK(bool_val.is_bool());
    CHECK_EQ(bool_val.get_bool(), true);

    rpc::JsonValue int_val(42);
    CHECK(int_val.is_int());
    CHECK_EQ(int_val.get_int(), static_cast<int64_t>(42));

    rpc::JsonValue double_val(3.14);
    CHECK(double_val.is_double());
    CHECK_NEAR(double_val.get_double(), 3.14, 0.001);

    rpc::JsonValue str_val("hello");
    CHECK(str_val.is_string());
    CHECK_EQ(str_val.get_string(), std::string("hello"));
}

TEST_CASE(JsonValue, ArrayAndObject) {
    rpc::JsonValue::Array arr;
    arr.push_back(rpc::JsonValue(1));
    arr.push_back(rpc::JsonValue("two"));

    rpc::JsonValue arr_val(arr);
    CHECK(arr_val.is_array());
    CHECK_EQ(arr_val.size(), static_cast<size_t>(2));
    CHECK_EQ(arr_val[static_cast<size_t>(1)].get_string(), std::string("two"));

    rpc::JsonValue obj_val = rpc::JsonValue::object();
    obj_val["name"]  = rpc::JsonValue("test");
    obj_val["count"] = rpc::JsonValue(5);
    CHECK(obj_val.has_key("name"));
    CHECK(!obj_val.has_key("missing"));
    CHECK_EQ(obj_val["count"].get_int(), static_cast<int64_t>(5));

    // Missing keys read as null through a const reference.
    const rpc::JsonValue& view = obj_val;
    CHECK(view["missing"].is_null());
}

TEST_CASE(JsonValue, WrongTypeThrows) {
    rpc::JsonValue s("text");
    CHECK_THROWS(s.get_int());
    CHECK_THROWS(s.get_array());
}

// ===================================================================
// JSON parsing / serialization tests
// ===================================================================

TEST_CASE(JsonParsing, ParseSimpleValues) {
    CHECK_EQ(rpc::parse_json("42").get_int(), static_cast<int64_t>(42));
    CHECK_EQ(rpc::parse_json("-7").get_int(), static_cast<int64_t>(-7));
    CHECK_EQ(rpc::parse_json("\"hello world\"").get_string(), std::string("hello world"));
    CHECK_EQ(rpc::parse_json("true").get_bool(), true);
    CHECK(rpc::parse_json("null").is_null());
    CHECK_EQ(rpc::parse_json("\"a\\\"b\\n\"").get_string(), std::string("a\"b\n"));
}

TEST_CASE(JsonParsing, ParseObject) {
    auto val = rpc::parse_json(R"({"method":"gettransfer","params":[3],"id":1})");
    CHECK(val.is_object());
    CHECK_EQ(val["method"].get_string(), std::string("gettransfer"));
    CHECK(val["params"].is_array());
    CHECK_EQ(val["params"].size(), static_cast<size_t>(1));
    CHECK_EQ(val["id"].get_int(), static_cast<int64_t>(1));
}

TEST_CASE(JsonParsing, MalformedThrows) {
    CHECK_THROWS(rpc::parse_json("{\"a\":}"));
    CHECK_THROWS(rpc::parse_json("[1,2"));
    CHECK_THROWS(rpc::parse_json("42 43"));
}

TEST_CASE(JsonParsing, SerializeRoundTrip) {
    rpc::JsonValue original = rpc::JsonValue::object();
    original["key"] = rpc::JsonValue("va\"lue");
    original["num"] = rpc::JsonValue(int64_t{-123});
    original["list"] = rpc::JsonValue(rpc::JsonValue::Array{true, nullptr});

    auto parsed = rpc::parse_json(rpc::json_serialize(original));
    CHECK(parsed == original);

    std::string pretty = rpc::json_serialize_pretty(original, 4);
    CHECK(pretty.find("\n    \"key\"") != std::string::npos);
    CHECK(rpc::parse_json(pretty) == original);
}

// ===================================================================
// RpcRequest / RpcResponse tests
// ===================================================================

TEST_CASE(RpcRequest, FromJsonWithParams) {
    auto req = rpc::RpcRequest::from_json(
        rpc::parse_json(R"({"method":"claimtransfer","params":[1,"ab",true],"id":42})"));
    CHECK_EQ(req.method, std::string("claimtransfer"));
    CHECK_EQ(req.params.size(), static_cast<size_t>(3));
    CHECK_EQ(req.params[static_cast<size_t>(1)].get_string(), std::string("ab"));
    CHECK_EQ(req.id, static_cast<int64_t>(42));
}

TEST_CASE(RpcRequest, MissingMethodThrows) {
    CHECK_THROWS(rpc::RpcRequest::from_json(rpc::parse_json(R"({"params":[]})")));
}

TEST_CASE(RpcResponse, ResultAndErrorShapes) {
    auto ok = rpc::make_result(rpc::JsonValue(100), 1);
    CHECK(ok.ok());
    auto parsed = rpc::parse_json(ok.serialize());
    CHECK_EQ(parsed["result"].get_int(), static_cast<int64_t>(100));
    CHECK(parsed["error"].is_null());
    CHECK_EQ(parsed["id"].get_int(), static_cast<int64_t>(1));

    auto err = rpc::make_error(rpc::RpcError::METHOD_NOT_FOUND, "Method not found", 5);
    CHECK(!err.ok());
    CHECK_EQ(err.error["code"].get_int(), static_cast<int64_t>(-32601));
    CHECK_EQ(err.error["message"].get_string(), std::string("Method not found"));
}

// ===================================================================
// RPC utility tests
// ===================================================================

TEST_CASE(RpcUtil, ParamExtraction) {
    auto params = rpc::parse_json(R"([7, "9", "native", ")" + ALICE + R"(", null])");
    CHECK_EQ(rpc::param_count(params), static_cast<size_t>(5));
    CHECK_EQ(rpc::param_id(params, 0), 7u);
    CHECK_EQ(rpc::param_id(params, 1), 9u);
    CHECK(rpc::param_asset(params, 2).is_zero());
    CHECK_EQ(rpc::param_account(params, 3).to_hex(), ALICE);
    CHECK(!rpc::param_exists(params, 4));
    CHECK_EQ(rpc::param_int(params, 4, 11), static_cast<int64_t>(11));
    CHECK_EQ(rpc::param_string(params, 9, "dflt"), std::string("dflt"));
}

TEST_CASE(RpcUtil, ParamErrorsAreInvalidParams) {
    auto params = rpc::parse_json(R"([0, "xyz", 1.5, "abcd"])");
    bool threw = false;
    try {
        (void)rpc::param_id(params, 0);
    } catch (const rpc::RpcException& e) {
        threw = e.code() == rpc::RpcError::INVALID_PARAMS;
    }
    CHECK(threw);
    CHECK_THROWS(rpc::param_account(params, 1));
    CHECK_THROWS(rpc::param_amount(params, 2));
    CHECK_THROWS(rpc::param_asset(params, 3));
    CHECK_THROWS(rpc::param_string(params, 7));
}

TEST_CASE(RpcUtil, LedgerErrorMapping) {
    using core::ErrorCode;
    using rpc::RpcError;
    CHECK(rpc::rpc_code_for(ErrorCode::ESCROW_NOT_FOUND) == RpcError::TRANSFER_NOT_FOUND);
    CHECK(rpc::rpc_code_for(ErrorCode::ESCROW_NOT_RECEIVER) == RpcError::TRANSFER_NOT_RECEIVER);
    CHECK(rpc::rpc_code_for(ErrorCode::ESCROW_NOT_PENDING) == RpcError::TRANSFER_NOT_PENDING);
    CHECK(rpc::rpc_code_for(ErrorCode::ESCROW_CLAIM_NOT_OPEN) == RpcError::TRANSFER_CLAIM_NOT_OPEN);
    CHECK(rpc::rpc_code_for(ErrorCode::ESCROW_BAD_PASSWORD) == RpcError::TRANSFER_BAD_PASSWORD);
    CHECK(rpc::rpc_code_for(ErrorCode::ESCROW_SELF_TRANSFER) == RpcError::TRANSFER_SELF);
    CHECK(rpc::rpc_code_for(ErrorCode::ESCROW_INSUFFICIENT) == RpcError::INSUFFICIENT_FUNDS);
    CHECK(rpc::rpc_code_for(ErrorCode::STORAGE_CORRUPT) == RpcError::STORAGE_ERROR);
    CHECK(rpc::rpc_code_for(ErrorCode::INTERNAL_ERROR) == RpcError::MISC_ERROR);

    auto resp = rpc::error_response(
        core::make_error(ErrorCode::ESCROW_EXPIRED, "transfer #4 expired"), 3);
    CHECK_EQ(resp.id, static_cast<int64_t>(3));
    CHECK_EQ(error_code(resp), static_cast<int64_t>(-106));
    CHECK_EQ(error_kind(resp), std::string("TransferExpired"));
    CHECK_EQ(resp.error["message"].get_string(), std::string("transfer #4 expired"));
}

TEST_CASE(RpcUtil, Base64AndAuth) {
    CHECK_EQ(rpc::base64_encode("user:pass"), std::string("dXNlcjpwYXNz"));
    CHECK_EQ(rpc::base64_decode("dXNlcjpwYXNz").value(), std::string("user:pass"));
    CHECK(!rpc::base64_decode("***").has_value());

    CHECK(rpc::verify_auth("Basic dXNlcjpwYXNz", "user", "pass"));
    CHECK(!rpc::verify_auth("Basic dXNlcjpwYXNz", "user", "other"));
    CHECK(!rpc::verify_auth("Bearer dXNlcjpwYXNz", "user", "pass"));
}

// ===================================================================
// HTTP framing
// ===================================================================

TEST_CASE(HttpParse, CompleteRequest) {
    std::string raw = "POST / HTTP/1.1\r\n"
                      "content-type: application/json\r\n"
                      "AUTHORIZATION: Basic abc\r\n"
                      "Content-Length: 4\r\n\r\n"
                      "{}xxEXTRA";
    auto req = rpc::parse_http_request(raw);
    CHECK(req.has_value());
    CHECK_EQ(req->method, std::string("POST"));
    CHECK_EQ(req->path, std::string("/"));
    CHECK_EQ(req->auth_header, std::string("Basic abc"));
    CHECK_EQ(req->content_type, std::string("application/json"));
    CHECK_EQ(req->body, std::string("{}xx"));
}

TEST_CASE(HttpParse, IncompleteOrMalformed) {
    CHECK(!rpc::parse_http_request("POST / HTTP/1.1\r\nContent-Length: 10\r\n\r\nabc").has_value());
    CHECK(!rpc::parse_http_request("POST / HTTP/1.1\r\nContent-Length: 1").has_value());
    CHECK(!rpc::parse_http_request("POST / HTTP/1.1\r\nContent-Length: x\r\n\r\n").has_value());
    CHECK(!rpc::parse_http_request("GARBAGE\r\n\r\n").has_value());

    auto no_body = rpc::parse_http_request("GET /health HTTP/1.1\r\nHost: x\r\n\r\n");
    CHECK(no_body.has_value());
    CHECK(no_body->body.empty());
}

// ===================================================================
// Escrow commands
// ===================================================================

TEST_CASE(EscrowRpc, CreateAndClaim) {
    EscrowFixture f;
    f.fund(ALICE, 100000);

    auto created = f.call("createtransfer", {ALICE, BOB, "native", 1000, "open sesame"});
    CHECK(created.ok());
    CHECK_EQ(created.result["id"].get_int(), static_cast<int64_t>(1));
    CHECK_EQ(created.result["fee"].get_int(), static_cast<int64_t>(5));
    CHECK_EQ(created.result["total"].get_int(), static_cast<int64_t>(1005));
    CHECK_EQ(created.result["expiration_time"].get_int(),
             START + rpc::DEFAULT_AVAILABILITY);
    CHECK_EQ(created.result["claim_opens_at"].get_int(),
             START + escrow::DEFAULT_CANCEL_COOLDOWN + 1);

    auto got = f.call("gettransfer", {1});
    CHECK(got.ok());
    CHECK_EQ(got.result["status"].get_string(), std::string("Pending"));
    CHECK_EQ(got.result["phase"].get_string(), std::string("CancelWindow"));
    CHECK_EQ(got.result["asset"].get_string(), std::string("native"));
    CHECK_EQ(got.result["sender"].get_string(), ALICE);
    CHECK_EQ(got.result["amount"].get_int(), static_cast<int64_t>(1000));

    f.clock.advance(escrow::DEFAULT_CANCEL_COOLDOWN + 1);
    auto claimed = f.call("claimtransfer", {1, BOB, "open sesame"});
    CHECK(claimed.ok());
    CHECK_EQ(claimed.result["status"].get_string(), std::string("Claimed"));
    CHECK(!claimed.result.has_key("phase"));

    auto bal = f.call("getbalance", {BOB, "native"});
    CHECK_EQ(bal.result.get_int(), static_cast<int64_t>(1000));
    auto treasury = f.call("getbalance", {TREASURY});
    CHECK_EQ(treasury.result.get_int(), static_cast<int64_t>(5));
}

TEST_CASE(RpcUtil, EveryLedgerErrorHasItsOwnCode) {
    std::set<int> seen;
    for (int raw = 1000; raw <= static_cast<int>(core::ErrorCode::ESCROW_RESERVED_SENDER); ++raw) {
        auto code = static_cast<core::ErrorCode>(raw);
        int mapped = static_cast<int>(rpc::rpc_code_for(code));
        CHECK_EQ(mapped, -100 - (raw - 1000));
        CHECK(seen.insert(mapped).second);
    }
    CHECK_EQ(seen.size(), size_t{19});
}

TEST_CASE(EscrowRpc, LedgerErrorsCarryKind) {
    EscrowFixture f;
    f.fund(ALICE, 100000);
    auto id = f.create(1000);

    auto early = f.call("claimtransfer", {id, BOB, "open sesame"});
    CHECK_EQ(error_code(early), static_cast<int64_t>(-105));
    CHECK_EQ(error_kind(early), std::string("ClaimNotYetOpen"));

    auto wrong_caller = f.call("canceltransfer", {id, BOB});
    CHECK_EQ(error_code(wrong_caller), static_cast<int64_t>(-101));
    CHECK_EQ(error_kind(wrong_caller), std::string("NotSender"));

    auto missing = f.call("gettransfer", {99});
    CHECK_EQ(error_code(missing), static_cast<int64_t>(-100));

    f.clock.advance(escrow::DEFAULT_CANCEL_COOLDOWN + 1);
    auto bad_pw = f.call("claimtransfer", {id, BOB, "open sesamE"});
    CHECK_EQ(error_code(bad_pw), static_cast<int64_t>(-107));
    CHECK_EQ(error_kind(bad_pw), std::string("IncorrectPassword"));

    auto no_pw = f.call("claimtransfer", {id, BOB});
    CHECK_EQ(error_kind(no_pw), std::string("PasswordMissing"));

    auto broke = f.call("createtransfer", {CAROL, BOB, "native", 10, "open sesame"});
    CHECK_EQ(error_code(broke), static_cast<int64_t>(-113));

    // Collected fees cannot be sent on by naming the treasury.
    auto fees = f.call("createtransfer", {TREASURY, BOB, "native", 1, "open sesame"});
    CHECK_EQ(error_code(fees), static_cast<int64_t>(-118));
    CHECK_EQ(error_kind(fees), std::string("ReservedSender"));
}

TEST_CASE(EscrowRpc, ExpiresInParameter) {
    EscrowFixture f;
    f.fund(ALICE, 100000);

    auto short_lived = f.call("createtransfer",
                              {ALICE, BOB, "native", 100, "open sesame", 60});
    CHECK(short_lived.ok());
    CHECK_EQ(short_lived.result["expiration_time"].get_int(), START + 60);

    auto zero = f.call("createtransfer", {ALICE, BOB, "native", 100, "open sesame", 0});
    CHECK_EQ(error_code(zero), static_cast<int64_t>(-114));
    CHECK_EQ(error_kind(zero), std::string("InvalidExpiration"));

    f.clock.advance(61);
    auto refunded = f.call("reclaimexpired", {short_lived.result["id"].get_int(), CAROL});
    CHECK(refunded.ok());
    CHECK_EQ(refunded.result["status"].get_string(), std::string("ExpiredAndRefunded"));
}

TEST_CASE(EscrowRpc, ParameterValidation) {
    EscrowFixture f;
    auto bad_account = f.call("createtransfer", {"zz", BOB, "native", 1, "open sesame"});
    CHECK_EQ(error_code(bad_account), static_cast<int64_t>(-32602));

    auto bad_id = f.call("gettransfer", {0});
    CHECK_EQ(error_code(bad_id), static_cast<int64_t>(-32602));

    auto missing = f.call("canceltransfer", {1});
    CHECK_EQ(error_code(missing), static_cast<int64_t>(-32602));

    auto negative = f.call("listtransfers", {ALICE, -1});
    CHECK_EQ(error_code(negative), static_cast<int64_t>(-8));

    auto status = f.call("liststatus", {ALICE, "settled"});
    CHECK_EQ(error_code(status), static_cast<int64_t>(-8));
}

TEST_CASE(EscrowRpc, Listings) {
    EscrowFixture f;
    f.fund(ALICE, 100000);
    auto a = f.create(1000);
    auto b = f.create(2000, CAROL);
    auto c = f.create(3000);
    CHECK(f.call("canceltransfer", {b, ALICE}).ok());

    auto all_pending = f.call("listpending");
    CHECK_EQ(all_pending.result.size(), static_cast<size_t>(2));
    auto bob_pending = f.call("listpending", {BOB});
    CHECK_EQ(bob_pending.result.size(), static_cast<size_t>(2));
    CHECK_EQ(bob_pending.result[static_cast<size_t>(0)]["id"].get_int(), a);
    CHECK_EQ(bob_pending.result[static_cast<size_t>(1)]["id"].get_int(), c);

    auto carol_history = f.call("listhistory", {CAROL});
    CHECK_EQ(carol_history.result.size(), static_cast<size_t>(1));
    CHECK_EQ(f.call("counthistory", {ALICE}).result.get_int(), static_cast<int64_t>(1));

    auto page = f.call("listtransfers", {ALICE, 1, 1});
    CHECK_EQ(page.result.size(), static_cast<size_t>(1));
    CHECK_EQ(page.result[static_cast<size_t>(0)]["id"].get_int(), b);

    auto canceled = f.call("liststatus", {ALICE, "canceled"});
    CHECK_EQ(canceled.result.size(), static_cast<size_t>(1));
    CHECK_EQ(canceled.result[static_cast<size_t>(0)]["status"].get_string(),
             std::string("Canceled"));
}

TEST_CASE(EscrowRpc, FeeCommands) {
    EscrowFixture f;
    auto small = f.call("estimatefee", {50});
    CHECK(small.ok());
    CHECK_EQ(small.result["tier"].get_int(), static_cast<int64_t>(1));
    CHECK_EQ(small.result["fee"].get_int(), static_cast<int64_t>(0));
    CHECK_EQ(small.result["total"].get_int(), static_cast<int64_t>(50));

    auto large = f.call("estimatefee", {1000000});
    CHECK_EQ(large.result["tier"].get_int(), static_cast<int64_t>(3));
    CHECK_EQ(large.result["fee"].get_int(), static_cast<int64_t>(2500));

    auto zero = f.call("estimatefee", {0});
    CHECK_EQ(error_kind(zero), std::string("AmountTooLow"));

    auto schedule = f.call("getfeeschedule");
    CHECK(schedule.ok());
    CHECK_EQ(schedule.result["limit_one"].get_int(), static_cast<int64_t>(100));
    CHECK_EQ(schedule.result["rate_three"].get_int(), static_cast<int64_t>(25));
    CHECK_EQ(schedule.result["scaling"].get_int(), static_cast<int64_t>(10000));
    CHECK_EQ(schedule.result["cancel_cooldown"].get_int(), static_cast<int64_t>(1800));
    CHECK_EQ(schedule.result["min_password_length"].get_int(), static_cast<int64_t>(7));
    CHECK_EQ(schedule.result["treasury"].get_string(), TREASURY);
}

TEST_CASE(EscrowRpc, CollectedFeesPerAsset) {
    EscrowFixture f;
    f.fund(ALICE, 100000);
    CHECK(f.call("deposit", {ALICE, TOKEN, 50000}).ok());
    f.create(1000);
    CHECK(f.call("createtransfer", {ALICE, BOB, TOKEN, 10000, "open sesame"}).ok());

    auto native = f.call("getcollectedfees", {"native"});
    CHECK_EQ(native.result.get_int(), static_cast<int64_t>(5));

    auto all = f.call("getcollectedfees");
    CHECK(all.result.is_object());
    CHECK_EQ(all.result["native"].get_int(), static_cast<int64_t>(5));
    CHECK_EQ(all.result[TOKEN].get_int(), static_cast<int64_t>(25));
}

TEST_CASE(EscrowRpc, DepositRejectsNonPositive) {
    EscrowFixture f;
    auto resp = f.call("deposit", {ALICE, "native", 0});
    CHECK_EQ(error_kind(resp), std::string("AmountOutOfRange"));
}

TEST_CASE(EscrowRpc, MissingLedgerIsMiscError) {
    rpc::EscrowContext empty;
    rpc::RpcServer server{rpc::RpcServer::Config{}};
    rpc::register_escrow_rpcs(server, empty);

    rpc::RpcRequest req;
    req.method = "getfeeschedule";
    req.params = rpc::JsonValue::array();
    auto resp = server.execute(req);
    CHECK_EQ(error_code(resp), static_cast<int64_t>(-1));
}

// ===================================================================
// Dispatch
// ===================================================================

TEST_CASE(RpcServer, ConfigDefaults) {
    rpc::RpcServer::Config cfg;
    CHECK_EQ(cfg.bind_address, std::string("127.0.0.1"));
    CHECK_EQ(cfg.port, static_cast<uint16_t>(9645));
    CHECK_EQ(cfg.num_threads, 4);
}

TEST_CASE(RpcServer, CommandRegistry) {
    EscrowFixture f;
    auto names = f.server.command_names();
    for (const char* expected : {"createtransfer", "canceltransfer", "claimtransfer",
                                 "reclaimexpired", "gettransfer", "listpending",
                                 "estimatefee", "stop", "help"}) {
        bool found = false;
        for (const auto& n : names) found = found || n == expected;
        CHECK(found);
    }
    CHECK(f.server.help_text("createtransfer").starts_with("createtransfer "));
    CHECK(f.server.help_text("nosuchcommand").empty());
}

TEST_CASE(RpcServer, HandleBody) {
    EscrowFixture f;
    auto single = rpc::parse_json(f.server.handle_body(
        R"({"method":"estimatefee","params":[1000],"id":9})"));
    CHECK_EQ(single["id"].get_int(), static_cast<int64_t>(9));
    CHECK_EQ(single["result"]["fee"].get_int(), static_cast<int64_t>(5));

    auto unknown = rpc::parse_json(f.server.handle_body(
        R"({"method":"sendmoney","params":[],"id":2})"));
    CHECK_EQ(unknown["error"]["code"].get_int(), static_cast<int64_t>(-32601));

    auto garbage = rpc::parse_json(f.server.handle_body("{not json"));
    CHECK_EQ(garbage["error"]["code"].get_int(), static_cast<int64_t>(-32700));

    auto empty_batch = rpc::parse_json(f.server.handle_body("[]"));
    CHECK_EQ(empty_batch["error"]["code"].get_int(), static_cast<int64_t>(-32600));

    auto batch = rpc::parse_json(f.server.handle_body(
        R"([{"method":"estimatefee","params":[50],"id":1},{"params":[],"id":2}])"));
    CHECK(batch.is_array());
    CHECK_EQ(batch.size(), static_cast<size_t>(2));
    CHECK(batch[static_cast<size_t>(0)]["error"].is_null());
    CHECK_EQ(batch[static_cast<size_t>(1)]["error"]["code"].get_int(),
             static_cast<int64_t>(-32600));
}

// ===================================================================
// Control commands
// ===================================================================

TEST_CASE(ControlRpc, StopUptimeHelp) {
    EscrowFixture f;
    auto stop = f.call("stop");
    CHECK(stop.ok());
    CHECK_EQ(stop.result.get_string(), std::string("PST server stopping"));
    CHECK_EQ(f.stop_calls, 1);

    auto uptime = f.call("uptime");
    CHECK(uptime.result.get_int() >= 10);

    auto overview = f.call("help");
    CHECK(overview.result.get_string().find("== ledger ==") != std::string::npos);
    auto one = f.call("help", {"claimtransfer"});
    CHECK(one.result.get_string().starts_with("claimtransfer"));
    auto unknown = f.call("help", {"sendmoney"});
    CHECK_EQ(error_code(unknown), static_cast<int64_t>(-32601));
}

TEST_CASE(ControlRpc, LoggingCategories) {
    auto& logger = core::Logger::instance();
    auto saved = logger.enabled_categories();
    logger.set_categories(core::LogCategory::NONE);

    EscrowFixture f;
    auto changed = f.call("logging", {rpc::JsonValue::Array{"ledger", "rpc"},
                                      rpc::JsonValue::Array{"rpc"}});
    CHECK(changed.ok());
    CHECK_EQ(changed.result["ledger"].get_bool(), true);
    CHECK_EQ(changed.result["rpc"].get_bool(), false);
    CHECK_EQ(changed.result["fees"].get_bool(), false);

    auto bad = f.call("logging", {rpc::JsonValue(rpc::JsonValue::Array{"network"})});
    CHECK_EQ(error_code(bad), static_cast<int64_t>(-8));

    logger.set_categories(saved);
}

// ===================================================================
// Loopback HTTP
// ===================================================================

TEST_CASE(RpcServer, LoopbackWithAuth) {
    core::ManualClock clock{START};
    escrow::InMemoryAssetMover book;
    escrow::LedgerOptions options;
    options.password_iterations = 1000;
    options.clock = clock.source();
    escrow::TransferLedger ledger(options, book);
    rpc::EscrowContext ctx{&ledger, &book, rpc::DEFAULT_AVAILABILITY};

    rpc::RpcServer::Config cfg;
    cfg.port         = 0;
    cfg.rpc_user     = "user";
    cfg.rpc_password = "pass";
    cfg.num_threads  = 2;
    rpc::RpcServer server(cfg);
    rpc::register_escrow_rpcs(server, ctx);
    CHECK_OK(server.start());
    CHECK(server.is_running());
    CHECK(server.port() != 0);

    std::string body = R"({"method":"estimatefee","params":[1000],"id":1})";

    auto denied = http_exchange(server.port(), http_post(body, "user:wrong"));
    CHECK(denied.starts_with("HTTP/1.1 401"));

    auto reply = http_exchange(server.port(), http_post(body, "user:pass"));
    CHECK(reply.starts_with("HTTP/1.1 200"));
    auto json = rpc::parse_json(reply.substr(reply.find("\r\n\r\n") + 4));
    CHECK_EQ(json["result"]["fee"].get_int(), static_cast<int64_t>(5));

    server.stop();
    CHECK(!server.is_running());
}
