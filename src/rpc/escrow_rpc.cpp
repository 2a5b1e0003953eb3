// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/escrow_rpc.h"
#include "rpc/util.h"

#include "core/logging.h"
#include "escrow/cooldown.h"
#include "escrow/fee_schedule.h"

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace rpc {

namespace {

escrow::TransferLedger& ledger_of(const EscrowContext& ctx) {
    if (ctx.ledger == nullptr) {
        throw RpcException(RpcError::MISC_ERROR, "Ledger is not available.");
    }
    return *ctx.ledger;
}

escrow::InMemoryAssetMover& book_of(const EscrowContext& ctx) {
    if (ctx.book == nullptr) {
        throw RpcException(RpcError::MISC_ERROR,
                           "No in-memory balance book is attached to this ledger.");
    }
    return *ctx.book;
}

JsonValue views_to_json(const std::vector<escrow::TransferView>& views) {
    JsonValue arr = JsonValue::array();
    for (const auto& v : views) {
        arr.push_back(transfer_to_json(v));
    }
    return arr;
}

size_t non_negative(int64_t value, const char* name) {
    if (value < 0) {
        throw RpcException(RpcError::INVALID_PARAMETER,
                           std::string(name) + " must not be negative");
    }
    return static_cast<size_t>(value);
}

} // anonymous namespace

std::string asset_to_string(const escrow::AssetId& asset) {
    return escrow::is_native(asset) ? std::string("native") : asset.to_hex();
}

JsonValue transfer_to_json(const escrow::TransferView& view) {
    JsonValue obj = JsonValue::object();
    obj["id"]              = JsonValue(static_cast<uint64_t>(view.id));
    obj["sender"]          = JsonValue(view.sender.to_hex());
    obj["receiver"]        = JsonValue(view.receiver.to_hex());
    obj["asset"]           = JsonValue(asset_to_string(view.asset));
    obj["amount"]          = JsonValue(view.net_amount);
    obj["fee"]             = JsonValue(view.fee_amount);
    obj["status"]          = JsonValue(escrow::status_name(view.status));
    obj["creation_time"]   = JsonValue(view.creation_time);
    obj["expiration_time"] = JsonValue(view.expiration_time);
    obj["cancel_deadline"] = JsonValue(view.cancel_deadline);
    obj["claim_opens_at"]  = JsonValue(view.claim_opens_at);
    if (view.status == escrow::TransferStatus::PENDING) {
        obj["phase"] = JsonValue(escrow::phase_name(view.phase));
    }
    return obj;
}

// ===========================================================================
// Transitions
// ===========================================================================

RpcResponse rpc_createtransfer(const RpcRequest& req, EscrowContext& ctx) {
    auto& ledger = ledger_of(ctx);

    auto sender     = param_account(req.params, 0);
    auto receiver   = param_account(req.params, 1);
    auto asset      = param_asset(req.params, 2);
    int64_t amount  = param_amount(req.params, 3);
    std::string pw  = param_string(req.params, 4);
    int64_t expires_in = param_int(req.params, 5, ctx.availability);

    int64_t now = ledger.now();
    int64_t expiration = expires_in > std::numeric_limits<int64_t>::max() - now
                             ? std::numeric_limits<int64_t>::max()
                             : now + expires_in;

    auto created = ledger.create(sender, receiver, asset, amount, pw, expiration);
    if (!created.ok()) {
        return error_response(created.error(), req.id);
    }

    const auto& receipt = created.value();
    JsonValue obj = JsonValue::object();
    obj["id"]              = JsonValue(static_cast<uint64_t>(receipt.id));
    obj["fee"]             = JsonValue(receipt.fee);
    obj["total"]           = JsonValue(receipt.total);
    obj["creation_time"]   = JsonValue(receipt.creation_time);
    obj["expiration_time"] = JsonValue(expiration);
    obj["claim_opens_at"]  = JsonValue(ledger.cooldown().claim_opens_at(receipt.creation_time));
    return make_result(std::move(obj), req.id);
}

RpcResponse rpc_canceltransfer(const RpcRequest& req, EscrowContext& ctx) {
    auto& ledger = ledger_of(ctx);
    uint64_t id  = param_id(req.params, 0);
    auto caller  = param_account(req.params, 1);

    auto result = ledger.cancel(id, caller);
    if (!result.ok()) return error_response(result.error(), req.id);
    return make_result(transfer_to_json(result.value()), req.id);
}

RpcResponse rpc_claimtransfer(const RpcRequest& req, EscrowContext& ctx) {
    auto& ledger = ledger_of(ctx);
    uint64_t id  = param_id(req.params, 0);
    auto caller  = param_account(req.params, 1);
    // An absent password reaches the ledger as empty and fails there as
    // PasswordMissing, after the state checks.
    std::string pw = param_string(req.params, 2, "");

    auto result = ledger.claim(id, caller, pw);
    if (!result.ok()) return error_response(result.error(), req.id);
    return make_result(transfer_to_json(result.value()), req.id);
}

RpcResponse rpc_reclaimexpired(const RpcRequest& req, EscrowContext& ctx) {
    auto& ledger = ledger_of(ctx);
    uint64_t id  = param_id(req.params, 0);
    auto caller  = param_account(req.params, 1);

    auto result = ledger.reclaim_expired(id, caller);
    if (!result.ok()) return error_response(result.error(), req.id);
    return make_result(transfer_to_json(result.value()), req.id);
}

// ===========================================================================
// Queries
// ===========================================================================

RpcResponse rpc_gettransfer(const RpcRequest& req, const EscrowContext& ctx) {
    auto& ledger = ledger_of(ctx);
    uint64_t id  = param_id(req.params, 0);

    auto result = ledger.get_transfer(id);
    if (!result.ok()) return error_response(result.error(), req.id);
    return make_result(transfer_to_json(result.value()), req.id);
}

RpcResponse rpc_listpending(const RpcRequest& req, const EscrowContext& ctx) {
    auto& ledger = ledger_of(ctx);
    if (!param_exists(req.params, 0)) {
        return make_result(views_to_json(ledger.list_pending()), req.id);
    }
    auto account = param_account(req.params, 0);
    return make_result(views_to_json(ledger.list_pending_for(account)), req.id);
}

RpcResponse rpc_listhistory(const RpcRequest& req, const EscrowContext& ctx) {
    auto& ledger = ledger_of(ctx);
    auto account = param_account(req.params, 0);
    return make_result(views_to_json(ledger.list_history_for(account)), req.id);
}

RpcResponse rpc_listtransfers(const RpcRequest& req, const EscrowContext& ctx) {
    auto& ledger  = ledger_of(ctx);
    auto account  = param_account(req.params, 0);
    size_t offset = non_negative(param_int(req.params, 1, 0), "offset");
    size_t limit  = non_negative(param_int(req.params, 2, 0), "limit");

    return make_result(views_to_json(ledger.list_transfers_for(account, offset, limit)),
                       req.id);
}

RpcResponse rpc_counthistory(const RpcRequest& req, const EscrowContext& ctx) {
    auto& ledger = ledger_of(ctx);
    auto account = param_account(req.params, 0);
    return make_result(JsonValue(static_cast<uint64_t>(ledger.count_history_for(account))),
                       req.id);
}

RpcResponse rpc_liststatus(const RpcRequest& req, const EscrowContext& ctx) {
    auto& ledger = ledger_of(ctx);
    auto account = param_account(req.params, 0);
    std::string name = param_string(req.params, 1);

    auto status = escrow::parse_status(name);
    if (!status) {
        return make_error(RpcError::INVALID_PARAMETER,
                          "unknown status: " + name +
                          " (expected pending, claimed, canceled or expiredandrefunded)",
                          req.id);
    }
    return make_result(views_to_json(ledger.list_by_status_for(account, *status)), req.id);
}

RpcResponse rpc_estimatefee(const RpcRequest& req, const EscrowContext& ctx) {
    auto& ledger   = ledger_of(ctx);
    int64_t amount = param_amount(req.params, 0);
    if (amount <= 0) {
        return error_response(core::make_error(core::ErrorCode::ESCROW_AMOUNT_TOO_LOW,
                                               "amount must be greater than zero"),
                              req.id);
    }

    auto quote = ledger.fee_schedule().quote(amount);
    if (!quote.ok()) return error_response(quote.error(), req.id);

    const auto& q = quote.value();
    JsonValue obj = JsonValue::object();
    obj["amount"] = JsonValue(amount);
    obj["tier"]   = JsonValue(q.tier);
    obj["rate"]   = JsonValue(q.rate);
    obj["fee"]    = JsonValue(q.fee);
    obj["total"]  = JsonValue(q.total);
    return make_result(std::move(obj), req.id);
}

RpcResponse rpc_getfeeschedule(const RpcRequest& req, const EscrowContext& ctx) {
    auto& ledger = ledger_of(ctx);
    const auto& fees = ledger.fee_schedule();

    JsonValue obj = JsonValue::object();
    obj["limit_one"]           = JsonValue(fees.tiers().limit_one);
    obj["limit_two"]           = JsonValue(fees.tiers().limit_two);
    obj["rate_one"]            = JsonValue(fees.rates().rate_one);
    obj["rate_two"]            = JsonValue(fees.rates().rate_two);
    obj["rate_three"]          = JsonValue(fees.rates().rate_three);
    obj["scaling"]             = JsonValue(fees.scaling());
    obj["cancel_cooldown"]     = JsonValue(ledger.cooldown_period());
    obj["availability"]        = JsonValue(ctx.availability);
    obj["min_password_length"] = JsonValue(static_cast<uint64_t>(ledger.min_password_length()));
    obj["treasury"]            = JsonValue(ledger.treasury().to_hex());
    return make_result(std::move(obj), req.id);
}

// ===========================================================================
// Balance book
// ===========================================================================

RpcResponse rpc_deposit(const RpcRequest& req, EscrowContext& ctx) {
    auto& book     = book_of(ctx);
    auto account   = param_account(req.params, 0);
    auto asset     = param_asset(req.params, 1);
    int64_t amount = param_amount(req.params, 2);

    auto balance = book.deposit(account, asset, amount);
    if (!balance.ok()) return error_response(balance.error(), req.id);
    return make_result(JsonValue(balance.value()), req.id);
}

RpcResponse rpc_getbalance(const RpcRequest& req, const EscrowContext& ctx) {
    auto& book   = book_of(ctx);
    auto account = param_account(req.params, 0);
    auto asset   = param_asset(req.params, 1);
    return make_result(JsonValue(book.balance_of(account, asset)), req.id);
}

RpcResponse rpc_getcollectedfees(const RpcRequest& req, const EscrowContext& ctx) {
    auto& ledger = ledger_of(ctx);
    if (param_exists(req.params, 0)) {
        auto asset = param_asset(req.params, 0);
        return make_result(JsonValue(ledger.collected_fees(asset)), req.id);
    }

    JsonValue obj = JsonValue::object();
    for (const auto& [asset, total] : ledger.collected_fees()) {
        obj[asset_to_string(asset)] = JsonValue(total);
    }
    return make_result(std::move(obj), req.id);
}

// ===========================================================================
// Registration
// ===========================================================================

void register_escrow_rpcs(RpcServer& server, EscrowContext& ctx) {
    server.register_commands({
        {"createtransfer",
         [&](const RpcRequest& r) { return rpc_createtransfer(r, ctx); },
         "createtransfer \"sender\" \"receiver\" \"asset\" amount \"password\" ( expires_in )\n"
         "Lock amount plus fee from the sender in a password-gated transfer.\n"
         "\nArguments:\n"
         "1. sender      (string, required) Sending account (40 hex chars).\n"
         "2. receiver    (string, required) Receiving account.\n"
         "3. asset       (string, required) Asset id, or \"native\".\n"
         "4. amount      (numeric, required) Amount the receiver gets, in base units.\n"
         "5. password    (string, required) Claim password.\n"
         "6. expires_in  (numeric, optional) Lifetime in seconds.\n"
         "\nResult:\n"
         "{ \"id\", \"fee\", \"total\", \"creation_time\", \"expiration_time\", \"claim_opens_at\" }",
         "ledger"},

        {"canceltransfer",
         [&](const RpcRequest& r) { return rpc_canceltransfer(r, ctx); },
         "canceltransfer id \"caller\"\n"
         "Return a pending transfer to its sender during the cancel cooldown.\n"
         "The fee is not refunded.",
         "ledger"},

        {"claimtransfer",
         [&](const RpcRequest& r) { return rpc_claimtransfer(r, ctx); },
         "claimtransfer id \"caller\" \"password\"\n"
         "Release a pending transfer to its receiver after the cooldown\n"
         "and before expiration.",
         "ledger"},

        {"reclaimexpired",
         [&](const RpcRequest& r) { return rpc_reclaimexpired(r, ctx); },
         "reclaimexpired id \"caller\"\n"
         "Return an expired pending transfer to its sender. Any caller may\n"
         "trigger the refund.",
         "ledger"},

        {"gettransfer",
         [&](const RpcRequest& r) { return rpc_gettransfer(r, ctx); },
         "gettransfer id\n"
         "Returns one transfer.",
         "ledger"},

        {"listpending",
         [&](const RpcRequest& r) { return rpc_listpending(r, ctx); },
         "listpending ( \"account\" )\n"
         "Pending transfers the account sends or receives, or every pending\n"
         "transfer when no account is given.",
         "ledger"},

        {"listhistory",
         [&](const RpcRequest& r) { return rpc_listhistory(r, ctx); },
         "listhistory \"account\"\n"
         "Claimed, canceled and refunded transfers of the account.",
         "ledger"},

        {"listtransfers",
         [&](const RpcRequest& r) { return rpc_listtransfers(r, ctx); },
         "listtransfers \"account\" ( offset limit )\n"
         "All transfers of the account in ascending id order.\n"
         "A limit of 0 returns everything after offset.",
         "ledger"},

        {"counthistory",
         [&](const RpcRequest& r) { return rpc_counthistory(r, ctx); },
         "counthistory \"account\"\n"
         "Number of finished transfers of the account.",
         "ledger"},

        {"liststatus",
         [&](const RpcRequest& r) { return rpc_liststatus(r, ctx); },
         "liststatus \"account\" \"status\"\n"
         "Transfers of the account in one status: pending, claimed,\n"
         "canceled or expiredandrefunded.",
         "ledger"},

        {"estimatefee",
         [&](const RpcRequest& r) { return rpc_estimatefee(r, ctx); },
         "estimatefee amount\n"
         "Fee the ledger would charge for a transfer of amount.\n"
         "\nResult:\n"
         "{ \"amount\", \"tier\", \"rate\", \"fee\", \"total\" }",
         "fees"},

        {"getfeeschedule",
         [&](const RpcRequest& r) { return rpc_getfeeschedule(r, ctx); },
         "getfeeschedule\n"
         "Fee tiers and rates, cooldown and default availability.",
         "fees"},

        {"getcollectedfees",
         [&](const RpcRequest& r) { return rpc_getcollectedfees(r, ctx); },
         "getcollectedfees ( \"asset\" )\n"
         "Fees collected for one asset, or an object keyed by asset.",
         "fees"},

        {"deposit",
         [&](const RpcRequest& r) { return rpc_deposit(r, ctx); },
         "deposit \"account\" \"asset\" amount\n"
         "Credit funds to an account of the in-memory balance book.\n"
         "Returns the new balance.",
         "balances"},

        {"getbalance",
         [&](const RpcRequest& r) { return rpc_getbalance(r, ctx); },
         "getbalance \"account\" ( \"asset\" )\n"
         "Balance of the account in the in-memory balance book.",
         "balances"},
    });
}

} // namespace rpc
