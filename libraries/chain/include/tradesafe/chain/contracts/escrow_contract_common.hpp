/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#pragma once

#include <cstring>
#include <iterator>
#include <string>
#include <type_traits>

#include <boost/noncopyable.hpp>
#include <boost/safe_numerics/checked_default.hpp>
#include <boost/safe_numerics/checked_integer.hpp>

#include <fc/log/logger.hpp>
#include <fmt/format.h>

#include <tradesafe/chain/apply_context.hpp>
#include <tradesafe/chain/controller.hpp>
#include <tradesafe/chain/config.hpp>
#include <tradesafe/chain/exceptions.hpp>
#include <tradesafe/chain/execution_context.hpp>
#include <tradesafe/chain/ledger_database.hpp>
#include <tradesafe/chain/contracts/types.hpp>
#include <tradesafe/utilities/safemath.hpp>

namespace tradesafe { namespace chain { namespace contracts {

#define TRADESAFE_ACTION_IMPL_BEGIN(name)              \
    template<>                                        \
    struct apply_action<N(name)> {                    \
        template<typename ACT>                        \
        static void invoke(apply_context& context)

#define TRADESAFE_ACTION_IMPL_END() };

#define DECLARE_LEDGER_DB() \
    auto& ledger_db = context.ledger_db;

#define READ_DB_ESCROW(ADDR, VALUEREF) \
    ledger_db.read_escrow(ADDR, VALUEREF);

#define PUT_DB_ESCROW(VALUEREF) \
    ledger_db.put_escrow(VALUEREF);

#define READ_DB_ACCOUNT_NO_THROW(ADDR, SYM, VALUEREF)                             \
    {                                                                            \
        if(!ledger_db.read_account(ADDR, SYM.id(), VALUEREF, true /* no throw */)) { \
            VALUEREF           = token_account_def();                            \
            VALUEREF.addr      = ADDR;                                           \
            VALUEREF.authority = ADDR;                                           \
            VALUEREF.sym       = SYM;                                            \
        }                                                                        \
    }

#define CONSOLE_PRINT(FORMAT, ...)                                                       \
    if(context.control.contracts_console()) {                                            \
        fmt::format_to(std::back_inserter(context.get_console_buffer()), FORMAT, ##__VA_ARGS__); \
    }

namespace internal {

inline void
check_address_reserved(const address& addr) {
    TRADESAFE_ASSERT(!addr.is_reserved(), address_type_exception, "Address is reserved and cannot be used here");
}

inline void
check_party_address(const address& addr, const char* role) {
    check_address_reserved(addr);
    TRADESAFE_ASSERT2(addr.is_public_key(), escrow_party_exception,
        "The {} of an escrow must be a party key, provided: {}", role, addr);
}

// released principal must land where a signer can spend it
inline void
check_sequential_address(const address& addr) {
    check_address_reserved(addr);
    TRADESAFE_ASSERT2(addr.is_public_key(), sequential_address_exception,
        "Sequential escrow address must be a party key, provided: {}", addr);
}

inline void
check_amount(share_type amount) {
    TRADESAFE_ASSERT2(amount > 0, escrow_amount_exception, "Escrow amount must be positive");
    TRADESAFE_ASSERT2(amount <= config::max_escrow_amount, escrow_amount_exception,
        "Escrow amount: {} exceeds the maximum: {}", amount, config::max_escrow_amount);
}

inline share_type
calculate_fee(share_type amount) {
    auto fee = share_type();
    TRADESAFE_ASSERT2(safemath::bps_of(amount, config::fee_bps, fee), math_overflow_exception,
        "Fee of amount: {} overflows", amount);
    return fee;
}

inline share_type
checked_sum(share_type a, share_type b) {
    auto r = share_type();
    TRADESAFE_ASSERT2(safemath::add(a, b, r), math_overflow_exception, "Sum of {} and {} overflows", a, b);
    return r;
}

/**
 * Evidence and explanation hashes are opaque 32-byte digests,
 * only the length is validated
 */
inline hash_type
check_hash(const bytes& hash, const char* what) {
    TRADESAFE_ASSERT2(hash.size() == sizeof(hash_type), evidence_hash_exception,
        "The {} must be exactly {} bytes, provided: {} bytes", what, sizeof(hash_type), hash.size());

    auto h = hash_type();
    memcpy(h.data(), hash.data(), hash.size());
    return h;
}

inline void
check_before(const time_point_sec& now, const time_point_sec& deadline, const char* what) {
    TRADESAFE_ASSERT2(now < deadline, deadline_passed_exception,
        "The {} has passed, deadline: {}, now: {}", what, deadline.to_iso_string(), now.to_iso_string());
}

inline void
check_after(const time_point_sec& now, const time_point_sec& deadline, const char* what) {
    TRADESAFE_ASSERT2(now > deadline, deadline_not_reached_exception,
        "The {} has not been reached yet, deadline: {}, now: {}", what, deadline.to_iso_string(), now.to_iso_string());
}

inline void
check_signer(const apply_context& context, const address& party, const char* role) {
    TRADESAFE_ASSERT2(context.has_authorized(party), escrow_authorization_exception,
        "Operation requires the signature of the {}: {}", role, party);
}

inline void
check_seller_or_arbitrator(const apply_context& context, const escrow_def& escrow) {
    TRADESAFE_ASSERT2(context.has_authorized(escrow.seller) || context.has_authorized(escrow.arbitrator),
        escrow_authorization_exception, "Operation requires the signature of the seller: {} or the arbitrator: {}",
        escrow.seller, escrow.arbitrator);
}

inline void
check_state(const escrow_def& escrow, escrow_state expected) {
    TRADESAFE_ASSERT2(escrow.state() == expected, invalid_transition_exception,
        "Escrow: {} is {}, expected: {}", escrow.escrow, escrow.state(), expected);
}

inline void
check_not_terminal(const escrow_def& escrow) {
    TRADESAFE_ASSERT2(!escrow.is_terminal(), invalid_transition_exception,
        "Escrow: {} is already {}", escrow.escrow, escrow.state());
}

/**
 * Fills the common event fields and bumps the per-escrow event sequence,
 * `counter` is expected to be updated by the caller beforehand
 */
template<typename T>
T
make_event(const apply_context& context, escrow_def& escrow) {
    auto ev = T();

    escrow.sequence += 1;

    ev.escrow    = escrow.escrow;
    ev.escrow_id = escrow.escrow_id;
    ev.trade_id  = escrow.trade_id;
    ev.counter   = escrow.counter;
    ev.sequence  = escrow.sequence;
    ev.timestamp = context.now();
    return ev;
}

inline void
transfer_tokens(apply_context&  context,
                const address&  from,
                const address&  to,
                const asset&    total,
                const address&  authority) {
    using namespace boost::safe_numerics;
    DECLARE_LEDGER_DB();

    auto sym = total.sym();
    TRADESAFE_ASSERT2(from != to, balance_exception, "From and to are the same address: {}", from);

    auto facc = token_account_def();
    if(!ledger_db.read_account(from, sym.id(), facc, true /* no throw */)) {
        TRADESAFE_THROW2(balance_exception, "Address: {} does not have any balance of symbol: {}", from, sym);
    }
    TRADESAFE_ASSERT2(facc.authority == authority, vault_authority_exception,
        "Funds of address: {} can only be moved by: {}", from, facc.authority);
    TRADESAFE_ASSERT2(facc.balance >= total.amount(), balance_exception,
        "Address: {} does not have enough balance left, required: {}, available: {}", from, total, asset(facc.balance, sym));

    // only open_vault may create an account at a derived address
    auto tacc = token_account_def();
    if(!ledger_db.read_account(to, sym.id(), tacc, true /* no throw */)) {
        TRADESAFE_ASSERT2(!to.is_derived(), vault_authority_exception,
            "Address: {} is a derived address without an open account, it cannot receive funds", to);
        tacc.addr      = to;
        tacc.authority = to;
        tacc.sym       = sym;
    }

    auto r1 = checked::subtract<share_type>(facc.balance, total.amount());
    auto r2 = checked::add<share_type>(tacc.balance, total.amount());
    TRADESAFE_ASSERT2(!r1.exception() && !r2.exception(), math_overflow_exception,
        "Transferring {} from {} to {} overflows", total, from, to);

    facc.balance -= total.amount();
    tacc.balance += total.amount();

    ledger_db.put_account(facc);
    ledger_db.put_account(tacc);
}

inline void
charge_rent(apply_context& context, const address& payer, share_type rent) {
    if(rent == 0) {
        return;
    }

    DECLARE_LEDGER_DB();

    auto acc = token_account_def();
    if(!ledger_db.read_account(payer, native_sym().id(), acc, true /* no throw */) || acc.balance < rent) {
        TRADESAFE_THROW2(rent_exception, "Address: {} cannot cover the rent deposit of {} native units", payer, rent);
    }
    acc.balance -= rent;
    ledger_db.put_account(acc);
}

inline void
refund_rent(apply_context& context, const address& payer, share_type rent) {
    if(rent == 0) {
        return;
    }

    DECLARE_LEDGER_DB();

    auto sym = native_sym();
    auto acc = token_account_def();
    READ_DB_ACCOUNT_NO_THROW(payer, sym, acc);

    TRADESAFE_ASSERT2(safemath::add(acc.balance, rent, acc.balance), math_overflow_exception,
        "Refunding rent to {} overflows", payer);
    ledger_db.put_account(acc);
}

/**
 * Creates an empty custody vault whose only authority is the escrow record
 * address. A vault that already exists is never initialized again.
 */
inline void
open_vault(apply_context& context, const escrow_def& escrow, vault_kind kind, const address& payer) {
    DECLARE_LEDGER_DB();

    auto& conf  = context.control.get_config();
    auto  vault = context.get_vault_address(escrow.escrow, kind);

    TRADESAFE_ASSERT2(!ledger_db.exists_account(vault, conf.token_symbol.id()), vault_reinit_exception,
        "The {} vault: {} of escrow: {} is already initialized", kind, vault, escrow.escrow);

    charge_rent(context, payer, conf.rent_deposit);

    auto acc       = token_account_def();
    acc.addr       = vault;
    acc.authority  = context.get_escrow_authority(escrow);
    acc.sym        = conf.token_symbol;
    acc.balance    = 0;
    acc.rent_payer = payer;
    acc.rent       = conf.rent_deposit;

    ledger_db.put_account(acc);
    dlog("Opened ${k} vault: ${v} for escrow: ${e}", ("k", vault_tag(kind))("v", vault)("e", escrow.escrow));
}

inline bool
vault_exists(const apply_context& context, const escrow_def& escrow, vault_kind kind) {
    auto vault = context.get_vault_address(escrow.escrow, kind);
    return context.ledger_db.exists_account(vault, context.control.get_config().token_symbol.id());
}

/**
 * Closes a vault and refunds its rent deposit to whoever paid it.
 * Balance not accounted for by the ledger is swept to the rent payer so the
 * vault can always be reclaimed.
 */
inline void
close_vault(apply_context& context, const escrow_def& escrow, vault_kind kind) {
    DECLARE_LEDGER_DB();

    auto& conf  = context.control.get_config();
    auto  vault = context.get_vault_address(escrow.escrow, kind);

    auto acc = token_account_def();
    if(!ledger_db.read_account(vault, conf.token_symbol.id(), acc, true /* no throw */)) {
        return;
    }

    if(acc.balance > 0) {
        wlog("Sweeping untracked balance ${b} of ${k} vault: ${v} to ${p}",
            ("b", acc.balance)("k", vault_tag(kind))("v", vault)("p", acc.rent_payer));
        transfer_tokens(context, vault, acc.rent_payer, asset(acc.balance, acc.sym), context.get_escrow_authority(escrow));
    }

    ledger_db.remove_account(vault, conf.token_symbol.id());
    refund_rent(context, acc.rent_payer, acc.rent);
    dlog("Closed ${k} vault: ${v} of escrow: ${e}", ("k", vault_tag(kind))("v", vault)("e", escrow.escrow));
}

/**
 * Moves funds out of one of the escrow's vaults, signed by the escrow authority
 */
inline void
pay_from_vault(apply_context& context, const escrow_def& escrow, vault_kind kind, const address& to, share_type amount) {
    if(amount == 0) {
        return;
    }

    auto vault = context.get_vault_address(escrow.escrow, kind);
    auto total = asset(amount, context.control.get_config().token_symbol);
    transfer_tokens(context, vault, to, total, context.get_escrow_authority(escrow));
}

inline const address&
release_destination(const escrow_def& escrow) {
    if(escrow.sequential) {
        TRADESAFE_ASSERT2(escrow.sequential_address.has_value(), sequential_address_exception,
            "Sequential escrow: {} has no sequential escrow address", escrow.escrow);
        return *escrow.sequential_address;
    }
    return escrow.buyer;
}

}  // namespace internal

}}}  // namespace tradesafe::chain::contracts
