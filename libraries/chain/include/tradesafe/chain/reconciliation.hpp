/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#pragma once
#include <string>
#include <vector>
#include <tradesafe/chain/addressing.hpp>
#include <tradesafe/chain/controller.hpp>
#include <tradesafe/chain/escrow_object.hpp>
#include <tradesafe/chain/ledger_database.hpp>

namespace tradesafe { namespace chain {

enum class vault_status {
    open = 0,
    closed,
    mismatch
};

/**
 * One escrow record compared against the real balance of its principal vault
 */
struct reconciliation_row {
    address        escrow;
    escrow_id_type escrow_id = 0;
    trade_id_type  trade_id  = 0;
    escrow_state   state     = escrow_state::created;

    bool fiat_paid  = false;
    bool sequential = false;

    address    principal_vault;
    share_type tracked = 0;
    share_type actual  = 0;
    share_type rent    = 0;  ///< native units locked by the vault

    vault_status status = vault_status::closed;
};

struct reconciliation_report {
    std::vector<reconciliation_row> rows;

    uint32_t   escrows             = 0;
    uint32_t   accounts_with_funds = 0;
    share_type total_locked        = 0;
    uint32_t   mismatches          = 0;
};

/**
 * Recomputes every vault address from public identifiers and reports records
 * whose tracked balance diverges from their vault
 */
reconciliation_report inspect(const ledger_database& ledger_db, const controller::config& conf);

reconciliation_row inspect_escrow(const ledger_database& ledger_db, const controller::config& conf, const address& escrow);

std::string format_report(const reconciliation_report& report, const controller::config& conf);

const char* vault_status_to_string(vault_status status);

}}  // namespace tradesafe::chain

FC_REFLECT_ENUM(tradesafe::chain::vault_status, (open)(closed)(mismatch));
FC_REFLECT(tradesafe::chain::reconciliation_row, (escrow)(escrow_id)(trade_id)(state)(fiat_paid)(sequential)
                                                  (principal_vault)(tracked)(actual)(rent)(status));
FC_REFLECT(tradesafe::chain::reconciliation_report, (rows)(escrows)(accounts_with_funds)(total_locked)(mismatches));
