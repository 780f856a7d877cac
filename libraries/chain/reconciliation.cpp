/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#include <tradesafe/chain/reconciliation.hpp>

#include <iterator>
#include <fmt/format.h>
#include <fc/log/logger.hpp>

#include <tradesafe/chain/exceptions.hpp>
#include <tradesafe/utilities/safemath.hpp>

namespace tradesafe { namespace chain {

namespace internal {

reconciliation_row
make_row(const ledger_database& ledger_db, const controller::config& conf, const escrow_def& escrow) {
    auto row = reconciliation_row();

    row.escrow     = escrow.escrow;
    row.escrow_id  = escrow.escrow_id;
    row.trade_id   = escrow.trade_id;
    row.state      = escrow.state();
    row.fiat_paid  = escrow.fiat_paid();
    row.sequential = escrow.sequential;
    row.tracked    = escrow.tracked_balance;

    auto addrs = derive_escrow_addresses(conf.program_id, escrow.escrow_id, escrow.trade_id);
    row.principal_vault = addrs.principal_vault;

    if(addrs.escrow != escrow.escrow) {
        wlog("Escrow record: ${e} is not stored at its derived address: ${d}", ("e", escrow.escrow)("d", addrs.escrow));
        row.status = vault_status::mismatch;
        return row;
    }

    auto vault = token_account_def();
    if(ledger_db.read_account(addrs.principal_vault, conf.token_symbol.id(), vault, true /* no throw */)) {
        row.actual = vault.balance;
        row.rent   = vault.rent;
        row.status = vault_status::open;
    }
    else {
        row.status = vault_status::closed;
    }

    if(row.actual != row.tracked) {
        wlog("Balance mismatch of escrow: ${e}, tracked: ${t}, actual: ${a}",
            ("e", escrow.escrow)("t", row.tracked)("a", row.actual));
        row.status = vault_status::mismatch;
    }
    return row;
}

}  // namespace internal

reconciliation_report
inspect(const ledger_database& ledger_db, const controller::config& conf) {
    auto report = reconciliation_report();

    ledger_db.read_escrows_range(0, [&](auto&& escrow) {
        auto row = internal::make_row(ledger_db, conf, escrow);

        report.escrows += 1;
        if(row.actual > 0) {
            report.accounts_with_funds += 1;
            TRADESAFE_ASSERT2(safemath::add(report.total_locked, row.actual, report.total_locked), math_overflow_exception,
                "Total locked funds overflow");
        }
        if(row.status == vault_status::mismatch) {
            report.mismatches += 1;
        }
        report.rows.emplace_back(std::move(row));
        return true;
    });

    dlog("Inspected ${n} escrows, ${m} mismatches", ("n", report.escrows)("m", report.mismatches));
    return report;
}

reconciliation_row
inspect_escrow(const ledger_database& ledger_db, const controller::config& conf, const address& escrow) {
    auto e = escrow_def();
    ledger_db.read_escrow(escrow, e);

    return internal::make_row(ledger_db, conf, e);
}

std::string
format_report(const reconciliation_report& report, const controller::config& conf) {
    auto buf = fmt::memory_buffer();
    auto it  = std::back_inserter(buf);

    auto line = std::string(120, '=');
    fmt::format_to(it, "{}\n", line);
    fmt::format_to(it, "{:>10} | {:>10} | {:<9} | {:<4} | {:<3} | {:>16} | {:>16} | {:>10} | {}\n",
        "Escrow ID", "Trade ID", "State", "Fiat", "Seq", "Tracked", "Actual", "Rent", "Status");
    fmt::format_to(it, "{}\n", line);

    for(auto& row : report.rows) {
        fmt::format_to(it, "{:>10} | {:>10} | {:<9} | {:<4} | {:<3} | {:>16} | {:>16} | {:>10} | {}\n",
            row.escrow_id, row.trade_id, row.state, row.fiat_paid ? "Yes" : "No", row.sequential ? "Yes" : "No",
            asset(row.tracked, conf.token_symbol).to_string(), asset(row.actual, conf.token_symbol).to_string(),
            row.rent, vault_status_to_string(row.status));
        fmt::format_to(it, "  escrow: {}\n  vault:  {}\n", row.escrow, row.principal_vault);
    }

    fmt::format_to(it, "{}\n", line);
    fmt::format_to(it, "Escrows: {}, accounts with funds: {}, total locked: {}, mismatches: {}\n",
        report.escrows, report.accounts_with_funds, asset(report.total_locked, conf.token_symbol).to_string(), report.mismatches);

    return fmt::to_string(buf);
}

const char*
vault_status_to_string(vault_status status) {
    switch(status) {
    case vault_status::open:     return "Open";
    case vault_status::closed:   return "Closed";
    case vault_status::mismatch: return "MISMATCH";
    }  // switch
    return "Unknown";
}

}}  // namespace tradesafe::chain
