/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#pragma once
#include <chrono>
#include <boost/noncopyable.hpp>
#include <fmt/format.h>
#include <tradesafe/chain/action.hpp>
#include <tradesafe/chain/addressing.hpp>
#include <tradesafe/chain/events.hpp>
#include <tradesafe/chain/ledger_database.hpp>
#include <tradesafe/chain/trace.hpp>

namespace tradesafe { namespace chain {

class controller;

class apply_context : boost::noncopyable {
public:
    apply_context(controller& con, const action& action);

public:
    void exec(action_trace& trace);

public:
    bool has_authorized(const address& party) const;

    /**
     * Re-derives the record address from its identifiers, the result is the
     * only authority accepted by the record's vaults
     */
    address get_escrow_authority(const escrow_def& escrow) const;

    address get_vault_address(const address& escrow, vault_kind kind) const;

    const time_point_sec& now() const { return _now; }

    void emit_event(escrow_event&& ev);
    const vector<escrow_event>& pending_events() const { return _pending_events; }

public:
    fmt::memory_buffer&
    get_console_buffer() {
        return _pending_console_output;
    }

private:
    void finalize_trace(action_trace& trace, const std::chrono::steady_clock::time_point& start);

public:
    controller&      control;
    ledger_database& ledger_db;
    const action&    act;

private:
    time_point_sec       _now;
    fmt::memory_buffer   _pending_console_output;
    vector<escrow_event> _pending_events;
};

}}  // namespace tradesafe::chain
