/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#pragma once
#include <functional>
#include <memory>
#include <boost/signals2/signal.hpp>
#include <tradesafe/chain/addressing.hpp>
#include <tradesafe/chain/asset.hpp>
#include <tradesafe/chain/config.hpp>
#include <tradesafe/chain/escrow_object.hpp>
#include <tradesafe/chain/events.hpp>
#include <tradesafe/chain/ledger_database.hpp>
#include <tradesafe/chain/time_source.hpp>
#include <tradesafe/chain/trace.hpp>

namespace tradesafe { namespace chain {

class apply_context;
class execution_context;

struct controller_impl;
using boost::signals2::signal;

/**
 * Owns the ledger database and applies one operation at a time.
 * Each operation runs inside its own savepoint session: it either commits
 * with all its writes and events, or leaves no trace at all.
 */
class controller {
public:
    struct config {
        public_key_type arbitrator;
        program_id_type program_id;
        symbol          token_symbol      = symbol(chain::config::token_precision, chain::config::token_symbol_id);
        share_type      rent_deposit      = chain::config::default_rent_deposit;
        bool            contracts_console = false;

        ledger_database::config ledger_db_config;
    };

    controller(const config& cfg, const time_source& clock);
    ~controller();

    void startup();
    void shutdown();

    static config load_config(const fc::path& file);

    /**
     * Applies the action atomically, publishes its events once committed and
     * returns the trace. Failures are rethrown after every write is undone.
     */
    action_trace push_action(const action& act);

public:
    ledger_database&   ledger_db() const;
    execution_context& get_execution_context() const;

    const config&      get_config() const;
    const time_source& clock() const;

    bool contracts_console() const;

public:
    escrow_addresses   get_escrow_addresses(escrow_id_type escrow_id, trade_id_type trade_id) const;
    escrow_def         get_escrow(const address& addr) const;
    optional<escrow_def> find_escrow(const address& addr) const;

    asset get_balance(const address& addr, const symbol& sym) const;
    asset get_native_balance(const address& addr) const;

    optional<token_account_def> find_account(const address& addr, const symbol& sym) const;

public:
    signal<void(const escrow_event&)> emitted_event;
    signal<void(const action_trace&)> applied_action;

private:
    std::unique_ptr<controller_impl> my;
};

}}  // namespace tradesafe::chain

FC_REFLECT(tradesafe::chain::controller::config, (arbitrator)(program_id)(token_symbol)(rent_deposit)(contracts_console)(ledger_db_config));
