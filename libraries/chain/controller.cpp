/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#include <tradesafe/chain/controller.hpp>

#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>
#include <fc/reflect/variant.hpp>

#include <tradesafe/chain/apply_context.hpp>
#include <tradesafe/chain/exceptions.hpp>
#include <tradesafe/chain/execution_context_impl.hpp>

namespace tradesafe { namespace chain {

static inline void
print_debug(const action_trace& ar) {
    if(!ar.console.empty()) {
        auto prefix = fmt::format("\n[{}, {}]", ar.act.name, (std::string)ar.act.signer);
        dlog(prefix + ": CONSOLE OUTPUT BEGIN =====================\n"
             + ar.console
             + prefix + ": CONSOLE OUTPUT END   =====================" );
    }
}

struct controller_impl {
    controller&              self;
    controller::config       conf;
    const time_source&       clock;
    ledger_database          ledger_db;
    escrow_execution_context exec_ctx;

    controller_impl(const controller::config& cfg, controller& s, const time_source& clock)
        : self(s)
        , conf(cfg)
        , clock(clock)
        , ledger_db(cfg.ledger_db_config) {
        TRADESAFE_ASSERT(conf.arbitrator != public_key_type(), config_exception, "Arbitrator key must be configured");
        TRADESAFE_ASSERT2(conf.token_symbol.precision() == chain::config::token_precision, config_exception,
            "Token symbol must have precision of {}, provided: {}", chain::config::token_precision, conf.token_symbol);
        TRADESAFE_ASSERT2(conf.token_symbol != native_sym(), config_exception,
            "Token symbol cannot be the native symbol: {}", conf.token_symbol);
    }

    /**
     *  Observers run after the operation has committed, a failing observer
     *  is logged and must not turn a committed operation into an error.
     */
    template <typename Signal, typename Arg>
    void
    emit(const Signal& s, Arg&& a) {
        try {
            s(std::forward<Arg>(a));
        }
        catch(fc::exception& e) {
            wlog("${details}", ("details", e.to_detail_string()));
        }
        catch(std::exception& e) {
            wlog("signal handler threw exception: ${what}", ("what", e.what()));
        }
    }

    action_trace
    push_action(const action& act) {
        auto trace   = action_trace();
        auto session = ledger_db.new_savepoint_session();

        try {
            auto ctx = apply_context(self, act);
            ctx.exec(trace);
        }
        catch(fc::exception& e) {
            elog("Action: ${n} signed by ${s} failed: ${e}", ("n", act.name)("s", act.signer)("e", e.to_string()));
            throw;
        }

        session.commit();

        if(conf.contracts_console) {
            print_debug(trace);
        }
        for(auto& ev : trace.events) {
            emit(self.emitted_event, ev);
        }
        emit(self.applied_action, trace);

        return trace;
    }
};

controller::controller(const controller::config& cfg, const time_source& clock)
    : my(new controller_impl(cfg, *this, clock)) {}

controller::~controller() {
    my->ledger_db.close();
}

void
controller::startup() {
    my->ledger_db.open();
    ilog("Escrow ledger started, arbitrator: ${a}, token: ${t}", ("a", my->conf.arbitrator)("t", my->conf.token_symbol));
}

void
controller::shutdown() {
    my->ledger_db.close();
}

controller::config
controller::load_config(const fc::path& file) {
    try {
        TRADESAFE_ASSERT(fc::exists(file), config_exception, "Config file: ${f} doesn't exist", ("f", file));
        return fc::json::from_file(file).as<controller::config>();
    }
    TRADESAFE_CAPTURE_AND_RETHROW(config_exception, (file));
}

action_trace
controller::push_action(const action& act) {
    TRADESAFE_ASSERT(my->ledger_db.is_open(), database_exception, "Controller is not started");
    return my->push_action(act);
}

ledger_database&
controller::ledger_db() const {
    return my->ledger_db;
}

execution_context&
controller::get_execution_context() const {
    return my->exec_ctx;
}

const controller::config&
controller::get_config() const {
    return my->conf;
}

const time_source&
controller::clock() const {
    return my->clock;
}

bool
controller::contracts_console() const {
    return my->conf.contracts_console;
}

escrow_addresses
controller::get_escrow_addresses(escrow_id_type escrow_id, trade_id_type trade_id) const {
    return derive_escrow_addresses(my->conf.program_id, escrow_id, trade_id);
}

escrow_def
controller::get_escrow(const address& addr) const {
    auto escrow = escrow_def();
    my->ledger_db.read_escrow(addr, escrow);
    return escrow;
}

optional<escrow_def>
controller::find_escrow(const address& addr) const {
    auto escrow = escrow_def();
    if(!my->ledger_db.read_escrow(addr, escrow, true /* no throw */)) {
        return std::nullopt;
    }
    return escrow;
}

optional<token_account_def>
controller::find_account(const address& addr, const symbol& sym) const {
    auto account = token_account_def();
    if(!my->ledger_db.read_account(addr, sym.id(), account, true /* no throw */)) {
        return std::nullopt;
    }
    return account;
}

asset
controller::get_balance(const address& addr, const symbol& sym) const {
    auto account = find_account(addr, sym);
    if(!account.has_value()) {
        return asset(0, sym);
    }
    return asset(account->balance, sym);
}

asset
controller::get_native_balance(const address& addr) const {
    return get_balance(addr, native_sym());
}

}}  // namespace tradesafe::chain
