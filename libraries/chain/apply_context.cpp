/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#include <tradesafe/chain/apply_context.hpp>

#include <tradesafe/chain/controller.hpp>
#include <tradesafe/chain/execution_context_impl.hpp>
#include <tradesafe/chain/contracts/escrow_contract.hpp>

namespace tradesafe { namespace chain {

apply_context::apply_context(controller& con, const action& action)
    : control(con)
    , ledger_db(con.ledger_db())
    , act(action)
    , _now(con.clock().now()) {}

void
apply_context::exec(action_trace& trace) {
    using namespace contracts;

    auto start = std::chrono::steady_clock::now();

    trace.act          = act;
    trace.applied_time = _now;

    try {
        auto& exec_ctx = static_cast<escrow_execution_context&>(control.get_execution_context());
        if(act.index_ == -1) {
            act.index_ = exec_ctx.index_of(act.name);
        }
        exec_ctx.invoke<apply_action, void>(act.index_, *this);
    }
    FC_RETHROW_EXCEPTIONS(warn, "pending console output: ${console}", ("console", fmt::to_string(_pending_console_output)));

    finalize_trace(trace, start);
}

void
apply_context::finalize_trace(action_trace& trace, const std::chrono::steady_clock::time_point& start) {
    using namespace std::chrono;

    trace.console = fmt::to_string(_pending_console_output);
    trace.elapsed = fc::microseconds(duration_cast<microseconds>(steady_clock::now() - start).count());
    trace.events  = std::move(_pending_events);
}

bool
apply_context::has_authorized(const address& party) const {
    return party == act.signer;
}

address
apply_context::get_escrow_authority(const escrow_def& escrow) const {
    auto addr = derive_escrow_address(control.get_config().program_id, escrow.escrow_id, escrow.trade_id);
    TRADESAFE_ASSERT2(addr == escrow.escrow, vault_authority_exception,
        "Escrow record address: {} doesn't match its derived address: {}", escrow.escrow, addr);
    return addr;
}

address
apply_context::get_vault_address(const address& escrow, vault_kind kind) const {
    return derive_vault_address(control.get_config().program_id, escrow, kind);
}

void
apply_context::emit_event(escrow_event&& ev) {
    _pending_events.emplace_back(std::move(ev));
}

}}  // namespace tradesafe::chain
