/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#pragma once

namespace tradesafe { namespace chain { namespace contracts {

TRADESAFE_ACTION_IMPL_BEGIN(createescrow) {
    using namespace internal;

    auto& cact = context.act.data_as<add_clr_t<ACT>>();
    try {
        DECLARE_LEDGER_DB();

        auto& conf   = context.control.get_config();
        auto  seller = address(context.act.signer);

        check_amount(cact.amount);
        check_party_address(cact.buyer, "buyer");
        TRADESAFE_ASSERT2(cact.buyer != seller, escrow_party_exception, "Buyer and seller cannot be the same party: {}", seller);
        TRADESAFE_ASSERT2(cact.buyer != conf.arbitrator && seller != conf.arbitrator, escrow_party_exception,
            "The arbitrator: {} cannot be a party of the trade", conf.arbitrator);

        if(cact.sequential) {
            TRADESAFE_ASSERT(cact.sequential_address.has_value(), sequential_address_exception,
                "Sequential escrow requires a sequential escrow address");
            check_sequential_address(*cact.sequential_address);
        }
        else {
            TRADESAFE_ASSERT(!cact.sequential_address.has_value(), sequential_address_exception,
                "Sequential escrow address is only allowed for sequential escrows");
        }

        auto addr = derive_escrow_address(conf.program_id, cact.escrow_id, cact.trade_id);
        TRADESAFE_ASSERT2(!ledger_db.exists_escrow(addr), escrow_duplicate_exception,
            "Escrow with id: {} and trade id: {} already exists at: {}", cact.escrow_id, cact.trade_id, addr);

        charge_rent(context, seller, conf.rent_deposit);

        auto escrow               = escrow_def();
        escrow.escrow             = addr;
        escrow.escrow_id          = cact.escrow_id;
        escrow.trade_id           = cact.trade_id;
        escrow.seller             = seller;
        escrow.buyer              = cact.buyer;
        escrow.arbitrator         = conf.arbitrator;
        escrow.amount             = cact.amount;
        escrow.fee                = calculate_fee(cact.amount);
        escrow.created_time       = context.now();
        escrow.deposit_deadline   = context.now() + config::deposit_timeout_sec;
        escrow.sequential         = cact.sequential;
        escrow.sequential_address = cact.sequential_address;
        escrow.rent_payer         = seller;
        escrow.rent               = conf.rent_deposit;
        escrow.phase              = created_phase();

        auto ev = make_event<escrow_created>(context, escrow);
        ev.seller             = escrow.seller;
        ev.buyer              = escrow.buyer;
        ev.arbitrator         = escrow.arbitrator;
        ev.amount             = escrow.amount;
        ev.fee                = escrow.fee;
        ev.deposit_deadline   = escrow.deposit_deadline;
        ev.sequential         = escrow.sequential;
        ev.sequential_address = escrow.sequential_address;

        PUT_DB_ESCROW(escrow);
        context.emit_event(std::move(ev));

        ilog("Created escrow: ${e}, id: ${id}, trade: ${t}, amount: ${a}",
            ("e", addr)("id", escrow.escrow_id)("t", escrow.trade_id)("a", escrow.amount));
        CONSOLE_PRINT("created escrow {} amount: {} fee: {}\n", addr, escrow.amount, escrow.fee);
    }
    TRADESAFE_CAPTURE_AND_RETHROW(action_apply_exception);
}
TRADESAFE_ACTION_IMPL_END()

TRADESAFE_ACTION_IMPL_BEGIN(fundescrow) {
    using namespace internal;

    auto& fact = context.act.data_as<add_clr_t<ACT>>();
    try {
        DECLARE_LEDGER_DB();

        auto escrow = escrow_def();
        READ_DB_ESCROW(fact.escrow, escrow);

        check_signer(context, escrow.seller, "seller");
        check_state(escrow, escrow_state::created);
        check_before(context.now(), escrow.deposit_deadline, "deposit deadline");

        auto& conf  = context.control.get_config();
        auto  total = checked_sum(escrow.amount, escrow.fee);
        auto  vault = context.get_vault_address(escrow.escrow, vault_kind::principal);

        open_vault(context, escrow, vault_kind::principal, escrow.seller);
        transfer_tokens(context, escrow.seller, vault, asset(total, conf.token_symbol), escrow.seller);

        auto phase          = funded_phase();
        phase.fiat_deadline = context.now() + config::fiat_timeout_sec;
        phase.fiat_paid     = false;

        escrow.phase           = phase;
        escrow.tracked_balance = total;
        escrow.counter        += 1;

        auto ev = make_event<funds_deposited>(context, escrow);
        ev.amount        = total;
        ev.fiat_deadline = phase.fiat_deadline;

        PUT_DB_ESCROW(escrow);
        context.emit_event(std::move(ev));

        ilog("Funded escrow: ${e} with ${t}, fiat deadline: ${d}", ("e", escrow.escrow)("t", total)("d", phase.fiat_deadline));
        CONSOLE_PRINT("funded escrow {} with {}\n", escrow.escrow, total);
    }
    TRADESAFE_CAPTURE_AND_RETHROW(action_apply_exception);
}
TRADESAFE_ACTION_IMPL_END()

TRADESAFE_ACTION_IMPL_BEGIN(markfiatpaid) {
    using namespace internal;

    auto& mact = context.act.data_as<add_clr_t<ACT>>();
    try {
        DECLARE_LEDGER_DB();

        auto escrow = escrow_def();
        READ_DB_ESCROW(mact.escrow, escrow);

        check_signer(context, escrow.buyer, "buyer");
        check_state(escrow, escrow_state::funded);

        auto& phase = escrow.phase.get<funded_phase>();
        TRADESAFE_ASSERT2(!phase.fiat_paid, fiat_already_paid_exception, "Fiat of escrow: {} is already marked paid", escrow.escrow);
        check_before(context.now(), phase.fiat_deadline, "fiat deadline");

        phase.fiat_paid = true;

        auto ev = make_event<fiat_marked_paid>(context, escrow);
        ev.buyer = escrow.buyer;

        PUT_DB_ESCROW(escrow);
        context.emit_event(std::move(ev));

        dlog("Fiat marked paid for escrow: ${e}", ("e", escrow.escrow));
    }
    TRADESAFE_CAPTURE_AND_RETHROW(action_apply_exception);
}
TRADESAFE_ACTION_IMPL_END()

TRADESAFE_ACTION_IMPL_BEGIN(updseqaddr) {
    using namespace internal;

    auto& uact = context.act.data_as<add_clr_t<ACT>>();
    try {
        DECLARE_LEDGER_DB();

        auto escrow = escrow_def();
        READ_DB_ESCROW(uact.escrow, escrow);

        check_signer(context, escrow.buyer, "buyer");
        TRADESAFE_ASSERT2(escrow.sequential, sequential_address_exception, "Escrow: {} is not sequential", escrow.escrow);
        check_not_terminal(escrow);
        check_sequential_address(uact.new_address);

        escrow.sequential_address = uact.new_address;
        PUT_DB_ESCROW(escrow);

        dlog("Updated sequential address of escrow: ${e} to ${a}", ("e", escrow.escrow)("a", uact.new_address));
    }
    TRADESAFE_CAPTURE_AND_RETHROW(action_apply_exception);
}
TRADESAFE_ACTION_IMPL_END()

TRADESAFE_ACTION_IMPL_BEGIN(releaseesc) {
    using namespace internal;

    auto& ract = context.act.data_as<add_clr_t<ACT>>();
    try {
        DECLARE_LEDGER_DB();

        auto escrow = escrow_def();
        READ_DB_ESCROW(ract.escrow, escrow);

        check_seller_or_arbitrator(context, escrow);
        check_state(escrow, escrow_state::funded);
        TRADESAFE_ASSERT2(escrow.fiat_paid(), fiat_not_paid_exception, "Fiat of escrow: {} is not marked paid", escrow.escrow);

        auto destination = release_destination(escrow);

        pay_from_vault(context, escrow, vault_kind::principal, escrow.arbitrator, escrow.fee);
        pay_from_vault(context, escrow, vault_kind::principal, destination, escrow.amount);
        close_vault(context, escrow, vault_kind::principal);

        escrow.tracked_balance = 0;
        escrow.phase           = released_phase { destination };
        escrow.counter        += 1;

        auto ev = make_event<escrow_released>(context, escrow);
        ev.destination = destination;
        ev.amount      = escrow.amount;
        ev.fee         = escrow.fee;

        PUT_DB_ESCROW(escrow);
        context.emit_event(std::move(ev));

        ilog("Released escrow: ${e}, ${a} to ${d}", ("e", escrow.escrow)("a", escrow.amount)("d", destination));
        CONSOLE_PRINT("released escrow {} amount: {} to {}\n", escrow.escrow, escrow.amount, destination);
    }
    TRADESAFE_CAPTURE_AND_RETHROW(action_apply_exception);
}
TRADESAFE_ACTION_IMPL_END()

namespace internal {

inline void
cancel_escrow(apply_context& context, escrow_def& escrow, bool automatic) {
    DECLARE_LEDGER_DB();

    auto was_funded = (escrow.state() == escrow_state::funded);
    auto refund     = share_type(0);

    if(was_funded) {
        refund = escrow.tracked_balance;
        pay_from_vault(context, escrow, vault_kind::principal, escrow.seller, refund);
        close_vault(context, escrow, vault_kind::principal);
    }

    escrow.tracked_balance = 0;
    escrow.phase           = cancelled_phase { was_funded, automatic };
    escrow.counter        += 1;

    auto ev = make_event<escrow_cancelled>(context, escrow);
    ev.refund    = refund;
    ev.automatic = automatic;

    PUT_DB_ESCROW(escrow);
    context.emit_event(std::move(ev));

    ilog("Cancelled escrow: ${e}, refund: ${r}, automatic: ${a}", ("e", escrow.escrow)("r", refund)("a", automatic));
}

}  // namespace internal

TRADESAFE_ACTION_IMPL_BEGIN(cancelescrow) {
    using namespace internal;

    auto& cact = context.act.data_as<add_clr_t<ACT>>();
    try {
        DECLARE_LEDGER_DB();

        auto escrow = escrow_def();
        READ_DB_ESCROW(cact.escrow, escrow);

        check_seller_or_arbitrator(context, escrow);
        TRADESAFE_ASSERT2(escrow.state() == escrow_state::created || escrow.state() == escrow_state::funded,
            invalid_transition_exception, "Escrow: {} cannot be cancelled when it's {}", escrow.escrow, escrow.state());
        TRADESAFE_ASSERT2(!escrow.fiat_paid(), fiat_already_paid_exception,
            "Escrow: {} cannot be cancelled after fiat is marked paid", escrow.escrow);

        cancel_escrow(context, escrow, false /* automatic */);
    }
    TRADESAFE_CAPTURE_AND_RETHROW(action_apply_exception);
}
TRADESAFE_ACTION_IMPL_END()

TRADESAFE_ACTION_IMPL_BEGIN(autocancel) {
    using namespace internal;

    auto& aact = context.act.data_as<add_clr_t<ACT>>();
    try {
        DECLARE_LEDGER_DB();

        auto escrow = escrow_def();
        READ_DB_ESCROW(aact.escrow, escrow);

        check_signer(context, escrow.arbitrator, "arbitrator");
        check_not_terminal(escrow);

        switch(escrow.state()) {
        case escrow_state::created: {
            check_after(context.now(), escrow.deposit_deadline, "deposit deadline");
            break;
        }
        case escrow_state::funded: {
            auto& phase = escrow.phase.get<funded_phase>();
            TRADESAFE_ASSERT2(!phase.fiat_paid, fiat_already_paid_exception,
                "Escrow: {} cannot be cancelled after fiat is marked paid", escrow.escrow);
            check_after(context.now(), phase.fiat_deadline, "fiat deadline");
            break;
        }
        default: {
            TRADESAFE_THROW2(invalid_transition_exception, "Escrow: {} cannot be cancelled when it's {}", escrow.escrow, escrow.state());
        }
        }  // switch

        cancel_escrow(context, escrow, true /* automatic */);
    }
    TRADESAFE_CAPTURE_AND_RETHROW(action_apply_exception);
}
TRADESAFE_ACTION_IMPL_END()

TRADESAFE_ACTION_IMPL_BEGIN(closeescrow) {
    using namespace internal;

    auto& cact = context.act.data_as<add_clr_t<ACT>>();
    try {
        DECLARE_LEDGER_DB();

        auto escrow = escrow_def();
        READ_DB_ESCROW(cact.escrow, escrow);

        check_seller_or_arbitrator(context, escrow);
        TRADESAFE_ASSERT2(escrow.is_terminal(), escrow_not_terminal_exception,
            "Escrow: {} is {} and cannot be closed", escrow.escrow, escrow.state());

        for(auto kind : { vault_kind::principal, vault_kind::buyer_bond, vault_kind::seller_bond }) {
            TRADESAFE_ASSERT2(!vault_exists(context, escrow, kind), escrow_not_terminal_exception,
                "The {} vault of escrow: {} is still open", kind, escrow.escrow);
        }

        ledger_db.remove_escrow(escrow.escrow);
        refund_rent(context, escrow.rent_payer, escrow.rent);

        ilog("Closed escrow: ${e}", ("e", escrow.escrow));
    }
    TRADESAFE_CAPTURE_AND_RETHROW(action_apply_exception);
}
TRADESAFE_ACTION_IMPL_END()

TRADESAFE_ACTION_IMPL_BEGIN(transferft) {
    using namespace internal;

    auto& tfact = context.act.data_as<add_clr_t<ACT>>();
    try {
        auto& conf = context.control.get_config();

        TRADESAFE_ASSERT2(tfact.number.sym() == conf.token_symbol || tfact.number.sym() == native_sym(), asset_type_exception,
            "Symbol: {} is not handled by this ledger", tfact.number.sym());
        TRADESAFE_ASSERT(tfact.number.amount() > 0, asset_type_exception, "Transfer amount must be positive");
        check_address_reserved(tfact.to);

        // party wallets are their own authority, vault authority is never held by a signer
        transfer_tokens(context, tfact.from, tfact.to, tfact.number, address(context.act.signer));

        dlog("Transferred ${n} from ${f} to ${t}", ("n", tfact.number)("f", tfact.from)("t", tfact.to));
    }
    TRADESAFE_CAPTURE_AND_RETHROW(action_apply_exception);
}
TRADESAFE_ACTION_IMPL_END()

}}}  // namespace tradesafe::chain::contracts
