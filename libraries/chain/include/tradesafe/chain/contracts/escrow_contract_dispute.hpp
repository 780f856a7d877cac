/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#pragma once

namespace tradesafe { namespace chain { namespace contracts {

namespace internal {

inline vault_kind
bond_vault_of(party_role role) {
    return role == party_role::buyer ? vault_kind::buyer_bond : vault_kind::seller_bond;
}

inline party_role
counterparty_of(party_role role) {
    return role == party_role::buyer ? party_role::seller : party_role::buyer;
}

inline party_role
signer_role(const apply_context& context, const escrow_def& escrow) {
    if(context.has_authorized(escrow.buyer)) {
        return party_role::buyer;
    }
    else if(context.has_authorized(escrow.seller)) {
        return party_role::seller;
    }
    TRADESAFE_THROW2(escrow_authorization_exception, "Only the buyer: {} or the seller: {} can take part in a dispute",
        escrow.buyer, escrow.seller);
}

inline void
init_bond_vault(apply_context& context, const escrow_def& escrow, party_role role) {
    TRADESAFE_ASSERT2(escrow.state() == escrow_state::funded || escrow.state() == escrow_state::disputed,
        invalid_transition_exception, "Bond vaults of escrow: {} cannot be initialized when it's {}", escrow.escrow, escrow.state());
    open_vault(context, escrow, bond_vault_of(role), escrow.party(role));
}

/**
 * Moves the bond of `role` into its vault. The vault is opened on first use,
 * a vault opened earlier keeps any stray deposit until it is closed.
 */
inline void
post_bond(apply_context& context, const escrow_def& escrow, party_role role, share_type bond) {
    DECLARE_LEDGER_DB();

    auto& conf  = context.control.get_config();
    auto  kind  = bond_vault_of(role);
    auto  vault = context.get_vault_address(escrow.escrow, kind);
    auto& party = escrow.party(role);

    auto acc = token_account_def();
    if(ledger_db.read_account(vault, conf.token_symbol.id(), acc, true /* no throw */)) {
        TRADESAFE_ASSERT2(acc.authority == context.get_escrow_authority(escrow), vault_reinit_exception,
            "The {} vault: {} of escrow: {} has a different authority: {}", kind, vault, escrow.escrow, acc.authority);
    }
    else {
        open_vault(context, escrow, kind, party);
    }

    if(bond == 0) {
        return;
    }
    transfer_tokens(context, party, vault, asset(bond, conf.token_symbol), party);
}

/**
 * Pays out principal, fee and bonds once a dispute is decided and closes
 * all three vaults. Returns the total awarded to the winner.
 */
inline share_type
settle_dispute(apply_context& context, escrow_def& escrow, bool buyer_wins) {
    auto& dispute = *escrow.dispute();

    auto buyer_bond  = dispute.buyer_evidence.has_value() ? dispute.bond : 0;
    auto seller_bond = dispute.seller_evidence.has_value() ? dispute.bond : 0;
    auto awarded     = share_type(0);

    if(buyer_wins) {
        auto& destination = release_destination(escrow);

        pay_from_vault(context, escrow, vault_kind::principal, escrow.arbitrator, escrow.fee);
        pay_from_vault(context, escrow, vault_kind::principal, destination, escrow.amount);
        pay_from_vault(context, escrow, vault_kind::buyer_bond, escrow.buyer, buyer_bond);
        pay_from_vault(context, escrow, vault_kind::seller_bond, escrow.arbitrator, seller_bond);

        awarded = checked_sum(escrow.amount, buyer_bond);
    }
    else {
        auto principal = checked_sum(escrow.amount, escrow.fee);

        pay_from_vault(context, escrow, vault_kind::principal, escrow.seller, principal);
        pay_from_vault(context, escrow, vault_kind::seller_bond, escrow.seller, seller_bond);
        pay_from_vault(context, escrow, vault_kind::buyer_bond, escrow.arbitrator, buyer_bond);

        awarded = checked_sum(principal, seller_bond);
    }

    close_vault(context, escrow, vault_kind::principal);
    close_vault(context, escrow, vault_kind::buyer_bond);
    close_vault(context, escrow, vault_kind::seller_bond);

    escrow.tracked_balance = 0;
    return awarded;
}

inline dispute_def&
check_disputed(escrow_def& escrow) {
    TRADESAFE_ASSERT2(escrow.state() == escrow_state::disputed, dispute_state_exception,
        "Escrow: {} is {} and has no open dispute", escrow.escrow, escrow.state());
    return *escrow.dispute();
}

}  // namespace internal

TRADESAFE_ACTION_IMPL_BEGIN(initbuyerbond) {
    using namespace internal;

    auto& iact = context.act.data_as<add_clr_t<ACT>>();
    try {
        DECLARE_LEDGER_DB();

        auto escrow = escrow_def();
        READ_DB_ESCROW(iact.escrow, escrow);

        check_signer(context, escrow.buyer, "buyer");
        init_bond_vault(context, escrow, party_role::buyer);
    }
    TRADESAFE_CAPTURE_AND_RETHROW(action_apply_exception);
}
TRADESAFE_ACTION_IMPL_END()

TRADESAFE_ACTION_IMPL_BEGIN(initsellerbnd) {
    using namespace internal;

    auto& iact = context.act.data_as<add_clr_t<ACT>>();
    try {
        DECLARE_LEDGER_DB();

        auto escrow = escrow_def();
        READ_DB_ESCROW(iact.escrow, escrow);

        check_signer(context, escrow.seller, "seller");
        init_bond_vault(context, escrow, party_role::seller);
    }
    TRADESAFE_CAPTURE_AND_RETHROW(action_apply_exception);
}
TRADESAFE_ACTION_IMPL_END()

TRADESAFE_ACTION_IMPL_BEGIN(opendispute) {
    using namespace internal;

    auto& oact = context.act.data_as<add_clr_t<ACT>>();
    try {
        DECLARE_LEDGER_DB();

        auto escrow = escrow_def();
        READ_DB_ESCROW(oact.escrow, escrow);

        auto role = signer_role(context, escrow);

        TRADESAFE_ASSERT2(escrow.state() != escrow_state::disputed, dispute_state_exception,
            "Dispute of escrow: {} is already opened", escrow.escrow);
        check_state(escrow, escrow_state::funded);
        TRADESAFE_ASSERT2(escrow.fiat_paid(), fiat_not_paid_exception,
            "Dispute of escrow: {} cannot be opened before fiat is marked paid", escrow.escrow);

        auto hash = check_hash(oact.evidence_hash, "evidence hash");
        auto bond = escrow.bond_amount();

        post_bond(context, escrow, role, bond);

        auto dispute              = dispute_def();
        dispute.initiator         = role;
        dispute.initiator_address = escrow.party(role);
        dispute.initiated_time    = context.now();
        dispute.response_deadline = context.now() + config::dispute_response_sec;
        dispute.bond              = bond;
        dispute.evidence_of(role) = hash;

        auto phase          = disputed_phase();
        phase.fiat_deadline = *escrow.fiat_deadline();
        phase.dispute       = dispute;
        escrow.phase        = phase;

        auto ev = make_event<dispute_opened>(context, escrow);
        ev.initiator         = role;
        ev.initiator_address = dispute.initiator_address;
        ev.evidence_hash     = hash;
        ev.bond              = bond;
        ev.response_deadline = dispute.response_deadline;

        PUT_DB_ESCROW(escrow);
        context.emit_event(std::move(ev));

        ilog("Dispute opened on escrow: ${e} by ${r}, bond: ${b}", ("e", escrow.escrow)("r", party_role_to_string(role))("b", bond));
        CONSOLE_PRINT("dispute opened on escrow {} by {}\n", escrow.escrow, role);
    }
    TRADESAFE_CAPTURE_AND_RETHROW(action_apply_exception);
}
TRADESAFE_ACTION_IMPL_END()

TRADESAFE_ACTION_IMPL_BEGIN(respdispute) {
    using namespace internal;

    auto& ract = context.act.data_as<add_clr_t<ACT>>();
    try {
        DECLARE_LEDGER_DB();

        auto escrow = escrow_def();
        READ_DB_ESCROW(ract.escrow, escrow);

        auto& dispute = check_disputed(escrow);
        auto  role    = counterparty_of(dispute.initiator);

        check_signer(context, escrow.party(role), party_role_to_string(role));
        TRADESAFE_ASSERT2(!dispute.responded(), dispute_state_exception,
            "Dispute of escrow: {} is already responded", escrow.escrow);
        check_before(context.now(), dispute.response_deadline, "dispute response deadline");

        auto hash = check_hash(ract.evidence_hash, "evidence hash");
        TRADESAFE_ASSERT2(hash != *dispute.evidence_of(dispute.initiator), evidence_hash_exception,
            "Response evidence of escrow: {} must differ from the initiator's evidence", escrow.escrow);

        post_bond(context, escrow, role, dispute.bond);

        dispute.evidence_of(role)    = hash;
        dispute.arbitration_deadline = context.now() + config::dispute_arbitration_sec;

        auto ev = make_event<dispute_response_submitted>(context, escrow);
        ev.responder            = role;
        ev.responder_address    = escrow.party(role);
        ev.evidence_hash        = hash;
        ev.bond                 = dispute.bond;
        ev.arbitration_deadline = *dispute.arbitration_deadline;

        PUT_DB_ESCROW(escrow);
        context.emit_event(std::move(ev));

        ilog("Dispute of escrow: ${e} responded by ${r}", ("e", escrow.escrow)("r", party_role_to_string(role)));
    }
    TRADESAFE_CAPTURE_AND_RETHROW(action_apply_exception);
}
TRADESAFE_ACTION_IMPL_END()

TRADESAFE_ACTION_IMPL_BEGIN(resolvedisp) {
    using namespace internal;

    auto& ract = context.act.data_as<add_clr_t<ACT>>();
    try {
        DECLARE_LEDGER_DB();

        auto escrow = escrow_def();
        READ_DB_ESCROW(ract.escrow, escrow);

        check_signer(context, escrow.arbitrator, "arbitrator");

        auto& dispute = check_disputed(escrow);
        TRADESAFE_ASSERT2(dispute.responded(), dispute_state_exception,
            "Dispute of escrow: {} can only be resolved once both parties submitted evidence", escrow.escrow);

        auto hash = check_hash(ract.explanation_hash, "explanation hash");

        auto late = context.now() > *dispute.arbitration_deadline;
        if(late) {
            wlog("Resolving dispute of escrow: ${e} after the arbitration deadline: ${d}",
                ("e", escrow.escrow)("d", *dispute.arbitration_deadline));
        }

        auto settled = dispute;
        auto awarded = settle_dispute(context, escrow, ract.buyer_wins);
        auto winner  = ract.buyer_wins ? release_destination(escrow) : escrow.seller;

        auto phase            = resolved_phase();
        phase.dispute         = settled;
        phase.buyer_wins      = ract.buyer_wins;
        phase.by_default      = false;
        phase.resolution_hash = hash;

        escrow.phase    = phase;
        escrow.counter += 1;

        auto ev = make_event<dispute_resolved>(context, escrow);
        ev.buyer_wins      = ract.buyer_wins;
        ev.resolution_hash = hash;
        ev.winner          = winner;
        ev.awarded         = awarded;
        ev.late            = late;

        PUT_DB_ESCROW(escrow);
        context.emit_event(std::move(ev));

        ilog("Resolved dispute of escrow: ${e}, buyer wins: ${b}, awarded: ${a}",
            ("e", escrow.escrow)("b", ract.buyer_wins)("a", awarded));
        CONSOLE_PRINT("resolved dispute of escrow {} buyer wins: {}\n", escrow.escrow, ract.buyer_wins);
    }
    TRADESAFE_CAPTURE_AND_RETHROW(action_apply_exception);
}
TRADESAFE_ACTION_IMPL_END()

TRADESAFE_ACTION_IMPL_BEGIN(defaultjudge) {
    using namespace internal;

    auto& dact = context.act.data_as<add_clr_t<ACT>>();
    try {
        DECLARE_LEDGER_DB();

        auto escrow = escrow_def();
        READ_DB_ESCROW(dact.escrow, escrow);

        check_signer(context, escrow.arbitrator, "arbitrator");

        auto& dispute = check_disputed(escrow);
        TRADESAFE_ASSERT2(!dispute.responded(), dispute_state_exception,
            "Dispute of escrow: {} is responded and must be resolved with an explanation", escrow.escrow);
        TRADESAFE_ASSERT2(dispute.evidence_of(dispute.initiator).has_value(), dispute_state_exception,
            "Neither party of escrow: {} submitted evidence", escrow.escrow);
        check_after(context.now(), dispute.response_deadline, "dispute response deadline");

        auto winner_role = dispute.initiator;
        auto buyer_wins  = (winner_role == party_role::buyer);

        auto settled = dispute;
        auto awarded = settle_dispute(context, escrow, buyer_wins);
        auto winner  = buyer_wins ? release_destination(escrow) : escrow.seller;

        auto phase       = resolved_phase();
        phase.dispute    = settled;
        phase.buyer_wins = buyer_wins;
        phase.by_default = true;

        escrow.phase    = phase;
        escrow.counter += 1;

        auto ev = make_event<dispute_default_judgment>(context, escrow);
        ev.winner_role = winner_role;
        ev.winner      = winner;
        ev.awarded     = awarded;

        PUT_DB_ESCROW(escrow);
        context.emit_event(std::move(ev));

        ilog("Default judgment on escrow: ${e} for the ${r}, awarded: ${a}",
            ("e", escrow.escrow)("r", party_role_to_string(winner_role))("a", awarded));
    }
    TRADESAFE_CAPTURE_AND_RETHROW(action_apply_exception);
}
TRADESAFE_ACTION_IMPL_END()

}}}  // namespace tradesafe::chain::contracts
