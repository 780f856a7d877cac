/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#include <tradesafe/chain/escrow_object.hpp>
#include <tradesafe/chain/config.hpp>
#include <tradesafe/chain/exceptions.hpp>
#include <tradesafe/utilities/safemath.hpp>

namespace tradesafe { namespace chain {

bool
escrow_def::is_terminal() const {
    switch(state()) {
    case escrow_state::released:
    case escrow_state::cancelled:
    case escrow_state::resolved: {
        return true;
    }
    default: {
        return false;
    }
    }  // switch
}

bool
escrow_def::fiat_paid() const {
    switch(state()) {
    case escrow_state::funded: {
        return phase.get<funded_phase>().fiat_paid;
    }
    case escrow_state::released:
    case escrow_state::disputed:
    case escrow_state::resolved: {
        return true;
    }
    default: {
        return false;
    }
    }  // switch
}

optional<time_point_sec>
escrow_def::fiat_deadline() const {
    switch(state()) {
    case escrow_state::funded: {
        return phase.get<funded_phase>().fiat_deadline;
    }
    case escrow_state::disputed: {
        return phase.get<disputed_phase>().fiat_deadline;
    }
    default: {
        return std::nullopt;
    }
    }  // switch
}

const dispute_def*
escrow_def::dispute() const {
    switch(state()) {
    case escrow_state::disputed: {
        return &phase.get<disputed_phase>().dispute;
    }
    case escrow_state::resolved: {
        return &phase.get<resolved_phase>().dispute;
    }
    default: {
        return nullptr;
    }
    }  // switch
}

dispute_def*
escrow_def::dispute() {
    return const_cast<dispute_def*>(static_cast<const escrow_def*>(this)->dispute());
}

share_type
escrow_def::bond_amount() const {
    auto bond = share_type();
    TRADESAFE_ASSERT2(safemath::bps_of(amount, config::bond_bps, bond), math_overflow_exception,
        "Bond of amount: {} overflows", amount);
    return bond;
}

const address&
escrow_def::party(party_role role) const {
    return role == party_role::buyer ? buyer : seller;
}

const char*
escrow_state_to_string(escrow_state state) {
    switch(state) {
    case escrow_state::created:   return "Created";
    case escrow_state::funded:    return "Funded";
    case escrow_state::released:  return "Released";
    case escrow_state::cancelled: return "Cancelled";
    case escrow_state::disputed:  return "Disputed";
    case escrow_state::resolved:  return "Resolved";
    }  // switch
    return "Unknown";
}

const char*
party_role_to_string(party_role role) {
    return role == party_role::buyer ? "buyer" : "seller";
}

}}  // namespace tradesafe::chain
