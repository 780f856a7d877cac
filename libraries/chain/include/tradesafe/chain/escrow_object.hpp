/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#pragma once
#include <fmt/format.h>
#include <tradesafe/chain/address.hpp>
#include <tradesafe/chain/asset.hpp>
#include <tradesafe/chain/types.hpp>

namespace tradesafe { namespace chain {

enum class escrow_state : uint8_t {
    created = 0,
    funded,
    released,
    cancelled,
    disputed,
    resolved
};

enum class party_role : uint8_t {
    buyer = 0,
    seller
};

/**
 * Bonded evidence exchange, only present while disputed or after resolution
 */
struct dispute_def {
    party_role     initiator = party_role::buyer;
    address        initiator_address;
    time_point_sec initiated_time;
    time_point_sec response_deadline;

    share_type bond = 0;  ///< posted by each participating party

    optional<hash_type>      buyer_evidence;
    optional<hash_type>      seller_evidence;
    optional<time_point_sec> arbitration_deadline;  ///< set once the other party responds

    bool
    responded() const {
        return buyer_evidence.has_value() && seller_evidence.has_value();
    }

    const optional<hash_type>&
    evidence_of(party_role role) const {
        return role == party_role::buyer ? buyer_evidence : seller_evidence;
    }

    optional<hash_type>&
    evidence_of(party_role role) {
        return role == party_role::buyer ? buyer_evidence : seller_evidence;
    }
};

struct created_phase {};

struct funded_phase {
    time_point_sec fiat_deadline;
    bool           fiat_paid = false;
};

struct released_phase {
    address destination;
};

struct cancelled_phase {
    bool was_funded = false;
    bool automatic  = false;
};

struct disputed_phase {
    time_point_sec fiat_deadline;
    dispute_def    dispute;
};

struct resolved_phase {
    dispute_def dispute;
    bool        buyer_wins = false;
    bool        by_default = false;

    optional<hash_type> resolution_hash;  ///< absent for default judgment
};

// order follows escrow_state
using escrow_phase = static_variant<created_phase,
                                    funded_phase,
                                    released_phase,
                                    cancelled_phase,
                                    disputed_phase,
                                    resolved_phase>;

/**
 * One trade leg, keyed by its derived record address
 */
struct escrow_def {
    address        escrow;
    escrow_id_type escrow_id = 0;
    trade_id_type  trade_id  = 0;

    address seller;
    address buyer;
    address arbitrator;

    share_type amount = 0;
    share_type fee    = 0;

    time_point_sec created_time;
    time_point_sec deposit_deadline;

    bool              sequential = false;
    optional<address> sequential_address;

    counter_type counter  = 0;  ///< value-moving transitions
    counter_type sequence = 0;  ///< emitted events

    share_type tracked_balance = 0;  ///< expected balance of the principal vault
    address    rent_payer;
    share_type rent = 0;

    escrow_phase phase;

public:
    escrow_state state() const { return (escrow_state)phase.which(); }

    bool is_terminal() const;
    bool fiat_paid() const;

    optional<time_point_sec> fiat_deadline() const;

    const dispute_def* dispute() const;
    dispute_def*       dispute();

    share_type bond_amount() const;
    const address& party(party_role role) const;
};

/**
 * Token account held by the ledger, either a party wallet or a custody vault
 */
struct token_account_def {
    address    addr;
    address    authority;  ///< only this address may move funds out
    symbol     sym;
    share_type balance = 0;

    address    rent_payer;
    share_type rent = 0;
};

const char* escrow_state_to_string(escrow_state state);
const char* party_role_to_string(party_role role);

}}  // namespace tradesafe::chain

namespace fmt {

template <>
struct formatter<tradesafe::chain::escrow_state> : formatter<std::string> {
    template <typename FormatContext>
    auto format(tradesafe::chain::escrow_state s, FormatContext& ctx) const {
        return formatter<std::string>::format(tradesafe::chain::escrow_state_to_string(s), ctx);
    }
};

template <>
struct formatter<tradesafe::chain::party_role> : formatter<std::string> {
    template <typename FormatContext>
    auto format(tradesafe::chain::party_role r, FormatContext& ctx) const {
        return formatter<std::string>::format(tradesafe::chain::party_role_to_string(r), ctx);
    }
};

}  // namespace fmt

FC_REFLECT_ENUM(tradesafe::chain::escrow_state, (created)(funded)(released)(cancelled)(disputed)(resolved));
FC_REFLECT_ENUM(tradesafe::chain::party_role, (buyer)(seller));

FC_REFLECT(tradesafe::chain::dispute_def, (initiator)(initiator_address)(initiated_time)(response_deadline)(bond)
                                           (buyer_evidence)(seller_evidence)(arbitration_deadline));
FC_REFLECT(tradesafe::chain::created_phase, );
FC_REFLECT(tradesafe::chain::funded_phase, (fiat_deadline)(fiat_paid));
FC_REFLECT(tradesafe::chain::released_phase, (destination));
FC_REFLECT(tradesafe::chain::cancelled_phase, (was_funded)(automatic));
FC_REFLECT(tradesafe::chain::disputed_phase, (fiat_deadline)(dispute));
FC_REFLECT(tradesafe::chain::resolved_phase, (dispute)(buyer_wins)(by_default)(resolution_hash));

FC_REFLECT(tradesafe::chain::escrow_def, (escrow)(escrow_id)(trade_id)(seller)(buyer)(arbitrator)(amount)(fee)
                                          (created_time)(deposit_deadline)(sequential)(sequential_address)
                                          (counter)(sequence)(tracked_balance)(rent_payer)(rent)(phase));
FC_REFLECT(tradesafe::chain::token_account_def, (addr)(authority)(sym)(balance)(rent_payer)(rent));
