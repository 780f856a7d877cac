/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#pragma once
#include <tradesafe/chain/address.hpp>
#include <tradesafe/chain/escrow_object.hpp>
#include <tradesafe/chain/types.hpp>

namespace tradesafe { namespace chain {

struct event_header {
    address        escrow;
    escrow_id_type escrow_id = 0;
    trade_id_type  trade_id  = 0;
    counter_type   counter   = 0;
    counter_type   sequence  = 0;
    time_point_sec timestamp;
};

struct escrow_created : event_header {
    address    seller;
    address    buyer;
    address    arbitrator;
    share_type amount = 0;
    share_type fee    = 0;

    time_point_sec    deposit_deadline;
    bool              sequential = false;
    optional<address> sequential_address;
};

struct funds_deposited : event_header {
    share_type     amount = 0;  ///< principal plus fee
    time_point_sec fiat_deadline;
};

struct fiat_marked_paid : event_header {
    address buyer;
};

struct escrow_released : event_header {
    address    destination;
    share_type amount = 0;
    share_type fee    = 0;
};

struct escrow_cancelled : event_header {
    share_type refund    = 0;
    bool       automatic = false;
};

struct dispute_opened : event_header {
    party_role     initiator = party_role::buyer;
    address        initiator_address;
    hash_type      evidence_hash;
    share_type     bond = 0;
    time_point_sec response_deadline;
};

struct dispute_response_submitted : event_header {
    party_role     responder = party_role::buyer;
    address        responder_address;
    hash_type      evidence_hash;
    share_type     bond = 0;
    time_point_sec arbitration_deadline;
};

struct dispute_resolved : event_header {
    bool       buyer_wins = false;
    hash_type  resolution_hash;
    address    winner;
    share_type awarded = 0;
    bool       late    = false;  ///< decided after the arbitration deadline
};

struct dispute_default_judgment : event_header {
    party_role winner_role = party_role::buyer;
    address    winner;
    share_type awarded = 0;
};

using escrow_event = static_variant<escrow_created,
                                    funds_deposited,
                                    fiat_marked_paid,
                                    escrow_released,
                                    escrow_cancelled,
                                    dispute_opened,
                                    dispute_response_submitted,
                                    dispute_resolved,
                                    dispute_default_judgment>;

const event_header& get_event_header(const escrow_event& ev);
const char*         get_event_name(const escrow_event& ev);

}}  // namespace tradesafe::chain

FC_REFLECT(tradesafe::chain::event_header, (escrow)(escrow_id)(trade_id)(counter)(sequence)(timestamp));
FC_REFLECT_DERIVED(tradesafe::chain::escrow_created, (tradesafe::chain::event_header),
                   (seller)(buyer)(arbitrator)(amount)(fee)(deposit_deadline)(sequential)(sequential_address));
FC_REFLECT_DERIVED(tradesafe::chain::funds_deposited, (tradesafe::chain::event_header), (amount)(fiat_deadline));
FC_REFLECT_DERIVED(tradesafe::chain::fiat_marked_paid, (tradesafe::chain::event_header), (buyer));
FC_REFLECT_DERIVED(tradesafe::chain::escrow_released, (tradesafe::chain::event_header), (destination)(amount)(fee));
FC_REFLECT_DERIVED(tradesafe::chain::escrow_cancelled, (tradesafe::chain::event_header), (refund)(automatic));
FC_REFLECT_DERIVED(tradesafe::chain::dispute_opened, (tradesafe::chain::event_header),
                   (initiator)(initiator_address)(evidence_hash)(bond)(response_deadline));
FC_REFLECT_DERIVED(tradesafe::chain::dispute_response_submitted, (tradesafe::chain::event_header),
                   (responder)(responder_address)(evidence_hash)(bond)(arbitration_deadline));
FC_REFLECT_DERIVED(tradesafe::chain::dispute_resolved, (tradesafe::chain::event_header),
                   (buyer_wins)(resolution_hash)(winner)(awarded)(late));
FC_REFLECT_DERIVED(tradesafe::chain::dispute_default_judgment, (tradesafe::chain::event_header),
                   (winner_role)(winner)(awarded));
