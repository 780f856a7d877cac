/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#pragma once

#include <tradesafe/chain/address.hpp>
#include <tradesafe/chain/asset.hpp>
#include <tradesafe/chain/config.hpp>
#include <tradesafe/chain/escrow_object.hpp>
#include <tradesafe/chain/types.hpp>

namespace tradesafe { namespace chain { namespace contracts {

#define TRADESAFE_ACTION(actname)                          \
    actname() = default;                                  \
                                                          \
    static constexpr auto                                 \
    get_action_name() {                                   \
        return tradesafe::chain::name(N(actname));        \
    }                                                     \
                                                          \
    static std::string                                    \
    get_type_name() {                                     \
        return #actname;                                  \
    }

using user_id      = tradesafe::chain::public_key_type;
using balance_type = tradesafe::chain::asset;

struct createescrow {
    escrow_id_type escrow_id = 0;
    trade_id_type  trade_id  = 0;
    address        buyer;
    share_type     amount = 0;

    bool              sequential = false;
    optional<address> sequential_address;

    TRADESAFE_ACTION(createescrow);
};

struct fundescrow {
    address escrow;

    TRADESAFE_ACTION(fundescrow);
};

struct markfiatpaid {
    address escrow;

    TRADESAFE_ACTION(markfiatpaid);
};

struct updseqaddr {
    address escrow;
    address new_address;

    TRADESAFE_ACTION(updseqaddr);
};

struct releaseesc {
    address escrow;

    TRADESAFE_ACTION(releaseesc);
};

struct cancelescrow {
    address escrow;

    TRADESAFE_ACTION(cancelescrow);
};

struct autocancel {
    address escrow;

    TRADESAFE_ACTION(autocancel);
};

struct initbuyerbond {
    address escrow;

    TRADESAFE_ACTION(initbuyerbond);
};

struct initsellerbnd {
    address escrow;

    TRADESAFE_ACTION(initsellerbnd);
};

struct opendispute {
    address escrow;
    bytes   evidence_hash;  ///< 32 bytes

    TRADESAFE_ACTION(opendispute);
};

struct respdispute {
    address escrow;
    bytes   evidence_hash;  ///< 32 bytes

    TRADESAFE_ACTION(respdispute);
};

struct defaultjudge {
    address escrow;

    TRADESAFE_ACTION(defaultjudge);
};

struct resolvedisp {
    address escrow;
    bool    buyer_wins = false;
    bytes   explanation_hash;  ///< 32 bytes

    TRADESAFE_ACTION(resolvedisp);
};

struct closeescrow {
    address escrow;

    TRADESAFE_ACTION(closeescrow);
};

struct transferft {
    address      from;
    address      to;
    balance_type number;
    string       memo;

    TRADESAFE_ACTION(transferft);
};

}}}  // namespace tradesafe::chain::contracts

FC_REFLECT(tradesafe::chain::contracts::createescrow, (escrow_id)(trade_id)(buyer)(amount)(sequential)(sequential_address));
FC_REFLECT(tradesafe::chain::contracts::fundescrow, (escrow));
FC_REFLECT(tradesafe::chain::contracts::markfiatpaid, (escrow));
FC_REFLECT(tradesafe::chain::contracts::updseqaddr, (escrow)(new_address));
FC_REFLECT(tradesafe::chain::contracts::releaseesc, (escrow));
FC_REFLECT(tradesafe::chain::contracts::cancelescrow, (escrow));
FC_REFLECT(tradesafe::chain::contracts::autocancel, (escrow));
FC_REFLECT(tradesafe::chain::contracts::initbuyerbond, (escrow));
FC_REFLECT(tradesafe::chain::contracts::initsellerbnd, (escrow));
FC_REFLECT(tradesafe::chain::contracts::opendispute, (escrow)(evidence_hash));
FC_REFLECT(tradesafe::chain::contracts::respdispute, (escrow)(evidence_hash));
FC_REFLECT(tradesafe::chain::contracts::defaultjudge, (escrow));
FC_REFLECT(tradesafe::chain::contracts::resolvedisp, (escrow)(buyer_wins)(explanation_hash));
FC_REFLECT(tradesafe::chain::contracts::closeescrow, (escrow));
FC_REFLECT(tradesafe::chain::contracts::transferft, (from)(to)(number)(memo));
