/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#pragma once
#include <tradesafe/chain/action.hpp>
#include <tradesafe/chain/events.hpp>

namespace tradesafe { namespace chain {

struct action_trace {
    action               act;
    time_point_sec       applied_time;
    vector<escrow_event> events;

    string           console;
    fc::microseconds elapsed;
};

}}  // namespace tradesafe::chain

FC_REFLECT(tradesafe::chain::action_trace, (act)(applied_time)(events)(console)(elapsed));
