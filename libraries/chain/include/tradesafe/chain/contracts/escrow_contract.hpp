/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#pragma once
#include <tradesafe/chain/apply_context.hpp>

namespace tradesafe { namespace chain { namespace contracts {

/**
 * Implements the escrow ledger operations, one specialization per action name
 */
template<uint64_t>
struct apply_action {};

}}}  // namespace tradesafe::chain::contracts

#include <tradesafe/chain/contracts/escrow_contract_common.hpp>
#include <tradesafe/chain/contracts/escrow_contract_escrow.hpp>
#include <tradesafe/chain/contracts/escrow_contract_dispute.hpp>
