/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#pragma once
#include <tradesafe/chain/name.hpp>
#include <tradesafe/chain/types.hpp>
#include <fc/time.hpp>

#pragma GCC diagnostic ignored "-Wunused-variable"

namespace tradesafe { namespace chain { namespace config {

/** Percentages are fixed point with a denominator of 10,000 */
const static uint32_t percent_1   = 100;

const static uint32_t fee_bps  = 1 * percent_1;  ///< fee charged on top of the principal
const static uint32_t bond_bps = 5 * percent_1;  ///< dispute bond posted by each party

/** Monetary values carry 6 implied decimals, 1'000'000 = 1.00 unit */
const static uint8_t    token_precision   = 6;
const static symbol_id_type token_symbol_id = 1;
const static uint64_t   max_escrow_amount = 100'000'000;

const static uint32_t deposit_timeout_sec     = 15 * 60;
const static uint32_t fiat_timeout_sec        = 30 * 60;
const static uint32_t dispute_response_sec    = 72 * 60 * 60;
const static uint32_t dispute_arbitration_sec = 168 * 60 * 60;

/** Native units locked per opened account, refunded on close */
const static uint64_t default_rent_deposit = 2'039'280;

const static auto escrow_tag       = "escrow";
const static auto escrow_token_tag = "escrow_token";
const static auto buyer_bond_tag   = "buyer_bond";
const static auto seller_bond_tag  = "seller_bond";

/** Marker mixed into every derived address, keeps them off the key curve domain */
const static auto derived_address_marker = "tradesafe::derived_address";

const static auto default_snapshot_filename = "ledger.json";

}}}  // namespace tradesafe::chain::config
