/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#pragma once
#include <string>
#include <vector>
#include <fmt/format.h>
#include <tradesafe/chain/address.hpp>
#include <tradesafe/chain/types.hpp>

namespace tradesafe { namespace chain {

using program_id_type = fc::sha256;

/**
 * One of the three custody vaults bound to an escrow record
 */
enum class vault_kind {
    principal = 0,
    buyer_bond,
    seller_bond
};

using seed_type = bytes;

/**
 * Deterministic, one-way address derivation.
 *
 * address = sha256(len(tag) || tag || len(seed_0) || seed_0 || ... || program_id || marker)
 *
 * Every component is length prefixed so two distinct (tag, seeds) tuples never
 * produce the same preimage. The resulting address has no private key, only
 * the ledger holding `program_id` may act as its authority.
 */
address derive_address(const program_id_type& program_id, const std::string& tag, const std::vector<seed_type>& seeds);

seed_type le8_seed(uint64_t v);
seed_type address_seed(const address& addr);

address derive_escrow_address(const program_id_type& program_id, escrow_id_type escrow_id, trade_id_type trade_id);
address derive_vault_address(const program_id_type& program_id, const address& escrow_address, vault_kind kind);

const char* vault_tag(vault_kind kind);

/**
 * Record address plus its three vault addresses, as recomputed by any observer
 */
struct escrow_addresses {
    address escrow;
    address principal_vault;
    address buyer_bond_vault;
    address seller_bond_vault;

    const address& vault(vault_kind kind) const;
};

escrow_addresses derive_escrow_addresses(const program_id_type& program_id, escrow_id_type escrow_id, trade_id_type trade_id);

}}  // namespace tradesafe::chain

namespace fmt {

template <>
struct formatter<tradesafe::chain::vault_kind> : formatter<std::string> {
    template <typename FormatContext>
    auto format(tradesafe::chain::vault_kind kind, FormatContext& ctx) const {
        return formatter<std::string>::format(tradesafe::chain::vault_tag(kind), ctx);
    }
};

}  // namespace fmt

FC_REFLECT_ENUM(tradesafe::chain::vault_kind, (principal)(buyer_bond)(seller_bond));
FC_REFLECT(tradesafe::chain::escrow_addresses, (escrow)(principal_vault)(buyer_bond_vault)(seller_bond_vault));
