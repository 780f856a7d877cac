/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#include <tradesafe/chain/addressing.hpp>
#include <tradesafe/chain/config.hpp>
#include <tradesafe/chain/exceptions.hpp>
#include <fc/io/raw.hpp>

namespace tradesafe { namespace chain {

namespace internal {

inline void
write_prefixed(fc::sha256::encoder& enc, const char* data, size_t sz) {
    TRADESAFE_ASSERT(sz <= std::numeric_limits<uint8_t>::max(), address_type_exception,
        "Derivation component is too long: ${sz}", ("sz", sz));

    auto len = (uint8_t)sz;
    enc.write((const char*)&len, sizeof(len));
    enc.write(data, sz);
}

}  // namespace internal

address
derive_address(const program_id_type& program_id, const std::string& tag, const std::vector<seed_type>& seeds) {
    using namespace internal;

    TRADESAFE_ASSERT(!tag.empty(), address_type_exception, "Derivation tag cannot be empty");

    auto enc = fc::sha256::encoder();
    write_prefixed(enc, tag.data(), tag.size());
    for(auto& seed : seeds) {
        write_prefixed(enc, seed.data(), seed.size());
    }
    enc.write(program_id.data(), program_id.data_size());
    enc.write(config::derived_address_marker, strlen(config::derived_address_marker));

    return address(enc.result());
}

seed_type
le8_seed(uint64_t v) {
    auto seed = seed_type(8);
    for(auto i = 0u; i < 8; i++) {
        seed[i] = (char)((v >> (8 * i)) & 0xff);
    }
    return seed;
}

seed_type
address_seed(const address& addr) {
    return fc::raw::pack(addr);
}

address
derive_escrow_address(const program_id_type& program_id, escrow_id_type escrow_id, trade_id_type trade_id) {
    return derive_address(program_id, config::escrow_tag, { le8_seed(escrow_id), le8_seed(trade_id) });
}

const char*
vault_tag(vault_kind kind) {
    switch(kind) {
    case vault_kind::principal:   return config::escrow_token_tag;
    case vault_kind::buyer_bond:  return config::buyer_bond_tag;
    case vault_kind::seller_bond: return config::seller_bond_tag;
    }  // switch
    TRADESAFE_THROW(address_type_exception, "Unknown vault kind: ${k}", ("k", (int)kind));
}

address
derive_vault_address(const program_id_type& program_id, const address& escrow_address, vault_kind kind) {
    TRADESAFE_ASSERT(escrow_address.is_derived(), address_type_exception,
        "Vaults can only be derived from an escrow record address");
    return derive_address(program_id, vault_tag(kind), { address_seed(escrow_address) });
}

const address&
escrow_addresses::vault(vault_kind kind) const {
    switch(kind) {
    case vault_kind::principal:   return principal_vault;
    case vault_kind::buyer_bond:  return buyer_bond_vault;
    case vault_kind::seller_bond: return seller_bond_vault;
    }  // switch
    TRADESAFE_THROW(address_type_exception, "Unknown vault kind: ${k}", ("k", (int)kind));
}

escrow_addresses
derive_escrow_addresses(const program_id_type& program_id, escrow_id_type escrow_id, trade_id_type trade_id) {
    auto addrs = escrow_addresses();
    addrs.escrow            = derive_escrow_address(program_id, escrow_id, trade_id);
    addrs.principal_vault   = derive_vault_address(program_id, addrs.escrow, vault_kind::principal);
    addrs.buyer_bond_vault  = derive_vault_address(program_id, addrs.escrow, vault_kind::buyer_bond);
    addrs.seller_bond_vault = derive_vault_address(program_id, addrs.escrow, vault_kind::seller_bond);
    return addrs;
}

}}  // namespace tradesafe::chain
