/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#pragma once

#include <fmt/format.h>
#include <fc/reflect/reflect.hpp>
#include <fc/variant.hpp>
#include <tradesafe/chain/types.hpp>
#include <tradesafe/chain/exceptions.hpp>

namespace tradesafe { namespace chain {

/**
 * Address of a ledger account: either a party's public key or an address
 * derived by the ledger from fixed tags and public identifiers.
 * Derived addresses have no private key behind them.
 */
class address {
public:
    enum addr_type { reserved_t = 0, public_key_t, derived_t };

private:
    using reserved_type = uint8_t;
    using derived_type  = fc::sha256;
    using storage_type  = static_variant<reserved_type, public_key_type, derived_type>;

public:
    address()
        : storage_(reserved_type()) {}

    address(const public_key_type& pkey)
        : storage_(pkey) {}

    explicit address(const fc::sha256& derived)
        : storage_(derived) {}

    address(const address&) = default;
    address(address&&) noexcept = default;

    explicit address(const char* str) { *this = address::from_string(str); }
    explicit address(const string& str) { *this = address::from_string(str); }

public:
    int type() const { return storage_.which(); }

    bool is_reserved() const { return type() == reserved_t; }
    bool is_public_key() const { return type() == public_key_t; }
    bool is_derived() const { return type() == derived_t; }

public:
    const public_key_type&
    get_public_key() const {
        return storage_.get<public_key_type>();
    }

    const fc::sha256&
    get_derived() const {
        return storage_.get<derived_type>();
    }

public:
    std::string to_string() const;

    explicit
    operator string() const {
        return to_string();
    }

    static address from_string(const std::string& str);

public:
    address& operator=(const address& addr) = default;
    address& operator=(address&& addr) = default;

    friend bool operator==(const address& a, const address& b);

    friend bool
    operator!=(const address& a, const address& b) {
        return !(a == b);
    }

    // orders by kind first: reserved, public key, derived
    friend bool operator<(const address& a, const address& b);

    friend bool
    operator==(const address& a, const public_key_type& b) {
        return a.type() == public_key_t && a.get_public_key() == b;
    }

    friend bool
    operator!=(const address& a, const public_key_type& b) {
        return !(a == b);
    }

    friend std::ostream&
    operator<< (std::ostream& s, const address& k) {
        s << k.to_string();
        return s;
    }

private:
    storage_type storage_;

private:
    friend struct fc::reflector<address>;
};

}}  // namespace tradesafe::chain

namespace fc {

class variant;
void to_variant(const tradesafe::chain::address& addr, fc::variant& v);
void from_variant(const fc::variant& v, tradesafe::chain::address& addr);

template<>
inline void
to_variant<tradesafe::chain::address>(const tradesafe::chain::address& addr, fc::variant& v) {
    to_variant(addr, v);
}

template<>
inline void
from_variant<tradesafe::chain::address>(const fc::variant& v, tradesafe::chain::address& addr) {
    from_variant(v, addr);
}

}  // namespace fc

namespace fmt {

template <>
struct formatter<tradesafe::chain::address> : formatter<std::string> {
    template <typename FormatContext>
    auto format(const tradesafe::chain::address& addr, FormatContext& ctx) const {
        return formatter<std::string>::format(addr.to_string(), ctx);
    }
};

}  // namespace fmt

FC_REFLECT(tradesafe::chain::address, (storage_))
