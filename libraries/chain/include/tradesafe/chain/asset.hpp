/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#pragma once
#include <fmt/format.h>
#include <tradesafe/chain/exceptions.hpp>
#include <tradesafe/chain/types.hpp>

namespace tradesafe { namespace chain {

#define EMPTY_SYM_ID  0
#define NATIVE_SYM_ID 0

class symbol : public fc::reflect_init {
private:
    static constexpr uint8_t max_precision = 18;

public:
    symbol() = default;

    constexpr symbol(uint8_t p, uint32_t id)
        : value_(0) {
        TRADESAFE_ASSERT(p <= max_precision, symbol_type_exception, "Exceed max precision");
        value_  = ((uint64_t)p << 32);
        value_ |= id;
    }

public:
    uint8_t  precision() const { return (uint8_t)(value_ >> 32); }
    uint32_t id() const { return (uint32_t)value_; }

    bool
    valid() const {
        return precision() <= max_precision;
    }

public:
    static symbol from_string(const string& from);
    string to_string() const;

    explicit operator string() const {
        return to_string();
    }

public:
    friend inline bool
    operator==(const symbol& lhs, const symbol& rhs) {
        return lhs.value_ == rhs.value_;
    }

    friend inline bool
    operator!=(const symbol& lhs, const symbol& rhs) {
        return !(lhs == rhs);
    }

    friend std::ostream&
    operator<<(std::ostream& out, const symbol& s) { return out << s.to_string(); }

private:
    uint64_t value_ = 0;

public:
    friend struct fc::reflector<symbol>;

    void
    reflector_init() const {
        TRADESAFE_ASSERT(valid(), symbol_type_exception, "invalid symbol");
    }
};

/**
 * Native unit used for rent deposits, no decimals
 */
static constexpr symbol
native_sym() {
    return symbol(0, NATIVE_SYM_ID);
}

/**

asset includes an unsigned amount and the token symbol

asset::from_string takes a string of the form "10.000000 S#1" and constructs an asset
with amount = 10000000 and symbol(6, 1)

All arithmetic is checked: overflow and underflow throw math_overflow_exception

*/
struct asset : public fc::reflect_init {
public:
    asset() = default;

    asset(share_type a, symbol sym)
        : amount_(a)
        , sym_(sym) {
        TRADESAFE_ASSERT(sym_.valid(), asset_type_exception, "invalid symbol");
    }

public:
    bool is_valid() const { return sym_.valid(); }

    uint32_t symbol_id() const { return sym_.id(); };
    uint8_t  precision() const { return sym_.precision(); };

    symbol     sym() const { return sym_; }
    share_type amount() const { return amount_; }

public:
    static asset from_string(const string& from);
    string       to_string() const;

    explicit operator string() const {
        return to_string();
    }

    asset& operator+=(const asset& o);
    asset& operator-=(const asset& o);

    friend bool
    operator==(const asset& a, const asset& b) {
        return a.sym() == b.sym() && a.amount() == b.amount();
    }

    friend bool
    operator<(const asset& a, const asset& b) {
        TRADESAFE_ASSERT(a.sym() == b.sym(), asset_type_exception, "comparison between two different asset is not allowed");
        return a.amount() < b.amount();
    }

    friend bool
    operator<=(const asset& a, const asset& b) { return (a == b) || (a < b); }

    friend bool
    operator!=(const asset& a, const asset& b) { return !(a == b); }

    friend bool
    operator>(const asset& a, const asset& b) { return !(a <= b); }

    friend bool
    operator>=(const asset& a, const asset& b) { return !(a < b); }

    friend asset
    operator-(const asset& a, const asset& b) {
        auto r = a;
        r -= b;
        return r;
    }

    friend asset
    operator+(const asset& a, const asset& b) {
        auto r = a;
        r += b;
        return r;
    }

    friend std::ostream&
    operator<<(std::ostream& out, const asset& a) { return out << a.to_string(); }

public:
    friend struct fc::reflector<asset>;

    void
    reflector_init() const {
        TRADESAFE_ASSERT(sym_.valid(), asset_type_exception, "invalid symbol");
    }

private:
    share_type amount_ = 0;
    symbol     sym_;
};

}}  // namespace tradesafe::chain

namespace fc {

inline void
to_variant(const tradesafe::chain::symbol& var, fc::variant& vo) {
    vo = var.to_string();
}

inline void
from_variant(const fc::variant& var, tradesafe::chain::symbol& vo) {
    vo = tradesafe::chain::symbol::from_string(var.get_string());
}

inline void
to_variant(const tradesafe::chain::asset& var, fc::variant& vo) {
    vo = var.to_string();
}

inline void
from_variant(const fc::variant& var, tradesafe::chain::asset& vo) {
    vo = tradesafe::chain::asset::from_string(var.get_string());
}

}  // namespace fc

namespace fmt {

template <>
struct formatter<tradesafe::chain::symbol> : formatter<std::string> {
    template <typename FormatContext>
    auto format(const tradesafe::chain::symbol& s, FormatContext& ctx) const {
        return formatter<std::string>::format(s.to_string(), ctx);
    }
};

template <>
struct formatter<tradesafe::chain::asset> : formatter<std::string> {
    template <typename FormatContext>
    auto format(const tradesafe::chain::asset& a, FormatContext& ctx) const {
        return formatter<std::string>::format(a.to_string(), ctx);
    }
};

}  // namespace fmt

FC_REFLECT(tradesafe::chain::symbol, (value_));
FC_REFLECT(tradesafe::chain::asset, (amount_)(sym_));
