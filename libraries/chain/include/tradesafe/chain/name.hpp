/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#pragma once
#include <stdint.h>
#include <string>
#include <fmt/format.h>
#include <fc/reflect/reflect.hpp>

namespace tradesafe { namespace chain {

namespace __internal {

// alphabet is ".a-z1-5", anything else maps to '.'
constexpr uint64_t
name_char_value(char c) {
    if(c >= 'a' && c <= 'z') {
        return (c - 'a') + 1;
    }
    if(c >= '1' && c <= '5') {
        return (c - '1') + 27;
    }
    return 0;
}

}  // namespace __internal

/**
 * Packs up to 13 characters into 64 bits: twelve 5-bit slots from the high end
 * and a 4-bit slot for the last character.
 */
constexpr uint64_t
encode_name(const char* str) {
    auto v = uint64_t(0);
    for(auto i = 0; i < 13 && str[i] != '\0'; i++) {
        auto c = __internal::name_char_value(str[i]);
        if(i < 12) {
            v |= (c & 0x1f) << (59 - 5 * i);
        }
        else {
            v |= (c & 0x0f);
        }
    }
    return v;
}

#define N(X) tradesafe::chain::encode_name(#X)

/**
 * Action identifier, compared by its packed value
 */
struct name {
    uint64_t value = 0;

    constexpr name() = default;
    constexpr name(uint64_t v) : value(v) {}
    explicit name(const std::string& str);

    std::string to_string() const;

    friend bool operator==(const name& a, const name& b) { return a.value == b.value; }
    friend bool operator!=(const name& a, const name& b) { return a.value != b.value; }
    friend bool operator<(const name& a, const name& b) { return a.value < b.value; }
};

}}  // namespace tradesafe::chain

namespace fc {

class variant;
void to_variant(const tradesafe::chain::name& n, fc::variant& v);
void from_variant(const fc::variant& v, tradesafe::chain::name& n);

}  // namespace fc

namespace fmt {

template <>
struct formatter<tradesafe::chain::name> : formatter<std::string> {
    template <typename FormatContext>
    auto format(const tradesafe::chain::name& n, FormatContext& ctx) const {
        return formatter<std::string>::format(n.to_string(), ctx);
    }
};

}  // namespace fmt

FC_REFLECT(tradesafe::chain::name, (value));
