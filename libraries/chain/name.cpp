/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#include <tradesafe/chain/name.hpp>
#include <tradesafe/chain/exceptions.hpp>
#include <fc/variant.hpp>

namespace tradesafe { namespace chain {

name::name(const std::string& str) {
    TRADESAFE_ASSERT(!str.empty() && str.size() <= 13, name_type_exception,
        "Name must have 1 to 13 characters: ${name}", ("name", str));

    value = encode_name(str.c_str());
    // catches characters outside the alphabet and a 13th character above 'j'
    TRADESAFE_ASSERT(to_string() == str, name_type_exception,
        "Name: ${name} decodes as: ${decoded}", ("name", str)("decoded", to_string()));
}

std::string
name::to_string() const {
    static const char alphabet[] = ".abcdefghijklmnopqrstuvwxyz12345";

    auto str = std::string(13, '.');
    str[12]  = alphabet[value & 0x0f];
    for(auto i = 0; i < 12; i++) {
        str[i] = alphabet[(value >> (59 - 5 * i)) & 0x1f];
    }

    auto last = str.find_last_not_of('.');
    str.resize(last == std::string::npos ? 0 : last + 1);
    return str;
}

}}  // namespace tradesafe::chain

namespace fc {

void
to_variant(const tradesafe::chain::name& n, fc::variant& v) {
    v = n.to_string();
}

void
from_variant(const fc::variant& v, tradesafe::chain::name& n) {
    n = tradesafe::chain::name(v.get_string());
}

}  // namespace fc
