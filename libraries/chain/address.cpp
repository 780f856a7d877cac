/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#include <tradesafe/chain/address.hpp>
#include <tradesafe/chain/exceptions.hpp>
#include <fc/crypto/base58.hpp>
#include <fc/crypto/ripemd160.hpp>

namespace tradesafe { namespace chain {

const std::string reserved_key   = "TS000000000000000000000000000000000000000000000000000";
const std::string derived_prefix = "TSD";

namespace internal {

struct derived_wrapper {
public:
    char     hash[32];
    uint32_t checksum;

public:
    uint32_t
    calculate_checksum() {
         auto encoder = fc::ripemd160::encoder();
         encoder.write(hash, sizeof(hash));

         checksum = encoder.result()._hash[0];
         return checksum;
    }
} __attribute__((packed));

}  // namespace internal

std::string
address::to_string() const {
    using namespace internal;

    switch(type()) {
    case reserved_t: {
        return reserved_key;
    }
    case public_key_t: {
        return (std::string)this->get_public_key();
    }
    case derived_t: {
        auto str = std::string();
        str.reserve(56);
        str.append(derived_prefix);

        auto der = derived_wrapper();
        memcpy(der.hash, get_derived().data(), sizeof(der.hash));
        der.calculate_checksum();

        str.append(fc::to_base58((char*)&der, sizeof(der)));
        return str;
    }
    default: {
        TRADESAFE_THROW(address_type_exception, "Not valid address type: ${type}", ("type",type()));
    }
    }  // switch
}

address
address::from_string(const std::string& str) {
    using namespace internal;

    try {
        if(str == reserved_key) {
            return address();
        }

        if(str.compare(0, derived_prefix.size(), derived_prefix) == 0) {
            auto der = derived_wrapper();
            auto sz  = fc::from_base58(str.substr(derived_prefix.size()), (char*)&der, sizeof(der));
            TRADESAFE_ASSERT(sz == sizeof(der), address_type_exception, "Derived address is not valid: ${str}", ("str",str));

            auto checksum = der.checksum;
            TRADESAFE_ASSERT(checksum == der.calculate_checksum(), address_type_exception, "Checksum doesn't match");

            auto hash = fc::sha256();
            memcpy(hash.data(), der.hash, sizeof(der.hash));
            return address(hash);
        }

        return address((public_key_type)str);
    }
    TRADESAFE_CAPTURE_AND_RETHROW(address_type_exception, (str));
}

bool
operator==(const address& a, const address& b) {
    if(a.type() != b.type()) {
        return false;
    }
    switch(a.type()) {
    case address::public_key_t: {
        return a.get_public_key() == b.get_public_key();
    }
    case address::derived_t: {
        return a.get_derived() == b.get_derived();
    }
    default: {
        return a.storage_.get<address::reserved_type>() == b.storage_.get<address::reserved_type>();
    }
    }  // switch
}

bool
operator<(const address& a, const address& b) {
    if(a.type() != b.type()) {
        return a.type() < b.type();
    }
    switch(a.type()) {
    case address::public_key_t: {
        return a.get_public_key() < b.get_public_key();
    }
    case address::derived_t: {
        return a.get_derived() < b.get_derived();
    }
    default: {
        return a.storage_.get<address::reserved_type>() < b.storage_.get<address::reserved_type>();
    }
    }  // switch
}

}}  // namespace tradesafe::chain

namespace fc {

void
to_variant(const tradesafe::chain::address& addr, fc::variant& v) {
    v = addr.to_string();
}

void
from_variant(const fc::variant& v, tradesafe::chain::address& addr) {
    addr = tradesafe::chain::address::from_string(v.get_string());
}

}  // namespace fc
