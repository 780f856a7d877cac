/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#include <tradesafe/chain/exceptions.hpp>

namespace tradesafe { namespace chain {

namespace internal {

template <typename T>
bool
is_kind(const fc::exception& e) {
    return dynamic_cast<const T*>(&e) != nullptr;
}

}  // namespace internal

error_kind
error_kind_of(const fc::exception& e) {
    using namespace internal;

    if(is_kind<escrow_validation_exception>(e) || is_kind<type_exception>(e) || is_kind<action_type_exception>(e)) {
        return error_kind::validation;
    }
    if(is_kind<escrow_authorization_exception>(e)) {
        return error_kind::authorization;
    }
    if(is_kind<escrow_state_exception>(e)) {
        return error_kind::state;
    }
    if(is_kind<escrow_deadline_exception>(e)) {
        return error_kind::deadline;
    }
    if(is_kind<escrow_funds_exception>(e)) {
        return error_kind::funds;
    }
    if(is_kind<vault_reinit_exception>(e) || is_kind<account_duplicate_exception>(e)) {
        return error_kind::reinitialization;
    }
    if(is_kind<unknown_escrow_exception>(e) || is_kind<unknown_account_exception>(e)) {
        return error_kind::not_found;
    }
    return error_kind::internal;
}

const char*
error_kind_to_string(error_kind kind) {
    switch(kind) {
    case error_kind::validation:       return "validation";
    case error_kind::authorization:    return "authorization";
    case error_kind::state:            return "state";
    case error_kind::deadline:         return "deadline";
    case error_kind::funds:            return "funds";
    case error_kind::reinitialization: return "reinitialization";
    case error_kind::not_found:        return "not_found";
    case error_kind::internal:         return "internal";
    }  // switch
    return "internal";
}

}}  // namespace tradesafe::chain
