/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#pragma once
#include <boost/core/typeinfo.hpp>
#include <fc/exception/exception.hpp>

#define TRADESAFE_ASSERT(expr, exc_type, FORMAT, ...)       \
    FC_MULTILINE_MACRO_BEGIN                               \
    if(!(expr))                                            \
        FC_THROW_EXCEPTION(exc_type, FORMAT, __VA_ARGS__); \
    FC_MULTILINE_MACRO_END

#define TRADESAFE_ASSERT2(expr, exc_type, FORMAT, ...)          \
    FC_MULTILINE_MACRO_BEGIN                                  \
    if(!(expr))                                               \
        FC_THROW_EXCEPTION2(exc_type, FORMAT, ##__VA_ARGS__); \
    FC_MULTILINE_MACRO_END

#define TRADESAFE_THROW(exc_type, FORMAT, ...)  throw exc_type(FC_LOG_MESSAGE(error, FORMAT, __VA_ARGS__));
#define TRADESAFE_THROW2(exc_type, FORMAT, ...) throw exc_type(FC_LOG_MESSAGE2(error, FORMAT, ##__VA_ARGS__));

/**
 * Macro inspired from FC_CAPTURE_AND_RETHROW
 * The main difference here is that if the exception caught isn't of type "chain_exception"
 * This macro will rethrow the exception as the specified "exception_type"
 */
#define TRADESAFE_CAPTURE_AND_RETHROW(exception_type, ...)                                                          \
    catch(const fc::unrecoverable_exception&) {                                                                    \
        throw;                                                                                                     \
    }                                                                                                              \
    catch(chain_exception & e) {                                                                                   \
        FC_RETHROW_EXCEPTION(e, warn, "", FC_FORMAT_ARG_PARAMS(__VA_ARGS__));                                      \
    }                                                                                                              \
    catch(fc::exception & e) {                                                                                     \
        exception_type new_exception(e.get_log());                                                                 \
        throw new_exception;                                                                                       \
    }                                                                                                              \
    catch(const std::exception& e) {                                                                               \
        exception_type fce(FC_LOG_MESSAGE(warn, "${what}: ", FC_FORMAT_ARG_PARAMS(__VA_ARGS__)("what", e.what())), \
                           fc::std_exception_code, BOOST_CORE_TYPEID(decltype(e)).name(), e.what());               \
        throw fce;                                                                                                 \
    }                                                                                                              \
    catch(...) {                                                                                                   \
        throw fc::unhandled_exception(FC_LOG_MESSAGE(warn, "", FC_FORMAT_ARG_PARAMS(__VA_ARGS__)),                 \
                                      std::current_exception());                                                   \
    }

namespace tradesafe { namespace chain {

FC_DECLARE_EXCEPTION( chain_exception, 3000000, "escrow ledger exception" );

FC_DECLARE_DERIVED_EXCEPTION( type_exception,           chain_exception, 3010000, "Type exception" );
FC_DECLARE_DERIVED_EXCEPTION( name_type_exception,      type_exception,  3010001, "Invalid name" );
FC_DECLARE_DERIVED_EXCEPTION( address_type_exception,   type_exception,  3010002, "Invalid address" );
FC_DECLARE_DERIVED_EXCEPTION( asset_type_exception,     type_exception,  3010003, "Invalid asset" );
FC_DECLARE_DERIVED_EXCEPTION( symbol_type_exception,    type_exception,  3010004, "Invalid symbol" );

FC_DECLARE_DERIVED_EXCEPTION( database_exception,          chain_exception,    3020000, "Database exception" );
FC_DECLARE_DERIVED_EXCEPTION( unknown_escrow_exception,    database_exception, 3020001, "Escrow record does not exist." );
FC_DECLARE_DERIVED_EXCEPTION( unknown_account_exception,   database_exception, 3020002, "Token account does not exist." );
FC_DECLARE_DERIVED_EXCEPTION( account_duplicate_exception, database_exception, 3020003, "Token account already exists." );
FC_DECLARE_DERIVED_EXCEPTION( snapshot_exception,          database_exception, 3020004, "Snapshot exception" );
FC_DECLARE_DERIVED_EXCEPTION( savepoint_exception,         database_exception, 3020005, "Savepoint exception" );

FC_DECLARE_DERIVED_EXCEPTION( action_exception,         chain_exception,  3040000, "action exception" );
FC_DECLARE_DERIVED_EXCEPTION( action_type_exception,    action_exception, 3040001, "Invalid action data" );
FC_DECLARE_DERIVED_EXCEPTION( unknown_action_exception, action_exception, 3040002, "Unknown action" );
FC_DECLARE_DERIVED_EXCEPTION( action_apply_exception,   action_exception, 3040003, "Action apply exception" );

FC_DECLARE_DERIVED_EXCEPTION( escrow_exception,                 chain_exception,             3050000, "Escrow exception" );

FC_DECLARE_DERIVED_EXCEPTION( escrow_validation_exception,      escrow_exception,            3050100, "Escrow validation exception" );
FC_DECLARE_DERIVED_EXCEPTION( escrow_amount_exception,          escrow_validation_exception, 3050101, "Invalid escrow amount" );
FC_DECLARE_DERIVED_EXCEPTION( sequential_address_exception,     escrow_validation_exception, 3050102, "Invalid sequential escrow address" );
FC_DECLARE_DERIVED_EXCEPTION( evidence_hash_exception,          escrow_validation_exception, 3050103, "Invalid 32-byte hash" );
FC_DECLARE_DERIVED_EXCEPTION( escrow_party_exception,           escrow_validation_exception, 3050104, "Invalid escrow parties" );

FC_DECLARE_DERIVED_EXCEPTION( escrow_authorization_exception,   escrow_exception,               3050200, "Escrow authorization exception" );
FC_DECLARE_DERIVED_EXCEPTION( vault_authority_exception,        escrow_authorization_exception, 3050201, "Only the ledger authority can move funds out of a vault" );

FC_DECLARE_DERIVED_EXCEPTION( escrow_state_exception,           escrow_exception,       3050300, "Escrow state exception" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_transition_exception,     escrow_state_exception, 3050301, "Operation not allowed in current escrow state" );
FC_DECLARE_DERIVED_EXCEPTION( fiat_not_paid_exception,          escrow_state_exception, 3050302, "Fiat has not been marked paid" );
FC_DECLARE_DERIVED_EXCEPTION( fiat_already_paid_exception,      escrow_state_exception, 3050303, "Fiat has already been marked paid" );
FC_DECLARE_DERIVED_EXCEPTION( dispute_state_exception,          escrow_state_exception, 3050304, "Dispute is not in proper status" );
FC_DECLARE_DERIVED_EXCEPTION( escrow_not_terminal_exception,    escrow_state_exception, 3050305, "Escrow is not in a terminal state" );

FC_DECLARE_DERIVED_EXCEPTION( escrow_deadline_exception,        escrow_exception,          3050400, "Escrow deadline exception" );
FC_DECLARE_DERIVED_EXCEPTION( deadline_passed_exception,        escrow_deadline_exception, 3050401, "Deadline has passed" );
FC_DECLARE_DERIVED_EXCEPTION( deadline_not_reached_exception,   escrow_deadline_exception, 3050402, "Deadline has not been reached yet" );

FC_DECLARE_DERIVED_EXCEPTION( escrow_funds_exception,           escrow_exception,       3050500, "Escrow funds exception" );
FC_DECLARE_DERIVED_EXCEPTION( balance_exception,                escrow_funds_exception, 3050501, "Not enough balance left." );
FC_DECLARE_DERIVED_EXCEPTION( math_overflow_exception,          escrow_funds_exception, 3050502, "Operations resulted in overflow." );
FC_DECLARE_DERIVED_EXCEPTION( rent_exception,                   escrow_funds_exception, 3050503, "Not enough native balance to cover rent deposit" );

FC_DECLARE_DERIVED_EXCEPTION( vault_reinit_exception,           escrow_exception,       3050600, "Vault is already initialized" );
FC_DECLARE_DERIVED_EXCEPTION( escrow_duplicate_exception,       vault_reinit_exception, 3050601, "Escrow record already exists." );

FC_DECLARE_DERIVED_EXCEPTION( misc_exception,             chain_exception, 3100000, "Miscellaneous exception" );
FC_DECLARE_DERIVED_EXCEPTION( config_exception,           misc_exception,  3100001, "Invalid configuration" );

/**
 * Enumerable error kinds reported to callers
 */
enum class error_kind {
    validation = 0,
    authorization,
    state,
    deadline,
    funds,
    reinitialization,
    not_found,
    internal
};

error_kind error_kind_of(const fc::exception& e);
const char* error_kind_to_string(error_kind kind);

}}  // namespace tradesafe::chain
