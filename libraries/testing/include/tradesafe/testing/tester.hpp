/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#pragma once
#include <memory>
#include <string>
#include <vector>

#include <fc/filesystem.hpp>
#include <fc/crypto/private_key.hpp>

#include <tradesafe/chain/action.hpp>
#include <tradesafe/chain/asset.hpp>
#include <tradesafe/chain/controller.hpp>
#include <tradesafe/chain/time_source.hpp>
#include <tradesafe/chain/contracts/types.hpp>

namespace tradesafe { namespace testing {

using namespace tradesafe::chain;

bool expect_assert_message(const fc::exception& ex, const string& expected);

/**
 *  @class tester
 *  @brief controller on a manual clock with a scratch ledger, simplifies writing unit tests
 */
class tester {
public:
    static constexpr auto kStartTime = "2025-01-01T00:00:00";

public:
    tester(bool contracts_console = true);
    tester(controller::config config);
    virtual ~tester();

    void init(controller::config config);
    void close();

public:
    template <typename T>
    action_trace
    push_action(const public_key_type& signer, const T& act) {
        return control->push_action(action(signer, act));
    }

    action_trace push_action(const action& act);

    /// credits token units directly to the ledger, bypassing any operation
    void add_money(const address& addr, const asset& number);
    void add_native(const address& addr, share_type amount);

    asset      balance(const address& addr) const;
    share_type native_balance(const address& addr) const;
    bool       account_exists(const address& addr) const;

    escrow_addresses addresses(escrow_id_type escrow_id, trade_id_type trade_id) const;
    escrow_def       get_escrow(escrow_id_type escrow_id, trade_id_type trade_id) const;

    void advance(const fc::microseconds& delta);
    void set_time(const fc::time_point_sec& t);
    fc::time_point_sec now() const { return clock.now(); }

    symbol token_sym() const { return cfg.token_symbol; }
    asset  token(share_type amount) const { return asset(amount, cfg.token_symbol); }

public:
    static private_key_type
    get_private_key(const string& keyname, const string& salt = "none") {
        return private_key_type::regenerate<fc::ecc::private_key_shim>(fc::sha256::hash(keyname + salt));
    }

    static public_key_type
    get_public_key(const string& keyname, const string& salt = "none") {
        return get_private_key(keyname, salt).get_public_key();
    }

    /// deterministic 32-byte digest used as evidence or explanation hash
    static bytes make_hash(const string& seed);

    const controller::config&
    get_config() const {
        return cfg;
    }

protected:
    // tempdir field must come before control so that during destruction the tempdir is deleted only after controller finishes
    fc::temp_directory tempdir;
    manual_time_source clock;

public:
    std::unique_ptr<controller> control;

protected:
    controller::config cfg;
};

}}  // namespace tradesafe::testing
