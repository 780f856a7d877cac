/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#include <tradesafe/testing/tester.hpp>

#include <fc/log/logger.hpp>
#include <tradesafe/chain/exceptions.hpp>
#include <tradesafe/chain/ledger_database.hpp>
#include <tradesafe/utilities/safemath.hpp>
#include <tradesafe/utilities/tempdir.hpp>

namespace tradesafe { namespace testing {

bool
expect_assert_message(const fc::exception& ex, const string& expected) {
    auto msg = ex.to_detail_string();
    if(msg.find(expected) == string::npos) {
        wlog("LOG: expected: ${e}, actual: ${a}", ("e", expected)("a", msg));
        return false;
    }
    return true;
}

tester::tester(bool contracts_console)
    : tempdir(utilities::temp_directory_path())
    , clock(fc::time_point_sec::from_iso_string(kStartTime)) {
    auto config = controller::config();

    config.arbitrator        = get_public_key("arbitrator");
    config.program_id        = fc::sha256::hash(std::string("tradesafe.escrow"));
    config.contracts_console = contracts_console;

    config.ledger_db_config.profile = storage_profile::memory;
    config.ledger_db_config.db_path = tempdir.path() / "ledgerdb";

    init(config);
}

tester::tester(controller::config config)
    : tempdir(utilities::temp_directory_path())
    , clock(fc::time_point_sec::from_iso_string(kStartTime)) {
    if(config.ledger_db_config.db_path == fc::path("ledgerdb")) {
        config.ledger_db_config.db_path = tempdir.path() / "ledgerdb";
    }
    init(config);
}

tester::~tester() {
    close();
}

void
tester::init(controller::config config) {
    cfg = config;

    control.reset(new controller(cfg, clock));
    control->startup();
}

void
tester::close() {
    if(control) {
        control->shutdown();
        control.reset();
    }
}

action_trace
tester::push_action(const action& act) {
    return control->push_action(act);
}

void
tester::add_money(const address& addr, const asset& number) {
    auto& ledger_db = control->ledger_db();

    auto account = token_account_def();
    if(!ledger_db.read_account(addr, number.symbol_id(), account, true /* no throw */)) {
        account.addr      = addr;
        account.authority = addr;
        account.sym       = number.sym();
    }

    TRADESAFE_ASSERT2(safemath::add(account.balance, number.amount(), account.balance), math_overflow_exception,
        "Adding {} to {} overflows", number, addr);
    ledger_db.put_account(account);
}

void
tester::add_native(const address& addr, share_type amount) {
    add_money(addr, asset(amount, native_sym()));
}

asset
tester::balance(const address& addr) const {
    return control->get_balance(addr, cfg.token_symbol);
}

share_type
tester::native_balance(const address& addr) const {
    return control->get_native_balance(addr).amount();
}

bool
tester::account_exists(const address& addr) const {
    return control->ledger_db().exists_account(addr, cfg.token_symbol.id());
}

escrow_addresses
tester::addresses(escrow_id_type escrow_id, trade_id_type trade_id) const {
    return control->get_escrow_addresses(escrow_id, trade_id);
}

escrow_def
tester::get_escrow(escrow_id_type escrow_id, trade_id_type trade_id) const {
    return control->get_escrow(addresses(escrow_id, trade_id).escrow);
}

void
tester::advance(const fc::microseconds& delta) {
    clock.advance(delta);
}

void
tester::set_time(const fc::time_point_sec& t) {
    clock.set(t);
}

bytes
tester::make_hash(const string& seed) {
    auto h = fc::sha256::hash(seed);
    return bytes(h.data(), h.data() + h.data_size());
}

}}  // namespace tradesafe::testing
