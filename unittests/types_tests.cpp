/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#include <set>

#include <catch2/catch.hpp>

#include <fc/io/json.hpp>
#include <fc/reflect/variant.hpp>

#include <tradesafe/chain/address.hpp>
#include <tradesafe/chain/addressing.hpp>
#include <tradesafe/chain/asset.hpp>
#include <tradesafe/chain/config.hpp>
#include <tradesafe/chain/escrow_object.hpp>
#include <tradesafe/chain/exceptions.hpp>
#include <tradesafe/chain/name.hpp>
#include <tradesafe/chain/types.hpp>
#include <tradesafe/chain/contracts/types.hpp>
#include <tradesafe/testing/tester.hpp>
#include <tradesafe/utilities/safemath.hpp>

using namespace tradesafe;
using namespace tradesafe::chain;
using namespace tradesafe::chain::contracts;
using tradesafe::testing::tester;

TEST_CASE("test_address", "[types]") {
    auto addr = address();

    CHECK(addr.is_reserved());
    auto var1 = fc::variant();
    fc::to_variant(addr, var1);
    CHECK(var1.is_string());
    CHECK(var1.get_string() == "TS000000000000000000000000000000000000000000000000000");

    address addr2;
    fc::from_variant(var1, addr2);
    CHECK(addr2.is_reserved());
    CHECK(addr == addr2);

    auto pkey  = tester::get_public_key("seller");
    auto addr3 = address(pkey);
    CHECK(addr3.is_public_key());

    auto var2 = fc::variant();
    fc::to_variant(addr3, var2);

    address addr4;
    fc::from_variant(var2, addr4);
    CHECK(addr4.is_public_key());
    CHECK(addr4.get_public_key() == pkey);
    CHECK(addr4 == pkey);

    auto pid   = fc::sha256::hash(std::string("program"));
    auto addr5 = derive_escrow_address(pid, 1, 2);
    CHECK(addr5.is_derived());

    auto str = addr5.to_string();
    CHECK(str.substr(0, 3) == "TSD");

    auto addr6 = address::from_string(str);
    CHECK(addr6.is_derived());
    CHECK(addr6 == addr5);

    auto bad = str;
    bad[bad.size() - 1] = (bad.back() == '2' ? '3' : '2');
    CHECK_THROWS_AS(address::from_string(bad), address_type_exception);

    // reserved < public key < derived, then by value within a kind
    CHECK(addr < addr3);
    CHECK(addr3 < addr5);
    CHECK(!(addr5 < addr3));
    CHECK(!(addr5 < addr6));
    CHECK(addr3 != addr5);

    auto addr7 = derive_escrow_address(pid, 3, 4);
    CHECK(((addr5 < addr7) != (addr7 < addr5)));

    auto sorted = std::set<address>{ addr5, addr3, addr, addr6 };
    CHECK(sorted.size() == 3);
    CHECK(*sorted.begin() == addr);
}

TEST_CASE("test_derived_addresses", "[types]") {
    auto pid = fc::sha256::hash(std::string("program"));

    auto a1 = derive_escrow_addresses(pid, 1, 2);
    auto a2 = derive_escrow_addresses(pid, 1, 2);

    // recomputable from public identifiers only
    CHECK(a1.escrow == a2.escrow);
    CHECK(a1.principal_vault == a2.principal_vault);
    CHECK(a1.buyer_bond_vault == a2.buyer_bond_vault);
    CHECK(a1.seller_bond_vault == a2.seller_bond_vault);

    CHECK(a1.escrow != a1.principal_vault);
    CHECK(a1.principal_vault != a1.buyer_bond_vault);
    CHECK(a1.buyer_bond_vault != a1.seller_bond_vault);

    CHECK(a1.vault(vault_kind::principal) == a1.principal_vault);
    CHECK(a1.vault(vault_kind::seller_bond) == a1.seller_bond_vault);

    // swapping the ids yields a different record
    CHECK(derive_escrow_address(pid, 2, 1) != a1.escrow);
    CHECK(derive_escrow_address(pid, 1, 3) != a1.escrow);

    // another ledger never shares addresses
    auto pid2 = fc::sha256::hash(std::string("program2"));
    CHECK(derive_escrow_address(pid2, 1, 2) != a1.escrow);

    // length prefixes keep tag and seed boundaries apart
    auto x = derive_address(pid, "ab", { bytes{ 'c' } });
    auto y = derive_address(pid, "a", { bytes{ 'b', 'c' } });
    CHECK(x != y);

    CHECK(le8_seed(1) == bytes{ 1, 0, 0, 0, 0, 0, 0, 0 });
    CHECK_THROWS_AS(derive_vault_address(pid, address(tester::get_public_key("seller")), vault_kind::principal), address_type_exception);
}

TEST_CASE("test_asset", "[types]") {
    auto sym = symbol(config::token_precision, config::token_symbol_id);

    auto a1 = asset::from_string("1.000000 S#1");
    CHECK(a1.amount() == 1'000'000);
    CHECK(a1.sym() == sym);
    CHECK(a1.to_string() == "1.000000 S#1");

    auto a2 = asset(10'000, sym);
    CHECK(a2.to_string() == "0.010000 S#1");

    auto a3 = a1 + a2;
    CHECK(a3.amount() == 1'010'000);

    CHECK_THROWS_AS(a2 - a1, math_overflow_exception);
    CHECK_THROWS_AS(asset(1, sym) + asset(1, native_sym()), asset_type_exception);

    auto big = asset(std::numeric_limits<share_type>::max(), sym);
    CHECK_THROWS_AS(big + asset(1, sym), math_overflow_exception);

    CHECK_THROWS_AS(asset::from_string("-1.0 S#1"), asset_type_exception);
    CHECK_THROWS_AS(asset::from_string("1. S#1"), asset_type_exception);

    auto var = fc::variant();
    fc::to_variant(a1, var);
    CHECK(var.get_string() == "1.000000 S#1");
}

TEST_CASE("test_fee_and_bond", "[types]") {
    for(auto amount : { 1ul, 99ul, 100ul, 101ul, 1'000'000ul, 12'345'678ul, 99'999'999ul, 100'000'000ul }) {
        auto fee = share_type();
        REQUIRE(safemath::bps_of(amount, config::fee_bps, fee));
        CHECK(fee == amount / 100);

        auto escrow   = escrow_def();
        escrow.amount = amount;
        CHECK(escrow.bond_amount() == amount * 5 / 100);
    }

    auto r = share_type();
    CHECK(!safemath::bps_of(std::numeric_limits<share_type>::max(), config::bond_bps, r));
}

TEST_CASE("test_escrow_phase", "[types]") {
    auto escrow = escrow_def();
    CHECK(escrow.state() == escrow_state::created);
    CHECK(!escrow.is_terminal());
    CHECK(!escrow.fiat_paid());
    CHECK(!escrow.fiat_deadline().has_value());
    CHECK(escrow.dispute() == nullptr);

    auto funded          = funded_phase();
    funded.fiat_deadline = fc::time_point_sec(1000);
    funded.fiat_paid     = true;
    escrow.phase         = funded;

    CHECK(escrow.state() == escrow_state::funded);
    CHECK(escrow.fiat_paid());
    CHECK(*escrow.fiat_deadline() == fc::time_point_sec(1000));

    escrow.phase = resolved_phase();
    CHECK(escrow.is_terminal());
    CHECK(escrow.dispute() != nullptr);

    CHECK(fmt::format("{}", escrow.state()) == "Resolved");

    auto var = fc::variant();
    fc::to_variant(escrow, var);

    auto escrow2 = var.as<escrow_def>();
    CHECK(escrow2.state() == escrow_state::resolved);
}

TEST_CASE("test_name", "[types]") {
    auto n = name(N(createescrow));
    CHECK(n.to_string() == "createescrow");
    CHECK(createescrow::get_action_name() == n);
    CHECK(name(std::string("resolvedisp")) == N(resolvedisp));
    CHECK_THROWS_AS(name(std::string("createescrowtoolong")), name_type_exception);

    // the thirteenth character only has four bits
    CHECK(name(N(initsellerbnd)).to_string() == "initsellerbnd");
    CHECK(initsellerbnd::get_action_name() < name(N(initsellerbnz)));
    CHECK_THROWS_AS(name(std::string("initsellerbnz")), name_type_exception);

    CHECK_THROWS_AS(name(std::string("Escrow")), name_type_exception);
    CHECK_THROWS_AS(name(std::string("")), name_type_exception);
    CHECK(fmt::format("{}", closeescrow::get_action_name()) == "closeescrow");
}

TEST_CASE("test_error_kind", "[types]") {
    CHECK(error_kind_of(escrow_amount_exception()) == error_kind::validation);
    CHECK(error_kind_of(evidence_hash_exception()) == error_kind::validation);
    CHECK(error_kind_of(escrow_authorization_exception()) == error_kind::authorization);
    CHECK(error_kind_of(vault_authority_exception()) == error_kind::authorization);
    CHECK(error_kind_of(fiat_not_paid_exception()) == error_kind::state);
    CHECK(error_kind_of(deadline_passed_exception()) == error_kind::deadline);
    CHECK(error_kind_of(balance_exception()) == error_kind::funds);
    CHECK(error_kind_of(vault_reinit_exception()) == error_kind::reinitialization);
    CHECK(error_kind_of(escrow_duplicate_exception()) == error_kind::reinitialization);
    CHECK(error_kind_of(unknown_escrow_exception()) == error_kind::not_found);
    CHECK(error_kind_of(fc::exception()) == error_kind::internal);

    CHECK(std::string(error_kind_to_string(error_kind::funds)) == "funds");
}
