/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#include "escrow_tests.hpp"

TEST_CASE_METHOD(escrow_test, "deposit_deadline_test", "[contracts][deadline]") {
    auto addr = create_escrow(1, 1);

    SECTION("just before") {
        my_tester->advance(fc::seconds(config::deposit_timeout_sec - 1));
        push<fundescrow>(seller_key, addr);
        CHECK(get_escrow(addr).state() == escrow_state::funded);
    }

    SECTION("at the deadline") {
        my_tester->advance(fc::seconds(config::deposit_timeout_sec));
        CHECK_THROWS_AS(push<fundescrow>(seller_key, addr), deadline_passed_exception);

        // neither side of the boundary is open at the instant itself
        CHECK_THROWS_AS(push<autocancel>(arbitrator_key, addr), deadline_not_reached_exception);
        CHECK(get_escrow(addr).state() == escrow_state::created);
    }

    SECTION("after") {
        my_tester->advance(fc::seconds(config::deposit_timeout_sec + 1));
        CHECK_THROWS_AS(push<fundescrow>(seller_key, addr), deadline_passed_exception);

        CHECK_THROWS_AS(push<autocancel>(seller_key, addr), escrow_authorization_exception);
        push<autocancel>(arbitrator_key, addr);

        auto escrow = get_escrow(addr);
        CHECK(escrow.state() == escrow_state::cancelled);
        CHECK(escrow.phase.get<cancelled_phase>().automatic);
        CHECK(!escrow.phase.get<cancelled_phase>().was_funded);

        auto& ev = events.back().get<escrow_cancelled>();
        CHECK(ev.automatic);
        CHECK(ev.refund == 0);

        CHECK_THROWS_AS(push<autocancel>(arbitrator_key, addr), invalid_transition_exception);
    }
}

TEST_CASE_METHOD(escrow_test, "fiat_deadline_test", "[contracts][deadline]") {
    auto addr = create_and_fund(1, 1);

    SECTION("just before") {
        my_tester->advance(fc::seconds(config::fiat_timeout_sec - 1));
        CHECK_THROWS_AS(push<autocancel>(arbitrator_key, addr), deadline_not_reached_exception);

        push<markfiatpaid>(buyer_key, addr);
        CHECK(get_escrow(addr).fiat_paid());
    }

    SECTION("at the deadline") {
        my_tester->advance(fc::seconds(config::fiat_timeout_sec));
        CHECK_THROWS_AS(push<markfiatpaid>(buyer_key, addr), deadline_passed_exception);
        CHECK_THROWS_AS(push<autocancel>(arbitrator_key, addr), deadline_not_reached_exception);
    }

    SECTION("after") {
        my_tester->advance(fc::seconds(config::fiat_timeout_sec + 1));
        CHECK_THROWS_AS(push<markfiatpaid>(buyer_key, addr), deadline_passed_exception);

        push<autocancel>(arbitrator_key, addr);

        auto escrow = get_escrow(addr);
        CHECK(escrow.state() == escrow_state::cancelled);
        CHECK(escrow.phase.get<cancelled_phase>().automatic);
        CHECK(escrow.phase.get<cancelled_phase>().was_funded);
        CHECK(escrow.counter == 2);

        // full refund of principal and fee to the seller
        CHECK(balance(seller) == kSellerFunds);
        CHECK(balance(arbitrator) == 0);
        CHECK(!my_tester->account_exists(vault(addr, vault_kind::principal)));
        CHECK(events.back().get<escrow_cancelled>().refund == kAmount + kFee);
    }
}

TEST_CASE_METHOD(escrow_test, "autocancel_after_payment_test", "[contracts][deadline]") {
    auto addr = create_fund_and_pay(1, 1);

    // once the buyer claims payment only a release or a dispute can settle
    my_tester->advance(fc::seconds(config::fiat_timeout_sec + 1));
    CHECK_THROWS_AS(push<autocancel>(arbitrator_key, addr), fiat_already_paid_exception);

    push<releaseesc>(seller_key, addr);
    CHECK(balance(buyer) == kBuyerFunds + kAmount);

    CHECK_THROWS_AS(push<autocancel>(arbitrator_key, addr), invalid_transition_exception);
}

TEST_CASE_METHOD(escrow_test, "release_after_fiat_deadline_test", "[contracts][deadline]") {
    auto addr = create_fund_and_pay(1, 1);

    // the fiat deadline only bounds the payment claim
    my_tester->advance(fc::days(3));
    push<releaseesc>(seller_key, addr);
    CHECK(get_escrow(addr).state() == escrow_state::released);
}

TEST_CASE_METHOD(escrow_test, "dispute_after_fiat_deadline_test", "[contracts][deadline]") {
    auto addr = create_fund_and_pay(1, 1);

    my_tester->advance(fc::days(3));
    open_dispute(seller_key, addr, tester::make_hash("seller evidence"));

    auto escrow = get_escrow(addr);
    CHECK(escrow.state() == escrow_state::disputed);
    CHECK(escrow.dispute()->response_deadline == my_tester->now() + config::dispute_response_sec);
}

TEST_CASE_METHOD(escrow_test, "deadline_batch_test", "[contracts][deadline]") {
    auto a1 = create_escrow(1, 1);
    auto a2 = create_and_fund(2, 2);
    auto a3 = create_fund_and_pay(3, 3);

    my_tester->advance(fc::seconds(config::fiat_timeout_sec + 1));

    // a keeper sweeps every expired escrow, skipping those that may not be cancelled
    auto cancelled = 0;
    for(auto& addr : { a1, a2, a3 }) {
        try {
            push<autocancel>(arbitrator_key, addr);
            cancelled++;
        }
        catch(const escrow_state_exception&) {
        }
    }

    CHECK(cancelled == 2);
    CHECK(get_escrow(a1).state() == escrow_state::cancelled);
    CHECK(get_escrow(a2).state() == escrow_state::cancelled);
    CHECK(get_escrow(a3).state() == escrow_state::funded);
    CHECK(balance(seller) == kSellerFunds - kAmount - kFee);
}
