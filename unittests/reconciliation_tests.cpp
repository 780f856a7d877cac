/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#include "contracts/escrow_tests.hpp"

#include <tradesafe/chain/reconciliation.hpp>

TEST_CASE_METHOD(escrow_test, "reconciliation_clean_test", "[reconciliation]") {
    auto& ledger_db = my_tester->control->ledger_db();
    auto& conf      = my_tester->get_config();

    auto empty = inspect(ledger_db, conf);
    CHECK(empty.escrows == 0);
    CHECK(empty.rows.empty());
    CHECK(empty.mismatches == 0);

    auto a1 = create_escrow(1, 1);
    auto a2 = create_and_fund(2, 2);
    auto a3 = create_fund_and_pay(3, 3);
    push<releaseesc>(seller_key, a3);

    auto report = inspect(ledger_db, conf);
    CHECK(report.escrows == 3);
    CHECK(report.rows.size() == 3);
    CHECK(report.accounts_with_funds == 1);
    CHECK(report.total_locked == kAmount + kFee);
    CHECK(report.mismatches == 0);

    for(auto& row : report.rows) {
        CHECK(row.principal_vault == vault(row.escrow, vault_kind::principal));

        if(row.escrow == a1) {
            CHECK(row.state == escrow_state::created);
            CHECK(row.status == vault_status::closed);
            CHECK(row.actual == 0);
        }
        else if(row.escrow == a2) {
            CHECK(row.state == escrow_state::funded);
            CHECK(row.status == vault_status::open);
            CHECK(row.tracked == kAmount + kFee);
            CHECK(row.actual == kAmount + kFee);
            CHECK(row.rent == rent);
            CHECK(!row.fiat_paid);
        }
        else {
            CHECK(row.escrow == a3);
            CHECK(row.state == escrow_state::released);
            CHECK(row.status == vault_status::closed);
            CHECK(row.tracked == 0);
        }
    }
}

TEST_CASE_METHOD(escrow_test, "reconciliation_mismatch_test", "[reconciliation]") {
    auto& ledger_db = my_tester->control->ledger_db();
    auto& conf      = my_tester->get_config();

    auto addr = create_fund_and_pay(1, 1);
    auto pv   = vault(addr, vault_kind::principal);

    // anyone can send tokens straight to a vault address
    auto tf   = transferft();
    tf.from   = stranger;
    tf.to     = pv;
    tf.number = my_tester->token(500);
    my_tester->push_action(stranger_key, tf);

    auto row = inspect_escrow(ledger_db, conf, addr);
    CHECK(row.status == vault_status::mismatch);
    CHECK(row.tracked == kAmount + kFee);
    CHECK(row.actual == kAmount + kFee + 500);

    auto report = inspect(ledger_db, conf);
    CHECK(report.mismatches == 1);
    CHECK(report.total_locked == kAmount + kFee + 500);

    // the untracked surplus is swept to the rent payer when the vault closes
    push<releaseesc>(seller_key, addr);
    CHECK(balance(buyer) == kBuyerFunds + kAmount);
    CHECK(balance(arbitrator) == kFee);
    CHECK(balance(seller) == kSellerFunds - kAmount - kFee + 500);

    CHECK(inspect_escrow(ledger_db, conf, addr).status == vault_status::closed);
    CHECK(inspect(ledger_db, conf).mismatches == 0);

    CHECK_THROWS_AS(inspect_escrow(ledger_db, conf, my_tester->addresses(9, 9).escrow), unknown_escrow_exception);
}

TEST_CASE_METHOD(escrow_test, "reconciliation_format_test", "[reconciliation]") {
    auto& ledger_db = my_tester->control->ledger_db();
    auto& conf      = my_tester->get_config();

    create_and_fund(11, 12);
    auto paid = create_fund_and_pay(21, 22);

    my_tester->add_money(vault(paid, vault_kind::principal), my_tester->token(1));

    auto text = format_report(inspect(ledger_db, conf), conf);
    CHECK(text.find("Escrow ID") != std::string::npos);
    CHECK(text.find("Funded") != std::string::npos);
    CHECK(text.find("Open") != std::string::npos);
    CHECK(text.find("MISMATCH") != std::string::npos);
    CHECK(text.find("1.010000 S#1") != std::string::npos);
    CHECK(text.find("mismatches: 1") != std::string::npos);
    CHECK(text.find(paid.to_string()) != std::string::npos);

    CHECK(std::string(vault_status_to_string(vault_status::closed)) == "Closed");
}

TEST_CASE_METHOD(escrow_test, "reconciliation_snapshot_test", "[reconciliation]") {
    auto addr = create_and_fund(1, 1);

    auto file = fc::path(tradesafe_unittests_dir) / "reconciliation_snapshot.json";
    if(!fc::exists(file.parent_path())) {
        fc::create_directories(file.parent_path());
    }
    my_tester->control->ledger_db().write_snapshot(file);

    // a fresh ledger restored from the snapshot yields the same report
    auto cfg    = ledger_database::config();
    cfg.profile = storage_profile::memory;
    cfg.db_path = tradesafe_unittests_dir + "/reconciliation_restored";

    auto restored = ledger_database(cfg);
    restored.open();
    restored.load_snapshot(ledger_database::read_snapshot(file));

    auto report = inspect(restored, my_tester->get_config());
    REQUIRE(report.rows.size() == 1);
    CHECK(report.rows[0].escrow == addr);
    CHECK(report.rows[0].status == vault_status::open);
    CHECK(report.total_locked == kAmount + kFee);

    restored.close();
}
