/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#pragma once
#include <catch2/catch.hpp>

#include <tradesafe/chain/addressing.hpp>
#include <tradesafe/chain/controller.hpp>
#include <tradesafe/chain/exceptions.hpp>
#include <tradesafe/chain/contracts/types.hpp>
#include <tradesafe/testing/tester.hpp>

using namespace tradesafe;
using namespace chain;
using namespace contracts;
using namespace testing;

extern std::string tradesafe_unittests_dir;

class escrow_test {
public:
    static constexpr share_type kAmount = 1'000'000;
    static constexpr share_type kFee    = 10'000;
    static constexpr share_type kBond   = 50'000;

    static constexpr share_type kSellerFunds = 10'000'000;
    static constexpr share_type kBuyerFunds  = 1'000'000;
    static constexpr share_type kNativeFunds = 100'000'000;

public:
    escrow_test()
        : my_tester(new tester()) {
        seller_key     = tester::get_public_key("seller");
        buyer_key      = tester::get_public_key("buyer");
        arbitrator_key = my_tester->get_config().arbitrator;
        stranger_key   = tester::get_public_key("stranger");

        seller     = address(seller_key);
        buyer      = address(buyer_key);
        arbitrator = address(arbitrator_key);
        stranger   = address(stranger_key);

        rent = my_tester->get_config().rent_deposit;

        my_tester->add_money(seller, my_tester->token(kSellerFunds));
        my_tester->add_money(buyer, my_tester->token(kBuyerFunds));
        my_tester->add_money(stranger, my_tester->token(kBuyerFunds));

        my_tester->add_native(seller, kNativeFunds);
        my_tester->add_native(buyer, kNativeFunds);
        my_tester->add_native(stranger, kNativeFunds);

        my_tester->control->emitted_event.connect([this](const escrow_event& ev) {
            events.emplace_back(ev);
        });
    }

    virtual ~escrow_test() {}

protected:
    address
    create_escrow(escrow_id_type id, trade_id_type trade, share_type amount = kAmount,
                  bool sequential = false, const optional<address>& seq_addr = std::nullopt) {
        auto ce               = createescrow();
        ce.escrow_id          = id;
        ce.trade_id           = trade;
        ce.buyer              = buyer;
        ce.amount             = amount;
        ce.sequential         = sequential;
        ce.sequential_address = seq_addr;

        my_tester->push_action(seller_key, ce);
        return my_tester->addresses(id, trade).escrow;
    }

    template <typename T>
    action_trace
    push(const public_key_type& signer, const address& escrow) {
        auto act   = T();
        act.escrow = escrow;
        return my_tester->push_action(signer, act);
    }

    address
    create_and_fund(escrow_id_type id, trade_id_type trade) {
        auto addr = create_escrow(id, trade);
        push<fundescrow>(seller_key, addr);
        return addr;
    }

    address
    create_fund_and_pay(escrow_id_type id, trade_id_type trade) {
        auto addr = create_and_fund(id, trade);
        push<markfiatpaid>(buyer_key, addr);
        return addr;
    }

    action_trace
    open_dispute(const public_key_type& signer, const address& escrow, const bytes& hash) {
        auto od          = opendispute();
        od.escrow        = escrow;
        od.evidence_hash = hash;
        return my_tester->push_action(signer, od);
    }

    action_trace
    respond_dispute(const public_key_type& signer, const address& escrow, const bytes& hash) {
        auto rd          = respdispute();
        rd.escrow        = escrow;
        rd.evidence_hash = hash;
        return my_tester->push_action(signer, rd);
    }

    action_trace
    resolve_dispute(const public_key_type& signer, const address& escrow, bool buyer_wins, const bytes& hash) {
        auto rd             = resolvedisp();
        rd.escrow           = escrow;
        rd.buyer_wins       = buyer_wins;
        rd.explanation_hash = hash;
        return my_tester->push_action(signer, rd);
    }

    share_type
    balance(const address& addr) const {
        return my_tester->balance(addr).amount();
    }

    escrow_def
    get_escrow(const address& addr) const {
        return my_tester->control->get_escrow(addr);
    }

    address
    vault(const address& escrow, vault_kind kind) const {
        return derive_vault_address(my_tester->get_config().program_id, escrow, kind);
    }

protected:
    std::unique_ptr<tester> my_tester;

    public_key_type seller_key;
    public_key_type buyer_key;
    public_key_type arbitrator_key;
    public_key_type stranger_key;

    address seller;
    address buyer;
    address arbitrator;
    address stranger;

    share_type rent;

    std::vector<escrow_event> events;
};
