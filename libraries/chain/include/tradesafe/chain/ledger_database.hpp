/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
*/
#pragma once
#include <functional>
#include <memory>
#include <boost/noncopyable.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/filesystem.hpp>
#include <tradesafe/chain/types.hpp>
#include <tradesafe/chain/address.hpp>
#include <tradesafe/chain/asset.hpp>
#include <tradesafe/chain/escrow_object.hpp>

namespace tradesafe { namespace chain {

enum class storage_profile {
    disk   = 0,
    memory = 1
};

using read_escrow_func  = std::function<bool(escrow_def&&)>;
using read_account_func = std::function<bool(token_account_def&&)>;

/**
 * Plain image of every row, written and read as JSON
 */
struct ledger_snapshot {
    vector<escrow_def>        escrows;
    vector<token_account_def> accounts;
};

/**
 * Persistent store of escrow records and token accounts.
 *
 * Writes are applied to rocksdb immediately. Every open savepoint keeps the
 * original value of each key it touched, so a savepoint can be rolled back
 * or squashed into the previous one.
 */
class ledger_database : boost::noncopyable {
public:
    struct config {
        storage_profile profile          = storage_profile::disk;
        uint32_t        block_cache_size = 64 * 1024 * 1024; // 64M
        fc::path        db_path          = "ledgerdb";
    };

    class session {
    public:
        session(ledger_database& ledger_db, int64_t seq)
            : _ledger_db(ledger_db)
            , _seq(seq)
            , _accept(0) {}

        session(const session& s) = delete;
        session(session&& s) noexcept
            : _ledger_db(s._ledger_db)
            , _seq(s._seq)
            , _accept(s._accept) {
            if(!_accept) {
                s._accept = 1;
            }
        }

        ~session() {
            if(!_accept) {
                _ledger_db.rollback_to_latest_savepoint();
            }
        }

    public:
        void accept() { _accept = 1; }
        void
        commit() {
            _accept = 1;
            // nested sessions hand their originals to the enclosing savepoint
            if(_ledger_db.savepoints_size() > 1) {
                _ledger_db.squash();
            }
            else {
                _ledger_db.pop_back_savepoint();
            }
        }


        void squash() { _accept = 1; _ledger_db.squash(); }
        void undo()   { _accept = 1; _ledger_db.rollback_to_latest_savepoint(); }

        int64_t seq() const { return _seq; }

    private:
        ledger_database& _ledger_db;
        int64_t          _seq;
        int              _accept;
    };

public:
    ledger_database(const config&);
    ~ledger_database();

public:
    void open();
    void close();

    bool is_open() const;

public:
    void put_escrow(const escrow_def& escrow);
    void remove_escrow(const address& addr);

    int exists_escrow(const address& addr) const;
    int read_escrow(const address& addr, escrow_def& out, bool no_throw = false) const;
    int read_escrows_range(int skip, const read_escrow_func& func) const;

public:
    void put_account(const token_account_def& account);
    void remove_account(const address& addr, symbol_id_type sym_id);

    int exists_account(const address& addr, symbol_id_type sym_id) const;
    int read_account(const address& addr, symbol_id_type sym_id, token_account_def& out, bool no_throw = false) const;
    int read_accounts_range(symbol_id_type sym_id, int skip, const read_account_func& func) const;

public:
    void    add_savepoint(int64_t seq);
    void    rollback_to_latest_savepoint();
    void    pop_back_savepoint();
    void    squash();
    int64_t latest_savepoint_seq() const;
    size_t  savepoints_size() const;

    session new_savepoint_session(int64_t seq);
    session new_savepoint_session();

public:
    ledger_snapshot make_snapshot() const;
    void            load_snapshot(const ledger_snapshot& snapshot);

    void                   write_snapshot(const fc::path& file) const;
    static ledger_snapshot read_snapshot(const fc::path& file);

private:
    std::unique_ptr<class ledger_database_impl> my_;
};

}}  // namespace tradesafe::chain

FC_REFLECT_ENUM(tradesafe::chain::storage_profile, (disk)(memory));
FC_REFLECT(tradesafe::chain::ledger_database::config, (profile)(block_cache_size)(db_path));
FC_REFLECT(tradesafe::chain::ledger_snapshot, (escrows)(accounts));
