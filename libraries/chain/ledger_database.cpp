/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#include <tradesafe/chain/ledger_database.hpp>

#include <deque>
#include <optional>

#include <rocksdb/db.h>
#include <rocksdb/cache.h>
#include <rocksdb/env.h>
#include <rocksdb/options.h>
#include <rocksdb/table.h>
#include <rocksdb/write_batch.h>

#include <llvm/ADT/StringMap.h>

#include <fc/filesystem.hpp>
#include <fc/io/datastream.hpp>
#include <fc/io/json.hpp>
#include <fc/io/raw.hpp>
#include <fc/reflect/variant.hpp>

#include <tradesafe/chain/exceptions.hpp>

namespace tradesafe { namespace chain {

namespace internal {

const char kEscrowPrefix  = 'e';
const char kAccountPrefix = 'a';

std::string
escrow_key(const address& addr) {
    auto key = std::string(1, kEscrowPrefix);
    auto raw = fc::raw::pack(addr);
    key.append(raw.data(), raw.size());
    return key;
}

std::string
account_prefix(symbol_id_type sym_id) {
    auto key = std::string(1, kAccountPrefix);
    // big endian keeps accounts of one symbol adjacent and ordered
    for(int i = sizeof(sym_id) - 1; i >= 0; i--) {
        key.push_back((char)((sym_id >> (8 * i)) & 0xff));
    }
    return key;
}

std::string
account_key(const address& addr, symbol_id_type sym_id) {
    auto key = account_prefix(sym_id);
    auto raw = fc::raw::pack(addr);
    key.append(raw.data(), raw.size());
    return key;
}

template<typename T>
std::string
make_db_value(const T& v) {
    auto raw = fc::raw::pack(v);
    return std::string(raw.data(), raw.size());
}

template<typename T>
void
extract_db_value(const std::string& str, T& v) {
    auto ds = fc::datastream<const char*>(str.data(), str.size());
    fc::raw::unpack(ds, v);
}

struct savepoint {
    savepoint(int64_t seq) : seq(seq) {}

    int64_t seq;
    // original value of every key touched since this savepoint, nullopt for absent keys
    llvm::StringMap<std::optional<std::string>> originals;
};

}  // namespace internal

class ledger_database_impl : boost::noncopyable {
public:
    ledger_database_impl(const ledger_database::config& config);
    ~ledger_database_impl();

public:
    void open();
    void close();

    void put(const std::string& key, const std::string& value);
    void remove(const std::string& key);
    int  read(const std::string& key, std::string& out) const;
    int  read_range(const std::string& prefix, int skip, const std::function<bool(std::string&&)>& func) const;

public:
    void    add_savepoint(int64_t seq);
    void    rollback_to_latest_savepoint();
    void    pop_back_savepoint();
    void    squash();
    int64_t latest_savepoint_seq() const;
    int64_t new_savepoint_session_seq() const;

private:
    void record(const std::string& key);

public:
    ledger_database::config config_;

    std::unique_ptr<rocksdb::Env> env_;
    rocksdb::DB*                  db_;
    rocksdb::ReadOptions          read_opts_;
    rocksdb::WriteOptions         write_opts_;

    std::deque<internal::savepoint> savepoints_;
};

ledger_database_impl::ledger_database_impl(const ledger_database::config& config)
    : config_(config)
    , db_(nullptr)
    , read_opts_()
    , write_opts_() {}

ledger_database_impl::~ledger_database_impl() {
    close();
}

void
ledger_database_impl::open() {
    using namespace rocksdb;

    TRADESAFE_ASSERT(db_ == nullptr, database_exception, "Ledger database is already opened");

    auto options = Options();
    options.create_if_missing = true;

    if(config_.profile == storage_profile::disk) {
        auto table_opts = BlockBasedTableOptions();
        table_opts.block_cache = NewLRUCache(config_.block_cache_size);
        options.table_factory.reset(NewBlockBasedTableFactory(table_opts));

        if(!fc::exists(config_.db_path)) {
            fc::create_directories(config_.db_path);
        }
    }
    else if(config_.profile == storage_profile::memory) {
        env_.reset(NewMemEnv(Env::Default()));
        options.env = env_.get();
    }
    else {
        TRADESAFE_THROW(database_exception, "Unknown ledger database profile");
    }

    read_opts_.total_order_seek = true;

    auto status = DB::Open(options, config_.db_path.to_native_ansi_path(), &db_);
    if(!status.ok()) {
        TRADESAFE_THROW(database_exception, "Rocksdb internal error: ${err}", ("err", status.ToString()));
    }
}

void
ledger_database_impl::close() {
    if(db_) {
        // uncommitted savepoints never reach the next session
        while(!savepoints_.empty()) {
            rollback_to_latest_savepoint();
        }

        delete db_;
        db_ = nullptr;
    }
    env_.reset();
}

void
ledger_database_impl::record(const std::string& key) {
    if(savepoints_.empty()) {
        return;
    }

    auto& originals = savepoints_.back().originals;
    if(originals.find(key) != originals.end()) {
        return;
    }

    auto value = std::string();
    if(read(key, value)) {
        originals.try_emplace(key, std::move(value));
    }
    else {
        originals.try_emplace(key, std::nullopt);
    }
}

void
ledger_database_impl::put(const std::string& key, const std::string& value) {
    TRADESAFE_ASSERT(db_ != nullptr, database_exception, "Ledger database is not opened");

    record(key);
    auto status = db_->Put(write_opts_, key, value);
    if(!status.ok()) {
        FC_THROW_EXCEPTION(fc::unrecoverable_exception, "Rocksdb internal error: ${err}", ("err", status.ToString()));
    }
}

void
ledger_database_impl::remove(const std::string& key) {
    TRADESAFE_ASSERT(db_ != nullptr, database_exception, "Ledger database is not opened");

    record(key);
    auto status = db_->Delete(write_opts_, key);
    if(!status.ok()) {
        FC_THROW_EXCEPTION(fc::unrecoverable_exception, "Rocksdb internal error: ${err}", ("err", status.ToString()));
    }
}

int
ledger_database_impl::read(const std::string& key, std::string& out) const {
    TRADESAFE_ASSERT(db_ != nullptr, database_exception, "Ledger database is not opened");

    auto status = db_->Get(read_opts_, key, &out);
    if(!status.ok()) {
        if(!status.IsNotFound()) {
            FC_THROW_EXCEPTION(fc::unrecoverable_exception, "Rocksdb internal error: ${err}", ("err", status.ToString()));
        }
        return false;
    }
    return true;
}

int
ledger_database_impl::read_range(const std::string& prefix, int skip, const std::function<bool(std::string&&)>& func) const {
    TRADESAFE_ASSERT(db_ != nullptr, database_exception, "Ledger database is not opened");

    auto it    = std::unique_ptr<rocksdb::Iterator>(db_->NewIterator(read_opts_));
    auto key   = rocksdb::Slice(prefix);
    auto i     = 0;
    auto count = 0;

    it->Seek(key);
    while(it->Valid() && it->key().starts_with(key)) {
        if(i++ < skip) {
            it->Next();
            continue;
        }

        count++;
        if(!func(it->value().ToString())) {
            return count;
        }
        it->Next();
    }
    if(!it->status().ok()) {
        FC_THROW_EXCEPTION(fc::unrecoverable_exception, "Rocksdb internal error: ${err}", ("err", it->status().ToString()));
    }
    return count;
}

void
ledger_database_impl::add_savepoint(int64_t seq) {
    if(!savepoints_.empty()) {
        auto& b = savepoints_.back();
        if(b.seq >= seq) {
            TRADESAFE_THROW(savepoint_exception, "Seq is not valid, prev: ${prev}, curr: ${curr}",
                      ("prev", b.seq)("curr", seq));
        }
    }
    savepoints_.emplace_back(seq);
}

void
ledger_database_impl::rollback_to_latest_savepoint() {
    TRADESAFE_ASSERT(!savepoints_.empty(), savepoint_exception, "There's no savepoints anymore");

    auto& sp    = savepoints_.back();
    auto  batch = rocksdb::WriteBatch();
    for(auto& it : sp.originals) {
        auto k = rocksdb::Slice(it.first().data(), it.first().size());
        if(it.second.has_value()) {
            batch.Put(k, *it.second);
        }
        else {
            batch.Delete(k);
        }
    }

    auto status = db_->Write(write_opts_, &batch);
    if(!status.ok()) {
        FC_THROW_EXCEPTION(fc::unrecoverable_exception, "Rocksdb internal error: ${err}", ("err", status.ToString()));
    }
    savepoints_.pop_back();
}

void
ledger_database_impl::pop_back_savepoint() {
    TRADESAFE_ASSERT(!savepoints_.empty(), savepoint_exception, "There's no savepoints anymore");
    savepoints_.pop_back();
}

void
ledger_database_impl::squash() {
    TRADESAFE_ASSERT(savepoints_.size() >= 2, savepoint_exception, "Squash needs at least two savepoints.");

    auto top = std::move(savepoints_.back());
    savepoints_.pop_back();

    // the older savepoint keeps its own original when both touched a key
    auto& prev = savepoints_.back().originals;
    for(auto& it : top.originals) {
        prev.try_emplace(it.first(), std::move(it.second));
    }
}

int64_t
ledger_database_impl::latest_savepoint_seq() const {
    TRADESAFE_ASSERT(!savepoints_.empty(), savepoint_exception, "There's no savepoints anymore");
    return savepoints_.back().seq;
}

int64_t
ledger_database_impl::new_savepoint_session_seq() const {
    int64_t seq = 1;
    if(!savepoints_.empty()) {
        seq = savepoints_.back().seq + 1;
    }
    return seq;
}

ledger_database::ledger_database(const config& config)
    : my_(std::make_unique<ledger_database_impl>(config)) {}

ledger_database::~ledger_database() {}

void
ledger_database::open() {
    my_->open();
}

void
ledger_database::close() {
    my_->close();
}

bool
ledger_database::is_open() const {
    return my_->db_ != nullptr;
}

void
ledger_database::put_escrow(const escrow_def& escrow) {
    using namespace internal;
    my_->put(escrow_key(escrow.escrow), make_db_value(escrow));
}

void
ledger_database::remove_escrow(const address& addr) {
    using namespace internal;
    TRADESAFE_ASSERT2(exists_escrow(addr), unknown_escrow_exception, "Cannot find escrow: {}", addr);
    my_->remove(escrow_key(addr));
}

int
ledger_database::exists_escrow(const address& addr) const {
    using namespace internal;
    auto value = std::string();
    return my_->read(escrow_key(addr), value);
}

int
ledger_database::read_escrow(const address& addr, escrow_def& out, bool no_throw) const {
    using namespace internal;

    auto value = std::string();
    if(!my_->read(escrow_key(addr), value)) {
        if(!no_throw) {
            TRADESAFE_THROW2(unknown_escrow_exception, "Cannot find escrow: {}", addr);
        }
        return false;
    }
    extract_db_value(value, out);
    return true;
}

int
ledger_database::read_escrows_range(int skip, const read_escrow_func& func) const {
    using namespace internal;

    return my_->read_range(std::string(1, kEscrowPrefix), skip, [&](auto&& value) {
        auto escrow = escrow_def();
        extract_db_value(value, escrow);
        return func(std::move(escrow));
    });
}

void
ledger_database::put_account(const token_account_def& account) {
    using namespace internal;
    my_->put(account_key(account.addr, account.sym.id()), make_db_value(account));
}

void
ledger_database::remove_account(const address& addr, symbol_id_type sym_id) {
    using namespace internal;
    TRADESAFE_ASSERT2(exists_account(addr, sym_id), unknown_account_exception,
        "There's no account of symbol id: {} in address: {}", sym_id, addr);
    my_->remove(account_key(addr, sym_id));
}

int
ledger_database::exists_account(const address& addr, symbol_id_type sym_id) const {
    using namespace internal;
    auto value = std::string();
    return my_->read(account_key(addr, sym_id), value);
}

int
ledger_database::read_account(const address& addr, symbol_id_type sym_id, token_account_def& out, bool no_throw) const {
    using namespace internal;

    auto value = std::string();
    if(!my_->read(account_key(addr, sym_id), value)) {
        if(!no_throw) {
            TRADESAFE_THROW2(unknown_account_exception, "There's no account of symbol id: {} in address: {}", sym_id, addr);
        }
        return false;
    }
    extract_db_value(value, out);
    return true;
}

int
ledger_database::read_accounts_range(symbol_id_type sym_id, int skip, const read_account_func& func) const {
    using namespace internal;

    return my_->read_range(account_prefix(sym_id), skip, [&](auto&& value) {
        auto account = token_account_def();
        extract_db_value(value, account);
        return func(std::move(account));
    });
}

void
ledger_database::add_savepoint(int64_t seq) {
    my_->add_savepoint(seq);
}

void
ledger_database::rollback_to_latest_savepoint() {
    my_->rollback_to_latest_savepoint();
}

void
ledger_database::pop_back_savepoint() {
    my_->pop_back_savepoint();
}

void
ledger_database::squash() {
    my_->squash();
}

int64_t
ledger_database::latest_savepoint_seq() const {
    return my_->latest_savepoint_seq();
}

size_t
ledger_database::savepoints_size() const {
    return my_->savepoints_.size();
}

ledger_database::session
ledger_database::new_savepoint_session(int64_t seq) {
    my_->add_savepoint(seq);
    return session(*this, seq);
}

ledger_database::session
ledger_database::new_savepoint_session() {
    auto seq = my_->new_savepoint_session_seq();
    my_->add_savepoint(seq);
    return session(*this, seq);
}

ledger_snapshot
ledger_database::make_snapshot() const {
    using namespace internal;

    auto snapshot = ledger_snapshot();
    read_escrows_range(0, [&](auto&& escrow) {
        snapshot.escrows.emplace_back(std::move(escrow));
        return true;
    });
    my_->read_range(std::string(1, kAccountPrefix), 0, [&](auto&& value) {
        auto account = token_account_def();
        extract_db_value(value, account);
        snapshot.accounts.emplace_back(std::move(account));
        return true;
    });
    return snapshot;
}

void
ledger_database::load_snapshot(const ledger_snapshot& snapshot) {
    using namespace internal;

    auto empty = true;
    my_->read_range(std::string(), 0, [&](auto&&) {
        empty = false;
        return false;
    });
    TRADESAFE_ASSERT(empty, snapshot_exception, "Snapshot can only be loaded into an empty ledger database");

    for(auto& escrow : snapshot.escrows) {
        put_escrow(escrow);
    }
    for(auto& account : snapshot.accounts) {
        put_account(account);
    }
}

void
ledger_database::write_snapshot(const fc::path& file) const {
    try {
        auto var = fc::variant();
        fc::to_variant(make_snapshot(), var);
        fc::json::save_to_file(var, file, true);
    }
    TRADESAFE_CAPTURE_AND_RETHROW(snapshot_exception, (file));
}

ledger_snapshot
ledger_database::read_snapshot(const fc::path& file) {
    try {
        TRADESAFE_ASSERT(fc::exists(file), snapshot_exception, "Snapshot file: ${f} doesn't exist", ("f", file));
        return fc::json::from_file(file).as<ledger_snapshot>();
    }
    TRADESAFE_CAPTURE_AND_RETHROW(snapshot_exception, (file));
}

}}  // namespace tradesafe::chain
