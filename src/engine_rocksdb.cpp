/**
 * @file engine_rocksdb.cpp
 * @author Ashot Vardanian
 *
 * @brief Embedded Persistent Key-Value Store on top of @b RocksDB.
 * It natively supports ACID transactions and iterators (range queries)
 * and is implemented via @b Log-Structured-Merge-Tree. This makes RocksDB
 * great for write-intensive operations.
 *
 * ## Layout
 * All records live in the default column family, prefixed with the
 * big-endian 32-bit length of the bucket path and the path itself.
 * Every bucket is only a prefix, so nested buckets never interleave with
 * their parents. Existing bucket paths are listed in a separate column
 * family, sorted so that nested buckets follow their parents.
 *
 * ## Transactions
 * We use the `OptimisticTransactionDB`, but serialize writers on a mutex,
 * so conflicts are impossible. Readers work on a snapshot.
 */

#include <filesystem>
#include <mutex>

#include <rocksdb/db.h>
#include <rocksdb/utilities/options_util.h>
#include <rocksdb/utilities/transaction.h>
#include <rocksdb/utilities/optimistic_transaction_db.h>

#include "ustash/engine.hpp"
#include "ustash/config.hpp"
#include "ustash/log.hpp"

namespace stdfs = std::filesystem;
using namespace unum::ustash;
using namespace unum;

/*********************************************************/
/*****************   Structures & Consts  ****************/
/*********************************************************/

using rocks_native_t = rocksdb::OptimisticTransactionDB;
using rocks_status_t = rocksdb::Status;
using rocks_txn_t = rocksdb::Transaction;
using rocks_collection_t = rocksdb::ColumnFamilyHandle;
using rocks_iterator_t = std::unique_ptr<rocksdb::Iterator>;

static constexpr char const* buckets_family_k = "ustash.buckets";

namespace unum::ustash {

struct engine_database_t {
    std::vector<rocks_collection_t*> columns;
    std::unique_ptr<rocks_native_t> native;
    rocks_collection_t* records = nullptr;
    rocks_collection_t* buckets = nullptr;
    std::mutex writer;
    bool flush = false;
};

struct engine_transaction_t {
    engine_database_t* db = nullptr;
    txn_mode_t mode = txn_mode_t::read_k;
    std::unique_lock<std::mutex> writer;
    std::unique_ptr<rocks_txn_t> txn;
    rocksdb::Snapshot const* snapshot = nullptr;
    bool committed = false;
};

} // namespace unum::ustash

inline rocksdb::Slice to_slice(value_view_t value) noexcept {
    return {value.data(), value.size()};
}

status_t export_error(rocks_status_t const& status, char const* context) {
    if (status.ok())
        return {};
    if (status.IsCorruption())
        return {storage_k, fmt::format("{}: DB Corruption: {}", context, status.ToString())};
    if (status.IsIOError())
        return {storage_k, fmt::format("{}: IO Error: {}", context, status.ToString())};
    if (status.IsInvalidArgument())
        return {args_wrong_k, fmt::format("{}: Invalid Argument: {}", context, status.ToString())};
    return {storage_k, fmt::format("{}: {}", context, status.ToString())};
}

std::string bucket_prefix(value_view_t bucket) {
    auto length = static_cast<std::uint32_t>(bucket.size());
    std::string prefix;
    prefix.reserve(4 + bucket.size());
    prefix.push_back(static_cast<char>((length >> 24) & 0xFF));
    prefix.push_back(static_cast<char>((length >> 16) & 0xFF));
    prefix.push_back(static_cast<char>((length >> 8) & 0xFF));
    prefix.push_back(static_cast<char>(length & 0xFF));
    prefix.append(bucket.data(), bucket.size());
    return prefix;
}

std::string record_key(value_view_t bucket, value_view_t key) {
    std::string result = bucket_prefix(bucket);
    result.append(key.data(), key.size());
    return result;
}

inline bool starts_with(rocksdb::Slice const& slice, std::string const& prefix) noexcept {
    return slice.size() >= prefix.size() && std::memcmp(slice.data(), prefix.data(), prefix.size()) == 0;
}

inline bool is_nested_or_same(rocksdb::Slice const& path, value_view_t bucket) noexcept {
    if (path.size() < bucket.size() || std::memcmp(path.data(), bucket.data(), bucket.size()) != 0)
        return false;
    return path.size() == bucket.size() || path[bucket.size()] == bucket_separator_k;
}

status_t validate_reader(engine_transaction_t* txn) noexcept {
    return_error_if_m(txn, uninitialized_state_k, "Transaction is uninitialized");
    return_error_if_m(!txn->committed, args_wrong_k, "Transaction was already committed");
    return {};
}

status_t validate_writer(engine_transaction_t* txn) noexcept {
    status_t status = validate_reader(txn);
    return_if_error_m(status);
    return_error_if_m(txn->mode == txn_mode_t::write_k, args_wrong_k, "Transaction is read-only");
    return {};
}

rocksdb::ReadOptions read_options(engine_transaction_t const& txn) noexcept {
    rocksdb::ReadOptions options;
    options.snapshot = txn.snapshot;
    return options;
}

rocks_status_t get(engine_transaction_t& txn, rocks_collection_t* collection, rocksdb::Slice key, std::string* value) {
    rocksdb::ReadOptions options = read_options(txn);
    return txn.txn ? txn.txn->Get(options, collection, key, value)
                   : txn.db->native->Get(options, collection, key, value);
}

rocks_iterator_t iterate(engine_transaction_t& txn, rocks_collection_t* collection) {
    rocksdb::ReadOptions options = read_options(txn);
    return rocks_iterator_t(txn.txn ? txn.txn->GetIterator(options, collection)
                                    : txn.db->native->NewIterator(options, collection));
}

rocks_collection_t* find_family(engine_database_t& db,
                                std::vector<rocksdb::ColumnFamilyDescriptor> const& descriptors,
                                std::string const& name) noexcept {
    for (std::size_t i = 0; i != descriptors.size(); ++i)
        if (descriptors[i].name == name)
            return db.columns[i];
    return nullptr;
}

void close_native(engine_database_t& db) noexcept {
    if (db.native)
        for (auto column : db.columns)
            db.native->DestroyColumnFamilyHandle(column);
    db.columns.clear();
    db.native.reset();
}

/*********************************************************/
/*****************	     Interface   	  ****************/
/*********************************************************/

namespace unum::ustash {

char const* engine_name() noexcept {
    return "rocksdb";
}

status_t engine_open(char const* config_str, engine_database_t** db_ptr) noexcept {
    return_error_if_m(db_ptr, args_wrong_k, "Output handle is missing");
    return_error_if_m(config_str && *config_str, args_wrong_k, "RocksDB requires a config with a directory");

    return safe_section("Opening RocksDB", storage_k, [&]() -> status_t {
        auto db = std::make_unique<engine_database_t>();
        rocks_status_t status;

        // Load config
        config_t config;
        status_t loaded = config_loader_t::load_from_json_string(config_str, config);
        return_if_error_m(loaded);
        db->flush = config.flush;

        // Root path
        stdfs::path root = config.directory;
        stdfs::file_status root_status = stdfs::status(root);
        return_error_if_m(root_status.type() == stdfs::file_type::directory,
                          args_wrong_k,
                          "Root isn't a directory");

        // Engine config
        // Recovering RocksDB isn't trivial and depends on a number of configuration parameters:
        // http://rocksdb.org/blog/2016/03/07/rocksdb-options-file.html
        // https://github.com/facebook/rocksdb/wiki/RocksDB-Options-File
        rocksdb::Options options;
        options.compression = rocksdb::kNoCompression;
        auto cf_options = rocksdb::ColumnFamilyOptions();
        std::vector<rocksdb::ColumnFamilyDescriptor> column_descriptors;

        // Load from file
        auto const& config_file = config.engine.config_file_path;
        if (!config_file.empty()) {
            status = rocksdb::LoadOptionsFromFile(config_file, rocksdb::Env::Default(), &options, &column_descriptors);
            return_error_if_m(status.ok(), args_wrong_k, "Couldn't parse RocksDB config");
            log_info_m("Initializing RocksDB from config: %s\n", config_file.c_str());
        }

        // Override with nested
        if (!config.engine.config.empty()) {
            auto const& js = config.engine.config;
            if (js.contains("DBOptions")) {
                auto const& j_db = js["DBOptions"];
                if (j_db.contains("writable_file_max_buffer_size"))
                    options.writable_file_max_buffer_size = j_db["writable_file_max_buffer_size"];
                if (j_db.contains("max_open_files"))
                    options.max_open_files = j_db["max_open_files"];
                if (j_db.contains("max_file_opening_threads"))
                    options.max_file_opening_threads = j_db["max_file_opening_threads"];
            }

            if (js.contains("CFOptions")) {
                auto const& j_cf = js["CFOptions"];
                if (j_cf.contains("max_write_buffer_number"))
                    cf_options.max_write_buffer_number = j_cf["max_write_buffer_number"];
                if (j_cf.contains("write_buffer_size"))
                    cf_options.write_buffer_size = j_cf["write_buffer_size"];
                if (j_cf.contains("target_file_size_base"))
                    cf_options.target_file_size_base = j_cf["target_file_size_base"];
                if (j_cf.contains("max_compaction_bytes"))
                    cf_options.max_compaction_bytes = j_cf["max_compaction_bytes"];
                if (j_cf.contains("level_compaction_dynamic_level_bytes"))
                    cf_options.level_compaction_dynamic_level_bytes = j_cf["level_compaction_dynamic_level_bytes"];
                if (j_cf.contains("level0_stop_writes_trigger"))
                    cf_options.level0_stop_writes_trigger = j_cf["level0_stop_writes_trigger"];
                if (j_cf.contains("target_file_size_multiplier"))
                    cf_options.target_file_size_multiplier = j_cf["target_file_size_multiplier"];
                if (j_cf.contains("max_bytes_for_level_multiplier"))
                    cf_options.max_bytes_for_level_multiplier = j_cf["max_bytes_for_level_multiplier"];
            }
        }

        rocksdb::ConfigOptions config_options;
        status = rocksdb::LoadLatestOptions(config_options, root.string(), &options, &column_descriptors);
        return_error_if_m(status.ok() || status.IsNotFound(), storage_k, "Recovering RocksDB state");

        bool has_records = false;
        bool has_buckets = false;
        for (auto const& descriptor : column_descriptors) {
            has_records |= descriptor.name == rocksdb::kDefaultColumnFamilyName;
            has_buckets |= descriptor.name == buckets_family_k;
        }
        if (!has_records)
            column_descriptors.push_back({rocksdb::kDefaultColumnFamilyName, cf_options});
        if (!has_buckets)
            column_descriptors.push_back({buckets_family_k, cf_options});

        options.create_if_missing = true;
        options.create_missing_column_families = true;

        // Storage paths
        for (auto const& disk : config.data_directories)
            options.db_paths.push_back({disk.path, disk.max_size});

        rocks_native_t* native_db = nullptr;
        rocksdb::OptimisticTransactionDBOptions txn_options;
        status =
            rocks_native_t::Open(options, txn_options, root.string(), column_descriptors, &db->columns, &native_db);
        status_t opened = export_error(status, "Opening RocksDB with options");
        return_if_error_m(opened);

        db->native = std::unique_ptr<rocks_native_t>(native_db);
        db->records = find_family(*db, column_descriptors, rocksdb::kDefaultColumnFamilyName);
        db->buckets = find_family(*db, column_descriptors, buckets_family_k);
        if (!db->records || !db->buckets) {
            close_native(*db);
            return {storage_k, "Missing column families"};
        }

        log_info_m("Opened RocksDB at: %s\n", root.string().c_str());
        *db_ptr = db.release();
        return {};
    });
}

void engine_close(engine_database_t* db) noexcept {
    if (!db)
        return;
    close_native(*db);
    delete db;
}

status_t engine_begin(engine_database_t* db, txn_mode_t mode, engine_transaction_t** txn_ptr) noexcept {
    return_error_if_m(db, uninitialized_state_k, "DataBase is uninitialized");
    return_error_if_m(txn_ptr, args_wrong_k, "Output handle is missing");

    return safe_section("Initializing transaction state", storage_k, [&] {
        auto txn = std::make_unique<engine_transaction_t>();
        txn->db = db;
        txn->mode = mode;
        if (mode == txn_mode_t::write_k) {
            txn->writer = std::unique_lock<std::mutex>(db->writer);
            rocksdb::WriteOptions options;
            options.sync = db->flush;
            txn->txn = std::unique_ptr<rocks_txn_t>(db->native->BeginTransaction(options));
        }
        else
            txn->snapshot = db->native->GetSnapshot();
        *txn_ptr = txn.release();
    });
}

status_t engine_commit(engine_transaction_t* txn) noexcept {
    status_t status = validate_reader(txn);
    return_if_error_m(status);

    if (txn->txn) {
        status = export_error(txn->txn->Commit(), "Committing transaction");
        return_if_error_m(status);
    }

    txn->committed = true;
    if (txn->snapshot) {
        txn->db->native->ReleaseSnapshot(txn->snapshot);
        txn->snapshot = nullptr;
    }
    if (txn->writer.owns_lock())
        txn->writer.unlock();
    return {};
}

void engine_free(engine_transaction_t* txn) noexcept {
    if (!txn)
        return;
    if (txn->txn && !txn->committed) {
        rocks_status_t status = txn->txn->Rollback();
        if (!status.ok())
            log_error_m("Failed to roll back: %s\n", status.ToString().c_str());
    }
    txn->txn.reset();
    if (txn->snapshot)
        txn->db->native->ReleaseSnapshot(txn->snapshot);
    delete txn;
}

status_t engine_bucket_ensure(engine_transaction_t* txn, value_view_t bucket) noexcept {
    status_t status = validate_writer(txn);
    return_if_error_m(status);
    return_error_if_m(!bucket.empty(), args_wrong_k, "Bucket name can't be empty");

    return safe_section("Creating bucket", storage_k, [&]() -> status_t {
        std::string ignored;
        rocks_status_t found = get(*txn, txn->db->buckets, to_slice(bucket), &ignored);
        if (found.ok())
            return {};
        return_error_if_m(found.IsNotFound(), storage_k, found.ToString());
        return export_error(txn->txn->Put(txn->db->buckets, to_slice(bucket), rocksdb::Slice()), "Creating bucket");
    });
}

status_t engine_bucket_exists(engine_transaction_t* txn, value_view_t bucket, bool& exists) noexcept {
    status_t status = validate_reader(txn);
    return_if_error_m(status);

    return safe_section("Checking bucket", storage_k, [&]() -> status_t {
        std::string ignored;
        rocks_status_t found = get(*txn, txn->db->buckets, to_slice(bucket), &ignored);
        exists = found.ok();
        return_error_if_m(found.ok() || found.IsNotFound(), storage_k, found.ToString());
        return {};
    });
}

status_t engine_bucket_drop(engine_transaction_t* txn, value_view_t bucket) noexcept {
    status_t status = validate_writer(txn);
    return_if_error_m(status);

    return safe_section("Dropping bucket", storage_k, [&]() -> status_t {
        engine_database_t& db = *txn->db;
        std::vector<std::string> dropped;
        {
            rocks_iterator_t it = iterate(*txn, db.buckets);
            for (it->Seek(to_slice(bucket)); it->Valid() && is_nested_or_same(it->key(), bucket); it->Next())
                dropped.push_back(it->key().ToString());
            status_t iterated = export_error(it->status(), "Listing nested buckets");
            return_if_error_m(iterated);
        }

        for (auto const& path : dropped) {
            std::string prefix = bucket_prefix(path);
            std::vector<std::string> keys;
            {
                rocks_iterator_t it = iterate(*txn, db.records);
                for (it->Seek(prefix); it->Valid() && starts_with(it->key(), prefix); it->Next())
                    keys.push_back(it->key().ToString());
                status_t iterated = export_error(it->status(), "Listing records");
                return_if_error_m(iterated);
            }
            for (auto const& key : keys) {
                status_t removed = export_error(txn->txn->Delete(db.records, key), "Removing record");
                return_if_error_m(removed);
            }
            status_t removed = export_error(txn->txn->Delete(db.buckets, path), "Removing bucket");
            return_if_error_m(removed);
        }
        return {};
    });
}

status_t engine_read(engine_transaction_t* txn,
                     value_view_t bucket,
                     value_view_t key,
                     bool& found,
                     buffer_t& value) noexcept {
    status_t status = validate_reader(txn);
    return_if_error_m(status);

    found = false;
    return safe_section("Reading value", storage_k, [&]() -> status_t {
        rocks_status_t read = get(*txn, txn->db->records, record_key(bucket, key), &value);
        if (read.IsNotFound())
            return {};
        status_t exported = export_error(read, "Reading value");
        return_if_error_m(exported);
        found = true;
        return {};
    });
}

status_t engine_write(engine_transaction_t* txn, value_view_t bucket, value_view_t key, value_view_t value) noexcept {
    status_t status = validate_writer(txn);
    return_if_error_m(status);

    bool exists = false;
    status = engine_bucket_exists(txn, bucket, exists);
    return_if_error_m(status);
    return_error_if_m(exists, not_found_k, "Bucket doesn't exist");

    return safe_section("Writing value", storage_k, [&] {
        return export_error(txn->txn->Put(txn->db->records, record_key(bucket, key), to_slice(value)),
                            "Writing value");
    });
}

status_t engine_remove(engine_transaction_t* txn, value_view_t bucket, value_view_t key) noexcept {
    status_t status = validate_writer(txn);
    return_if_error_m(status);

    return safe_section("Removing value", storage_k, [&] {
        return export_error(txn->txn->Delete(txn->db->records, record_key(bucket, key)), "Removing value");
    });
}

status_t engine_scan(engine_transaction_t* txn, value_view_t bucket, scan_visitor_t visitor, void* context) noexcept {
    status_t status = validate_reader(txn);
    return_if_error_m(status);
    return_error_if_m(visitor, args_wrong_k, "Visitor is missing");

    return safe_section("Scanning bucket", storage_k, [&]() -> status_t {
        std::string prefix = bucket_prefix(bucket);
        rocks_iterator_t it = iterate(*txn, txn->db->records);
        bool proceed = true;
        for (it->Seek(prefix); proceed && it->Valid() && starts_with(it->key(), prefix); it->Next()) {
            rocksdb::Slice key = it->key();
            rocksdb::Slice value = it->value();
            status_t visited = visitor(context,
                                       value_view_t(key.data() + prefix.size(), key.size() - prefix.size()),
                                       value_view_t(value.data(), value.size()),
                                       proceed);
            return_if_error_m(visited);
        }
        return export_error(it->status(), "Scanning bucket");
    });
}

} // namespace unum::ustash
