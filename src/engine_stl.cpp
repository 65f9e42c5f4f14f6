/**
 * @file engine_stl.cpp
 * @author Ashot Vardanian
 *
 * @brief Embedded In-Memory Key-Value Store implementation using only @b STL.
 * This is not the fastest, not the smartest possible solution for @b ACID KVS,
 * but is a good reference design for educational purposes.
 * Deficiencies:
 * > Global Lock, shared by readers and exclusively held by the only writer.
 * > Rollbacks replay an undo-log, instead of isolating uncommitted changes.
 * > Persistence rewrites the whole dataset on every flush.
 */

#include <string_view>
#include <string>
#include <vector>
#include <map>          // Buckets and their entries
#include <optional>     // Undo-log entries
#include <shared_mutex> // Syncing access to entries container
#include <mutex>        // `std::unique_lock`
#include <cstdio>       // Saving/reading from disk
#include <filesystem>   // Checking the directory

#include <fmt/core.h>

#include "ustash/engine.hpp"
#include "ustash/config.hpp" // `config_loader_t`
#include "ustash/log.hpp"    // `log_info_m`
#include "helpers/file.hpp"  // `file_handle_t`

/*********************************************************/
/*****************   Structures & Consts  ****************/
/*********************************************************/

using namespace unum::ustash;
using namespace unum;
namespace fs = std::filesystem;

using entries_t = std::map<std::string, std::string, std::less<>>;
using buckets_t = std::map<std::string, entries_t, std::less<>>;

static constexpr char const* persisted_file_name_k = "ustash.stl";

/**
 * @brief A single reversible change of a write transaction.
 */
struct undo_t {
    enum kind_t {
        key_k,
        bucket_created_k,
        bucket_dropped_k,
    };

    kind_t kind = key_k;
    std::string bucket;
    std::string key;
    std::optional<std::string> previous_value;
    entries_t previous_entries;
};

namespace unum::ustash {

struct engine_database_t {
    std::shared_mutex mutex;
    buckets_t buckets;

    /**
     * @brief Path on disk, from which the data will be read.
     * When closed, we will try saving the DB on disk.
     */
    std::string persisted_path;
    bool flush = false;
};

struct engine_transaction_t {
    engine_database_t* db = nullptr;
    txn_mode_t mode = txn_mode_t::read_k;
    std::shared_lock<std::shared_mutex> reader;
    std::unique_lock<std::shared_mutex> writer;
    std::vector<undo_t> undo;
    bool committed = false;
};

} // namespace unum::ustash

inline bool is_nested_or_same(std::string_view candidate, std::string_view bucket) noexcept {
    if (candidate.size() < bucket.size() || candidate.compare(0, bucket.size(), bucket) != 0)
        return false;
    return candidate.size() == bucket.size() || candidate[bucket.size()] == bucket_separator_k;
}

/*********************************************************/
/*****************	 Writing to Disk	  ****************/
/*********************************************************/

status_t write_snapshot(engine_database_t const& db, std::string const& path) {
    // Using the classical C++ IO mechanisms is a bad tone in the modern world.
    // They are ugly and, more importantly, painfully slow.
    // So instead we stick to the LibC way of doing things.
    // Writing into a temporary file and renaming it keeps the previous
    // snapshot intact, if we fail halfway.
    std::string temporary_path = path + ".tmp";
    file_handle_t handle;
    status_t status = handle.open(temporary_path.c_str(), "wb+");
    return_if_error_m(status);

    // Print stats about the overall dataset
    std::fprintf(handle, "Total Buckets: %zu\n", db.buckets.size());
    for (auto const& [bucket, entries] : db.buckets) {
        status = handle.write_chunk(bucket);
        return_if_error_m(status);
        status = handle.write_chunk(std::to_string(entries.size()));
        return_if_error_m(status);
        for (auto const& [key, value] : entries) {
            status = handle.write_chunk(key);
            return_if_error_m(status);
            status = handle.write_chunk(value);
            return_if_error_m(status);
        }
    }

    status = handle.close();
    return_if_error_m(status);

    std::error_code error;
    fs::rename(temporary_path, path, error);
    return_error_if_m(!error, storage_k, fmt::format("Couldn't replace {}: {}", path, error.message()));
    return {};
}

status_t read_snapshot(engine_database_t& db, std::string const& path) {
    db.buckets.clear();

    // Check if file even exists
    if (!fs::exists(path))
        return {};

    // Similar to serialization, we don't use STL here
    file_handle_t handle;
    status_t status = handle.open(path.c_str(), "rb");
    return_if_error_m(status);

    // Skip the metadata row
    char line_buffer[256];
    return_error_if_m(std::fgets(line_buffer, sizeof(line_buffer), handle), storage_k, "Missing snapshot header");

    bool eof = false;
    buffer_t bucket, count, key, value;
    while (true) {
        status = handle.read_chunk(bucket, eof);
        return_if_error_m(status);
        if (eof)
            break;

        status = handle.read_chunk(count, eof);
        return_if_error_m(status);
        return_error_if_m(!eof, storage_k, "Snapshot truncated after bucket name");
        auto entries_count = std::strtoull(count.c_str(), nullptr, 10);

        entries_t& entries = db.buckets[bucket];
        for (std::size_t i = 0; i != entries_count; ++i) {
            status = handle.read_chunk(key, eof);
            return_if_error_m(status);
            return_error_if_m(!eof, storage_k, "Snapshot truncated on key");
            status = handle.read_chunk(value, eof);
            return_if_error_m(status);
            return_error_if_m(!eof, storage_k, "Snapshot truncated on value");
            entries.insert_or_assign(key, value);
        }
    }

    return handle.close();
}

/*********************************************************/
/*****************	     Rollbacks   	  ****************/
/*********************************************************/

void rollback(engine_transaction_t& txn) noexcept {
    buckets_t& buckets = txn.db->buckets;
    for (auto it = txn.undo.rbegin(); it != txn.undo.rend(); ++it) {
        undo_t& change = *it;
        switch (change.kind) {
        case undo_t::key_k: {
            auto bucket_it = buckets.find(change.bucket);
            if (bucket_it == buckets.end())
                break;
            if (change.previous_value)
                bucket_it->second.insert_or_assign(change.key, std::move(*change.previous_value));
            else
                bucket_it->second.erase(change.key);
            break;
        }
        case undo_t::bucket_created_k: buckets.erase(change.bucket); break;
        case undo_t::bucket_dropped_k:
            buckets.insert_or_assign(change.bucket, std::move(change.previous_entries));
            break;
        }
    }
    txn.undo.clear();
}

status_t validate_writer(engine_transaction_t* txn) noexcept {
    return_error_if_m(txn, uninitialized_state_k, "Transaction is uninitialized");
    return_error_if_m(txn->mode == txn_mode_t::write_k, args_wrong_k, "Transaction is read-only");
    return_error_if_m(!txn->committed, args_wrong_k, "Transaction was already committed");
    return {};
}

status_t validate_reader(engine_transaction_t* txn) noexcept {
    return_error_if_m(txn, uninitialized_state_k, "Transaction is uninitialized");
    return_error_if_m(!txn->committed, args_wrong_k, "Transaction was already committed");
    return {};
}

/*********************************************************/
/*****************	    C++ Interface 	  ****************/
/*********************************************************/

namespace unum::ustash {

char const* engine_name() noexcept {
    return "stl";
}

status_t engine_open(char const* config_str, engine_database_t** db_ptr) noexcept {
    return_error_if_m(db_ptr, args_wrong_k, "Output handle is missing");

    return safe_section("Opening STL engine", storage_k, [&]() -> status_t {
        auto db = std::make_unique<engine_database_t>();

        // Volatile in-memory instance
        std::string_view config_view = config_str ? config_str : "";
        if (config_view.find_first_not_of(" \t\r\n") != std::string_view::npos) {
            config_t config;
            status_t status = config_loader_t::load_from_json_string(config_str, config);
            status.annotate("Invalid config");
            return_if_error_m(status);

            if (!config.directory.empty()) {
                fs::file_status root_status = fs::status(config.directory);
                return_error_if_m(root_status.type() == fs::file_type::directory,
                                  args_wrong_k,
                                  "Root isn't a directory");
                db->persisted_path = (fs::path(config.directory) / persisted_file_name_k).string();
            }
            db->flush = config.flush;
            if (!config.data_directories.empty())
                log_warning_m("STL engine ignores additional data directories\n");
        }

        if (!db->persisted_path.empty()) {
            status_t status = read_snapshot(*db, db->persisted_path);
            return_if_error_m(status);
            log_info_m("Loaded %zu buckets from: %s\n", db->buckets.size(), db->persisted_path.c_str());
        }

        *db_ptr = db.release();
        return {};
    });
}

void engine_close(engine_database_t* db) noexcept {
    if (!db)
        return;

    if (!db->persisted_path.empty()) {
        status_t status = safe_section("Saving STL snapshot", storage_k, [&] { return write_snapshot(*db, db->persisted_path); });
        if (!status)
            log_error_m("Failed to persist on close: %s\n", status.message());
    }
    delete db;
}

status_t engine_begin(engine_database_t* db, txn_mode_t mode, engine_transaction_t** txn_ptr) noexcept {
    return_error_if_m(db, uninitialized_state_k, "DataBase is uninitialized");
    return_error_if_m(txn_ptr, args_wrong_k, "Output handle is missing");

    return safe_section("Initializing transaction state", storage_k, [&] {
        auto txn = std::make_unique<engine_transaction_t>();
        txn->db = db;
        txn->mode = mode;
        if (mode == txn_mode_t::write_k)
            txn->writer = std::unique_lock<std::shared_mutex>(db->mutex);
        else
            txn->reader = std::shared_lock<std::shared_mutex>(db->mutex);
        *txn_ptr = txn.release();
    });
}

status_t engine_commit(engine_transaction_t* txn) noexcept {
    status_t status = validate_reader(txn);
    return_if_error_m(status);

    engine_database_t& db = *txn->db;
    if (txn->mode == txn_mode_t::write_k && db.flush && !db.persisted_path.empty() && !txn->undo.empty()) {
        status = safe_section("Flushing STL snapshot", storage_k, [&] { return write_snapshot(db, db.persisted_path); });
        if (!status) {
            rollback(*txn);
            return status;
        }
    }

    txn->undo.clear();
    txn->committed = true;
    if (txn->writer.owns_lock())
        txn->writer.unlock();
    if (txn->reader.owns_lock())
        txn->reader.unlock();
    return {};
}

void engine_free(engine_transaction_t* txn) noexcept {
    if (!txn)
        return;
    if (!txn->committed && txn->mode == txn_mode_t::write_k)
        rollback(*txn);
    delete txn;
}

status_t engine_bucket_ensure(engine_transaction_t* txn, value_view_t bucket) noexcept {
    status_t status = validate_writer(txn);
    return_if_error_m(status);
    return_error_if_m(!bucket.empty(), args_wrong_k, "Bucket name can't be empty");

    return safe_section("Creating bucket", storage_k, [&] {
        buckets_t& buckets = txn->db->buckets;
        if (buckets.find(std::string_view(bucket)) != buckets.end())
            return;
        undo_t change;
        change.kind = undo_t::bucket_created_k;
        change.bucket = bucket.str();
        txn->undo.push_back(std::move(change));
        buckets.emplace(bucket.str(), entries_t {});
    });
}

status_t engine_bucket_exists(engine_transaction_t* txn, value_view_t bucket, bool& exists) noexcept {
    status_t status = validate_reader(txn);
    return_if_error_m(status);
    buckets_t const& buckets = txn->db->buckets;
    exists = buckets.find(std::string_view(bucket)) != buckets.end();
    return {};
}

status_t engine_bucket_drop(engine_transaction_t* txn, value_view_t bucket) noexcept {
    status_t status = validate_writer(txn);
    return_if_error_m(status);

    return safe_section("Dropping bucket", storage_k, [&] {
        buckets_t& buckets = txn->db->buckets;
        auto it = buckets.lower_bound(std::string_view(bucket));
        while (it != buckets.end() && is_nested_or_same(it->first, bucket)) {
            undo_t change;
            change.kind = undo_t::bucket_dropped_k;
            change.bucket = it->first;
            // Entries move only once the undo-log has room for them.
            txn->undo.push_back(std::move(change));
            txn->undo.back().previous_entries = std::move(it->second);
            it = buckets.erase(it);
        }
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
    buckets_t const& buckets = txn->db->buckets;
    auto bucket_it = buckets.find(std::string_view(bucket));
    if (bucket_it == buckets.end())
        return {};
    auto entry_it = bucket_it->second.find(std::string_view(key));
    if (entry_it == bucket_it->second.end())
        return {};

    return safe_section("Copying value", storage_k, [&] {
        value = entry_it->second;
        found = true;
    });
}

status_t engine_write(engine_transaction_t* txn, value_view_t bucket, value_view_t key, value_view_t value) noexcept {
    status_t status = validate_writer(txn);
    return_if_error_m(status);

    buckets_t& buckets = txn->db->buckets;
    auto bucket_it = buckets.find(std::string_view(bucket));
    return_error_if_m(bucket_it != buckets.end(), not_found_k, "Bucket doesn't exist");

    return safe_section("Writing value", storage_k, [&] {
        entries_t& entries = bucket_it->second;
        undo_t change;
        change.kind = undo_t::key_k;
        change.bucket = bucket.str();
        change.key = key.str();
        auto entry_it = entries.find(std::string_view(key));
        if (entry_it != entries.end()) {
            change.previous_value = entry_it->second;
            txn->undo.push_back(std::move(change));
            entry_it->second.assign(value.data(), value.size());
        }
        else {
            txn->undo.push_back(std::move(change));
            entries.emplace(key.str(), value.str());
        }
    });
}

status_t engine_remove(engine_transaction_t* txn, value_view_t bucket, value_view_t key) noexcept {
    status_t status = validate_writer(txn);
    return_if_error_m(status);

    buckets_t& buckets = txn->db->buckets;
    auto bucket_it = buckets.find(std::string_view(bucket));
    if (bucket_it == buckets.end())
        return {};
    entries_t& entries = bucket_it->second;
    auto entry_it = entries.find(std::string_view(key));
    if (entry_it == entries.end())
        return {};

    return safe_section("Removing value", storage_k, [&] {
        undo_t change;
        change.kind = undo_t::key_k;
        change.bucket = bucket.str();
        change.key = entry_it->first;
        txn->undo.push_back(std::move(change));
        txn->undo.back().previous_value = std::move(entry_it->second);
        entries.erase(entry_it);
    });
}

status_t engine_scan(engine_transaction_t* txn, value_view_t bucket, scan_visitor_t visitor, void* context) noexcept {
    status_t status = validate_reader(txn);
    return_if_error_m(status);
    return_error_if_m(visitor, args_wrong_k, "Scan visitor is missing");

    buckets_t const& buckets = txn->db->buckets;
    auto bucket_it = buckets.find(std::string_view(bucket));
    if (bucket_it == buckets.end())
        return {};

    bool proceed = true;
    for (auto const& [key, value] : bucket_it->second) {
        status = visitor(context, key, value, proceed);
        if (!status || !proceed)
            break;
    }
    return status;
}

} // namespace unum::ustash
