/**
 * @file engine.hpp
 * @author Ashot Vardanian
 *
 * @brief Boundary between the typed layer and a transactional byte store.
 *
 * Every engine implements the same set of free functions in its own
 * translation unit, and the build links exactly one of them:
 * > `engine_stl.cpp`: in-memory reference design with optional snapshots on disk.
 * > `engine_rocksdb.cpp`: persistent LSM store on top of RocksDB.
 *
 * Engines are single-writer and multi-reader. Write transactions serialize
 * on an engine-wide lock, reads share. A transaction is rolled back when it
 * is freed without a successful commit.
 *
 * Buckets are named by byte-strings. Nested buckets are addressed by paths
 * of names joined with `bucket_separator_k`: dropping a bucket drops every
 * bucket nested into it.
 */

#pragma once
#include "ustash/status.hpp"

namespace unum::ustash {

struct engine_database_t;
struct engine_transaction_t;

enum class txn_mode_t {
    read_k,
    write_k,
};

static constexpr char bucket_separator_k = '\0';

/**
 * @brief Called for every record of a scan, in key order.
 * Setting @p proceed to `false` stops the scan without an error,
 * returning a failed status aborts it and is forwarded to the caller.
 * Both views are only valid until the visitor returns.
 */
using scan_visitor_t = status_t (*)(void* context, value_view_t key, value_view_t value, bool& proceed);

/**
 * @brief Opens the database with a JSON config string.
 * An empty config opens a volatile in-memory instance, where supported.
 */
status_t engine_open(char const* config, engine_database_t** db) noexcept;
void engine_close(engine_database_t* db) noexcept;
char const* engine_name() noexcept;

status_t engine_begin(engine_database_t* db, txn_mode_t mode, engine_transaction_t** txn) noexcept;
status_t engine_commit(engine_transaction_t* txn) noexcept;
void engine_free(engine_transaction_t* txn) noexcept;

status_t engine_bucket_ensure(engine_transaction_t* txn, value_view_t bucket) noexcept;
status_t engine_bucket_exists(engine_transaction_t* txn, value_view_t bucket, bool& exists) noexcept;
status_t engine_bucket_drop(engine_transaction_t* txn, value_view_t bucket) noexcept;

/** @brief Reads a single value. Missing buckets and keys aren't errors, only reset @p found. */
status_t engine_read(engine_transaction_t* txn,
                     value_view_t bucket,
                     value_view_t key,
                     bool& found,
                     buffer_t& value) noexcept;
status_t engine_write(engine_transaction_t* txn, value_view_t bucket, value_view_t key, value_view_t value) noexcept;
status_t engine_remove(engine_transaction_t* txn, value_view_t bucket, value_view_t key) noexcept;
status_t engine_scan(engine_transaction_t* txn, value_view_t bucket, scan_visitor_t visitor, void* context) noexcept;

} // namespace unum::ustash
