/**
 * @file db.hpp
 * @author Ashot Vardanian
 * @date 26 Jun 2022
 *
 * @brief C++ bindings for the engine boundary.
 * Owning handles for databases and transactions, that roll back
 * anything that wasn't explicitly committed.
 */

#pragma once
#include <utility> // `std::exchange`

#include "ustash/engine.hpp"

namespace unum::ustash {

class transaction_t {
    engine_transaction_t* txn_ = nullptr;

  public:
    transaction_t() noexcept = default;
    explicit transaction_t(engine_transaction_t* txn) noexcept : txn_(txn) {}
    transaction_t(transaction_t const&) = delete;
    transaction_t& operator=(transaction_t const&) = delete;
    transaction_t(transaction_t&& other) noexcept : txn_(std::exchange(other.txn_, nullptr)) {}
    transaction_t& operator=(transaction_t&& other) noexcept {
        std::swap(txn_, other.txn_);
        return *this;
    }
    ~transaction_t() noexcept { reset(); }

    operator engine_transaction_t*() const noexcept { return txn_; }

    status_t commit() noexcept {
        return_error_if_m(txn_, uninitialized_state_k, "Transaction is uninitialized");
        return engine_commit(txn_);
    }

    /** @brief Rolls back, unless already committed. */
    void reset() noexcept {
        engine_free(txn_);
        txn_ = nullptr;
    }

    status_t ensure(value_view_t bucket) noexcept { return engine_bucket_ensure(txn_, bucket); }
    status_t drop(value_view_t bucket) noexcept { return engine_bucket_drop(txn_, bucket); }
    expected_gt<bool> contains(value_view_t bucket) noexcept {
        bool exists = false;
        status_t status = engine_bucket_exists(txn_, bucket, exists);
        if (!status)
            return {std::move(status), false};
        return {std::move(exists)};
    }

    status_t read(value_view_t bucket, value_view_t key, bool& found, buffer_t& value) noexcept {
        return engine_read(txn_, bucket, key, found, value);
    }
    status_t write(value_view_t bucket, value_view_t key, value_view_t value) noexcept {
        return engine_write(txn_, bucket, key, value);
    }
    status_t remove(value_view_t bucket, value_view_t key) noexcept { return engine_remove(txn_, bucket, key); }

    /**
     * @brief Ordered scan with a callable visitor.
     * @param visitor Invoked as `status_t(value_view_t key, value_view_t value, bool& proceed)`.
     */
    template <typename visitor_at>
    status_t scan(value_view_t bucket, visitor_at&& visitor) noexcept {
        using visitor_t = std::remove_reference_t<visitor_at>;
        scan_visitor_t trampoline = [](void* context, value_view_t key, value_view_t value, bool& proceed) {
            return (*reinterpret_cast<visitor_t*>(context))(key, value, proceed);
        };
        return engine_scan(txn_, bucket, trampoline, const_cast<void*>(static_cast<void const*>(&visitor)));
    }
};

class database_t {
    engine_database_t* db_ = nullptr;

  public:
    database_t() = default;
    database_t(database_t const&) = delete;
    database_t& operator=(database_t const&) = delete;
    database_t(database_t&& other) noexcept : db_(std::exchange(other.db_, nullptr)) {}
    operator engine_database_t*() const noexcept { return db_; }

    status_t open(char const* config = "") noexcept {
        return_error_if_m(!db_, args_wrong_k, "Close the previous database before opening a new one");
        return engine_open(config ? config : "", &db_);
    }

    void close() noexcept {
        engine_close(db_);
        db_ = nullptr;
    }

    ~database_t() noexcept {
        if (db_)
            close();
    }

    expected_gt<transaction_t> transact(txn_mode_t mode = txn_mode_t::write_k) noexcept {
        engine_transaction_t* raw = nullptr;
        status_t status = engine_begin(db_, mode, &raw);
        if (!status)
            return {std::move(status), transaction_t {}};
        return transaction_t {raw};
    }

    /**
     * @brief Runs @p body in a write transaction, committing only if it succeeds.
     * Any failure, of the body or of the commit, rolls everything back.
     */
    template <typename body_at>
    status_t update(body_at&& body) noexcept {
        return run(txn_mode_t::write_k, std::forward<body_at>(body));
    }

    /** @brief Runs @p body in a read-only transaction. */
    template <typename body_at>
    status_t view(body_at&& body) noexcept {
        return run(txn_mode_t::read_k, std::forward<body_at>(body));
    }

  private:
    template <typename body_at>
    status_t run(txn_mode_t mode, body_at&& body) noexcept {
        auto txn = transact(mode);
        if (!txn)
            return txn.release_status();
        status_t status = body(*txn);
        return_if_error_m(status);
        return txn->commit();
    }
};

} // namespace unum::ustash
