/**
 * @file store.hpp
 * @author Ashot Vardanian
 * @date 26 Jun 2022
 *
 * @brief Typed key-value storage on top of a bucket of the database.
 *
 * A `store_t` binds a codec to a bucket. Every call runs in its own
 * transaction, so the store itself holds no state and can be shared
 * between threads.
 *
 * @code{.cpp}
 * database_t db;
 * db.open().throw_unhandled();
 * store_t people {db, "people", std::make_shared<binary_codec_t>()};
 * people.put("alice", person_t {"Alice"}).throw_unhandled();
 * people.for_each([](std::string const& key, person_t const& person) { ... }).throw_unhandled();
 * @endcode
 *
 * Callbacks of `for_each` run inside a read transaction: writing into
 * the same database from them may deadlock with single-writer engines.
 */

#pragma once
#include <string>      // `std::string`
#include <string_view> // `std::string_view`

#include "ustash/db.hpp"
#include "ustash/dispatch.hpp"

namespace unum::ustash {

/** @brief Reserved bucket, mapping bucket paths to the fingerprints of their codecs. */
static constexpr char const* codecs_bucket_k = "__ustash_codecs__";

class store_t {
    database_t* db_ = nullptr;
    std::string bucket_;
    codec_ptr_t codec_;

    template <typename key_at>
    status_t key_bytes(key_at const& key, buffer_t& scratch, value_view_t& bytes) const noexcept {
        if constexpr (is_raw_key_gt<key_at>::value) {
            bytes = raw_key_view(key);
            return {};
        }
        else if constexpr (std::is_convertible_v<key_at const&, std::string_view>) {
            bytes = value_view_t(std::string_view(key));
            return {};
        }
        else {
            status_t status = marshal(*codec_, key, scratch);
            status.annotate("Encoding key");
            return_if_error_m(status);
            bytes = scratch;
            return {};
        }
    }

    status_t validate() const noexcept;
    status_t put_bytes(value_view_t key, value_view_t value) const noexcept;
    status_t get_bytes(value_view_t key, buffer_t& value) const noexcept;
    status_t pull_bytes(value_view_t key, buffer_t& value) const noexcept;
    status_t remove_bytes(value_view_t key) const noexcept;

  public:
    store_t() noexcept = default;
    store_t(database_t& db, std::string_view bucket, codec_ptr_t codec) noexcept
        : db_(&db), bucket_(bucket), codec_(std::move(codec)) {}

    std::string const& bucket() const noexcept { return bucket_; }
    codec_ptr_t const& codec() const noexcept { return codec_; }

    /**
     * @brief Encodes and stores @p value, creating the bucket if needed.
     * Encoding happens before any transaction is started.
     */
    template <typename key_at, typename value_at>
    status_t put(key_at const& key, value_at const& value) const noexcept {
        status_t status = validate();
        return_if_error_m(status);

        buffer_t key_scratch, value_bytes;
        value_view_t key_view;
        status = key_bytes(key, key_scratch, key_view);
        return_if_error_m(status);
        status = marshal(*codec_, value, value_bytes);
        return_if_error_m(status);
        return put_bytes(key_view, value_bytes);
    }

    /**
     * @brief Reads and decodes a value. Decoding happens after the transaction
     * is closed. Missing keys and buckets are reported as `not_found_k`.
     */
    template <typename key_at, typename value_at>
    status_t get(key_at const& key, value_at& value) const noexcept {
        status_t status = validate();
        return_if_error_m(status);

        buffer_t key_scratch, value_bytes;
        value_view_t key_view;
        status = key_bytes(key, key_scratch, key_view);
        return_if_error_m(status);
        status = get_bytes(key_view, value_bytes);
        return_if_error_m(status);
        return unmarshal(*codec_, value_bytes, value);
    }

    /** @brief Same as `get`, but removes the record in the same transaction. */
    template <typename key_at, typename value_at>
    status_t pull(key_at const& key, value_at& value) const noexcept {
        status_t status = validate();
        return_if_error_m(status);

        buffer_t key_scratch, value_bytes;
        value_view_t key_view;
        status = key_bytes(key, key_scratch, key_view);
        return_if_error_m(status);
        status = pull_bytes(key_view, value_bytes);
        return_if_error_m(status);
        return unmarshal(*codec_, value_bytes, value);
    }

    /** @brief Removes a record. Absent keys and buckets aren't errors. */
    template <typename key_at>
    status_t remove(key_at const& key) const noexcept {
        status_t status = validate();
        return_if_error_m(status);

        buffer_t key_scratch;
        value_view_t key_view;
        status = key_bytes(key, key_scratch, key_view);
        return_if_error_m(status);
        return remove_bytes(key_view);
    }

    /**
     * @brief Passes raw records to @p visitor in key order, inside a single
     * read transaction. The visitor is called as `(key, value, proceed)`.
     */
    template <typename visitor_at>
    status_t scan(visitor_at&& visitor) const noexcept {
        status_t status = validate();
        return_if_error_m(status);
        return db_->view([&](transaction_t& txn) { return txn.scan(bucket_, visitor); });
    }

    /**
     * @brief Decodes every record and passes it to @p callback, which
     * signature defines, what is decoded. See `dispatcher_gt`.
     */
    template <typename callback_at>
    status_t for_each(callback_at&& callback) const noexcept {
        using dispatcher_t = dispatcher_gt<std::remove_reference_t<callback_at>>;
        if constexpr (!dispatcher_t::supported_k)
            return {invalid_callback_k, "Callbacks must accept a value, or a key and a value, of concrete types"};
        else {
            status_t status = validate();
            return_if_error_m(status);
            dispatcher_t dispatcher {*codec_, callback};
            return scan(dispatcher);
        }
    }

    /** @brief Iterates over values of an explicitly named type. */
    template <typename value_at, typename callback_at>
    status_t for_each_value(callback_at&& callback) const noexcept {
        return for_each([&](value_at& value) { return callback(value); });
    }

    /** @brief Iterates over keys and values of explicitly named types. */
    template <typename key_at, typename value_at, typename callback_at>
    status_t for_each_pair(callback_at&& callback) const noexcept {
        return for_each([&](key_at& key, value_at& value) { return callback(key, value); });
    }

    /** @brief Drops the bucket with all nested ones. Idempotent. */
    status_t delete_all() const noexcept;

    /**
     * @brief Store over a bucket nested into this one, sharing the codec.
     * Names can't be empty or contain `bucket_separator_k`.
     */
    expected_gt<store_t> nested(std::string_view name) const noexcept;

    /**
     * @brief Remembers the codec fingerprint of this bucket on first use,
     * and fails with `unmarshal_k`, if it was written by another codec.
     */
    status_t pin_codec() const noexcept;
};

} // namespace unum::ustash
