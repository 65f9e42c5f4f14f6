/**
 * @file store.cpp
 * @author Ashot Vardanian
 *
 * @brief Transactional parts of the typed store, shared by all value types.
 */

#include "ustash/store.hpp"
#include "ustash/log.hpp"

namespace unum::ustash {

status_t store_t::validate() const noexcept {
    return_error_if_m(db_, uninitialized_state_k, "Store isn't bound to a database");
    return_error_if_m(codec_, uninitialized_state_k, "Store has no codec");
    return {};
}

status_t store_t::put_bytes(value_view_t key, value_view_t value) const noexcept {
    return db_->update([&](transaction_t& txn) -> status_t {
        status_t status = txn.ensure(bucket_);
        return_if_error_m(status);
        return txn.write(bucket_, key, value);
    });
}

status_t store_t::get_bytes(value_view_t key, buffer_t& value) const noexcept {
    bool found = false;
    status_t status = db_->view([&](transaction_t& txn) { return txn.read(bucket_, key, found, value); });
    return_if_error_m(status);
    return_error_if_m(found, not_found_k, "Key not found");
    return {};
}

status_t store_t::pull_bytes(value_view_t key, buffer_t& value) const noexcept {
    return db_->update([&](transaction_t& txn) -> status_t {
        bool found = false;
        status_t status = txn.read(bucket_, key, found, value);
        return_if_error_m(status);
        return_error_if_m(found, not_found_k, "Key not found");
        return txn.remove(bucket_, key);
    });
}

status_t store_t::remove_bytes(value_view_t key) const noexcept {
    return db_->update([&](transaction_t& txn) { return txn.remove(bucket_, key); });
}

status_t store_t::delete_all() const noexcept {
    status_t status = validate();
    return_if_error_m(status);
    return db_->update([&](transaction_t& txn) { return txn.drop(bucket_); });
}

expected_gt<store_t> store_t::nested(std::string_view name) const noexcept {
    status_t status = validate();
    if (!status)
        return {std::move(status), store_t {}};
    if (name.empty() || name.find(bucket_separator_k) != std::string_view::npos)
        return {{args_wrong_k, "Nested bucket names must be non-empty and can't contain separators"}, store_t {}};

    store_t child;
    status = safe_section("Composing bucket path", args_wrong_k, [&] {
        child.db_ = db_;
        child.codec_ = codec_;
        child.bucket_.reserve(bucket_.size() + 1 + name.size());
        child.bucket_.append(bucket_);
        child.bucket_.push_back(bucket_separator_k);
        child.bucket_.append(name);
    });
    if (!status)
        return {std::move(status), store_t {}};
    return {std::move(child)};
}

status_t store_t::pin_codec() const noexcept {
    status_t status = validate();
    return_if_error_m(status);

    std::string fingerprint;
    status = safe_section("Fingerprinting codec", args_wrong_k, [&] { fingerprint = codec_->fingerprint(); });
    return_if_error_m(status);

    return db_->update([&](transaction_t& txn) -> status_t {
        bool found = false;
        buffer_t pinned;
        status_t read = txn.read(codecs_bucket_k, bucket_, found, pinned);
        return_if_error_m(read);
        if (found) {
            if (pinned == fingerprint)
                return {};
            log_warning_m("Codec mismatch for a bucket: stored %s, requested %s\n",
                          pinned.c_str(),
                          fingerprint.c_str());
            return {unmarshal_k, fmt::format("Bucket was written with codec {}, not {}", pinned, fingerprint)};
        }

        read = txn.ensure(codecs_bucket_k);
        return_if_error_m(read);
        return txn.write(codecs_bucket_k, bucket_, fingerprint);
    });
}

} // namespace unum::ustash
