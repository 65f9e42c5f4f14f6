/**
 * @file status.hpp
 * @author Ashot Vardanian
 * @date 4 Jul 2022
 *
 * @brief Error codes, statuses and monads for the C++ interface.
 * Nothing in the public API throws: third-party exceptions are caught
 * inside `safe_section` and reported as a `status_t`.
 */

#pragma once
#include <new>       // `std::bad_alloc`
#include <optional>  // `std::optional`
#include <stdexcept> // `std::runtime_error`
#include <string>    // `std::string`
#include <utility>   // `std::exchange`

#include <fmt/format.h> // `fmt::format`

#include "ustash/types.hpp"

namespace unum::ustash {

enum error_code_t {
    success_k = 0,
    /** Key or bucket is absent on read or pull. */
    not_found_k,
    /** Encoding failed, like an unregistered dynamic type in the binary format. */
    marshal_k,
    /** Decoding failed: malformed bytes, type mismatch or an unknown type name. */
    unmarshal_k,
    /** Iteration callback has a wrong arity or isn't callable. */
    invalid_callback_k,
    /** Engine transaction failure, like IO or lock errors. */
    storage_k,
    out_of_memory_k,
    args_combo_k,
    args_wrong_k,
    uninitialized_state_k,
    missing_feature_k,
    error_unknown_k,
};

inline char const* error_code_name(error_code_t code) noexcept {
    switch (code) {
    case success_k: return "success";
    case not_found_k: return "not found";
    case marshal_k: return "marshal error";
    case unmarshal_k: return "unmarshal error";
    case invalid_callback_k: return "invalid callback";
    case storage_k: return "storage error";
    case out_of_memory_k: return "out of memory";
    case args_combo_k: return "invalid arguments combination";
    case args_wrong_k: return "invalid argument";
    case uninitialized_state_k: return "uninitialized state";
    case missing_feature_k: return "missing feature";
    default: return "unknown error";
    }
}

class [[nodiscard]] status_t {
    error_code_t code_ = success_k;
    std::string message_;

  public:
    status_t() noexcept = default;
    status_t(error_code_t code, std::string message) noexcept : code_(code), message_(std::move(message)) {}
    /** @brief Allows `return "Failed to open a file";` in helpers. */
    status_t(char const* message) noexcept : code_(error_unknown_k), message_(message) {}
    operator bool() const noexcept { return code_ == success_k; }

    status_t(status_t const&) = delete;
    status_t& operator=(status_t const&) = delete;

    status_t(status_t&& other) noexcept
        : code_(std::exchange(other.code_, success_k)), message_(std::move(other.message_)) {}
    status_t& operator=(status_t&& other) noexcept {
        std::swap(code_, other.code_);
        std::swap(message_, other.message_);
        return *this;
    }

    std::runtime_error release_exception() {
        std::runtime_error result(fmt::format("{}: {}", error_code_name(code_), message_));
        code_ = success_k;
        message_.clear();
        return result;
    }

    void throw_unhandled() {
        if (code_ != success_k) // C++20: [[unlikely]]
            throw release_exception();
    }

    error_code_t code() const noexcept { return code_; }
    bool is(error_code_t code) const noexcept { return code_ == code; }
    char const* message() const noexcept { return message_.c_str(); }

    /** @brief Prepends context to the message, keeping the code. */
    status_t& annotate(std::string_view context) {
        if (code_ != success_k)
            message_ = fmt::format("{}: {}", context, message_);
        return *this;
    }
};

/**
 * @brief Extends `std::optional` to support a status, describing empty state.
 */
template <typename object_at>
class [[nodiscard]] expected_gt {
  protected:
    status_t status_;
    object_at object_;

  public:
    expected_gt() = default;
    expected_gt(object_at&& object) : object_(std::move(object)) {}
    expected_gt(status_t&& status, object_at&& default_object = object_at {})
        : status_(std::move(status)), object_(std::move(default_object)) {}

    expected_gt(expected_gt&& other) noexcept : status_(std::move(other.status_)), object_(std::move(other.object_)) {}

    expected_gt& operator=(expected_gt&& other) noexcept {
        std::swap(status_, other.status_);
        std::swap(object_, other.object_);
        return *this;
    }

    operator bool() const noexcept { return status_; }
    object_at operator*() && noexcept { return std::move(object_); }
    object_at& operator*() & noexcept { return object_; }
    object_at const& operator*() const& noexcept { return object_; }
    object_at* operator->() noexcept { return &object_; }
    object_at const* operator->() const noexcept { return &object_; }
    operator std::optional<object_at>() && {
        return !status_ ? std::nullopt : std::optional<object_at> {std::move(object_)};
    }

    status_t const& status() const noexcept { return status_; }
    void throw_unhandled() { return status_.throw_unhandled(); }
    status_t release_status() { return std::exchange(status_, status_t {}); }
    object_at& throw_or_ref() & {
        status_.throw_unhandled();
        return object_;
    }
    object_at throw_or_release() && {
        status_.throw_unhandled();
        return std::move(object_);
    }

    template <typename hetero_at>
    bool operator==(hetero_at const& other) const noexcept {
        return status_ && object_ == other;
    }

    template <typename hetero_at>
    bool operator!=(hetero_at const& other) const noexcept {
        return !status_ || object_ != other;
    }
};

/**
 * @brief Runs a callable, that may throw, converting exceptions into statuses.
 * Memory exhaustion is always reported as `out_of_memory_k`, every other
 * exception as @p code, prefixed with @p name.
 * The callable may return `void` or a `status_t` to forward.
 */
template <typename dangerous_at>
status_t safe_section(char const* name, error_code_t code, dangerous_at&& dangerous) noexcept {
    try {
        using result_t = decltype(dangerous());
        if constexpr (std::is_same_v<result_t, void>) {
            dangerous();
            return {};
        }
        else
            return dangerous();
    }
    catch (std::bad_alloc const&) {
        return {out_of_memory_k, name};
    }
    catch (std::exception const& e) {
        try {
            return {code, fmt::format("{}: {}", name, e.what())};
        }
        catch (std::bad_alloc const&) {
            return {out_of_memory_k, name};
        }
    }
    catch (...) {
        return {code, name};
    }
}

} // namespace unum::ustash

#define return_error_if_m(must_be_true, code, message) \
    if (!(must_be_true))                               \
        return ::unum::ustash::status_t {code, message};

#define return_if_error_m(status) \
    if (!(status))                \
        return std::move(status);
