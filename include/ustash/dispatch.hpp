/**
 * @file dispatch.hpp
 * @author Ashot Vardanian
 *
 * @brief Feeding decoded records into callbacks of arbitrary signatures.
 *
 * The parameter list of a callback defines what is decoded for it:
 * > `(value_t)`: only values, in key order.
 * > `(key_t, value_t)`: keys and values.
 * Parameters can be accepted by value, by reference or by pointer.
 * Keys declared as strings, string views or byte vectors get the raw
 * key bytes, other key types are decoded with the store's codec.
 *
 * Generic callbacks, like `[](auto const&) {}`, have no parameter
 * types to decode into and are rejected, as are other arities.
 */

#pragma once
#include <tuple>       // `std::tuple_element_t`
#include <type_traits> // `std::void_t`

#include "ustash/codec.hpp"

namespace unum::ustash {

#pragma region Callable Traits

template <typename result_at, typename... args_at>
struct signature_gt {
    static constexpr bool callable_k = true;
    static constexpr std::size_t arity_k = sizeof...(args_at);
    using result_t = result_at;
    using args_t = std::tuple<args_at...>;
};

template <typename at, typename = void>
struct callable_traits_gt {
    static constexpr bool callable_k = false;
    static constexpr std::size_t arity_k = 0;
    using result_t = void;
    using args_t = std::tuple<>;
};

template <typename result_at, typename... args_at>
struct callable_traits_gt<result_at(args_at...)> : signature_gt<result_at, args_at...> {};
template <typename result_at, typename... args_at>
struct callable_traits_gt<result_at(args_at...) noexcept> : signature_gt<result_at, args_at...> {};
template <typename result_at, typename... args_at>
struct callable_traits_gt<result_at (*)(args_at...)> : signature_gt<result_at, args_at...> {};
template <typename result_at, typename... args_at>
struct callable_traits_gt<result_at (*)(args_at...) noexcept> : signature_gt<result_at, args_at...> {};

template <typename at>
struct call_operator_gt {
    static constexpr bool callable_k = false;
    static constexpr std::size_t arity_k = 0;
    using result_t = void;
    using args_t = std::tuple<>;
};

template <typename class_at, typename result_at, typename... args_at>
struct call_operator_gt<result_at (class_at::*)(args_at...)> : signature_gt<result_at, args_at...> {};
template <typename class_at, typename result_at, typename... args_at>
struct call_operator_gt<result_at (class_at::*)(args_at...) const> : signature_gt<result_at, args_at...> {};
template <typename class_at, typename result_at, typename... args_at>
struct call_operator_gt<result_at (class_at::*)(args_at...) noexcept> : signature_gt<result_at, args_at...> {};
template <typename class_at, typename result_at, typename... args_at>
struct call_operator_gt<result_at (class_at::*)(args_at...) const noexcept> : signature_gt<result_at, args_at...> {};

/**
 * @brief Lambdas and function objects with exactly one, non-template, call operator.
 */
template <typename at>
struct callable_traits_gt<at, std::void_t<decltype(&at::operator())>> : call_operator_gt<decltype(&at::operator())> {};

#pragma region Keys

/**
 * @brief Key types, that map onto the stored bytes as-is, without a codec.
 */
template <typename at>
struct is_raw_key_gt : std::false_type {};
template <>
struct is_raw_key_gt<std::string> : std::true_type {};
template <>
struct is_raw_key_gt<std::string_view> : std::true_type {};
template <>
struct is_raw_key_gt<value_view_t> : std::true_type {};
template <>
struct is_raw_key_gt<std::vector<byte_t>> : std::true_type {};
template <>
struct is_raw_key_gt<std::vector<std::uint8_t>> : std::true_type {};
template <>
struct is_raw_key_gt<std::vector<char>> : std::true_type {};

template <typename key_at>
value_view_t raw_key_view(key_at const& key) noexcept {
    if constexpr (std::is_same_v<key_at, std::string> || std::is_same_v<key_at, std::string_view> ||
                  std::is_same_v<key_at, value_view_t>)
        return value_view_t(key);
    else
        return value_view(key);
}

template <typename key_at>
key_at raw_key_from(value_view_t bytes) {
    if constexpr (std::is_same_v<key_at, std::string>)
        return bytes.str();
    else if constexpr (std::is_same_v<key_at, std::string_view> || std::is_same_v<key_at, value_view_t>)
        return key_at(bytes.data(), bytes.size());
    else {
        using element_t = typename key_at::value_type;
        auto begin = reinterpret_cast<element_t const*>(bytes.data());
        return key_at(begin, begin + bytes.size());
    }
}

#pragma region Dispatch

/**
 * @brief Adapts an instance to the declared parameter: takes the address
 * for pointers, passes lvalue references through, and moves otherwise.
 */
template <typename param_at, typename object_at>
decltype(auto) forward_param(object_at& instance) noexcept {
    if constexpr (std::is_pointer_v<param_at>)
        return &instance;
    else if constexpr (std::is_lvalue_reference_v<param_at>)
        return (instance);
    else
        return std::move(instance);
}

template <typename param_at>
using decoded_gt = std::remove_cv_t<std::remove_pointer_t<std::remove_reference_t<param_at>>>;

/**
 * @brief Invokes the callback, translating its result into scan control.
 * `bool` results stop the scan on `false`, `status_t` results abort it
 * on errors. Other results are ignored.
 */
template <typename result_at, typename call_at>
status_t invoke_callback(call_at&& call, bool& proceed) noexcept {
    return safe_section("Running callback", error_unknown_k, [&]() -> status_t {
        if constexpr (std::is_void_v<result_at>) {
            call();
            return {};
        }
        else if constexpr (std::is_same_v<std::decay_t<result_at>, bool>) {
            proceed = call();
            return {};
        }
        else if constexpr (std::is_same_v<std::decay_t<result_at>, status_t>)
            return call();
        else {
            static_cast<void>(call());
            return {};
        }
    });
}

template <typename key_at>
status_t decode_key(codec_t const& codec, value_view_t bytes, key_at& key) noexcept {
    if constexpr (is_raw_key_gt<key_at>::value)
        return safe_section("Copying key", unmarshal_k, [&] { key = raw_key_from<key_at>(bytes); });
    else {
        status_t status = unmarshal(codec, bytes, key);
        status.annotate("Decoding key");
        return status;
    }
}

/**
 * @brief Decodes every scanned record according to the callback's signature.
 * Whether a callback type is supported is known at compile time through
 * `supported_k`, but only reported at runtime, as `invalid_callback_k`.
 */
template <typename callback_at>
class dispatcher_gt {
  public:
    using traits_t = callable_traits_gt<std::remove_cv_t<callback_at>>;
    static constexpr std::size_t arity_k = traits_t::arity_k;
    static constexpr bool supported_k = traits_t::callable_k && (arity_k == 1 || arity_k == 2);

  private:
    codec_t const& codec_;
    callback_at& callback_;

  public:
    dispatcher_gt(codec_t const& codec, callback_at& callback) noexcept : codec_(codec), callback_(callback) {}

    status_t operator()(value_view_t key, value_view_t value, bool& proceed) const noexcept {
        static_assert(supported_k, "Check `supported_k` before dispatching");
        using args_t = typename traits_t::args_t;
        using result_t = typename traits_t::result_t;
        using value_param_t = std::tuple_element_t<arity_k - 1, args_t>;
        using value_t = decoded_gt<value_param_t>;
        static_assert(std::is_default_constructible_v<value_t>, "Decoded values must be default-constructible");

        value_t decoded_value {};
        status_t status = unmarshal(codec_, value, decoded_value);
        return_if_error_m(status);

        if constexpr (arity_k == 1) {
            return invoke_callback<result_t>(
                [&]() -> decltype(auto) { return callback_(forward_param<value_param_t>(decoded_value)); },
                proceed);
        }
        else {
            using key_param_t = std::tuple_element_t<0, args_t>;
            using key_t = decoded_gt<key_param_t>;
            static_assert(std::is_default_constructible_v<key_t>, "Decoded keys must be default-constructible");

            key_t decoded_key {};
            status = decode_key(codec_, key, decoded_key);
            return_if_error_m(status);
            return invoke_callback<result_t>(
                [&]() -> decltype(auto) {
                    return callback_(forward_param<key_param_t>(decoded_key),
                                     forward_param<value_param_t>(decoded_value));
                },
                proceed);
        }
    }
};

} // namespace unum::ustash
