/**
 * @file types.hpp
 * @author Ashot Vardanian
 * @date 4 Jul 2022
 *
 * @brief Byte-level vocabulary types shared by codecs, stores and engines.
 */

#pragma once
#include <cstdint>     // `std::uint8_t`
#include <cstring>     // `std::strlen`
#include <string>      // `std::string`
#include <string_view> // `std::string_view`
#include <vector>      // `std::vector`
#include <algorithm>   // `std::equal`

namespace unum::ustash {

enum class byte_t : std::uint8_t {};

/**
 * @brief Owning byte buffer.
 * Engines hand out and accept `std::string`, so we keep it here too.
 */
using buffer_t = std::string;

/**
 * @brief Non-owning view of a binary value, similar to `std::string_view`,
 * but with a "missing" state, which differs from an empty value.
 */
class value_view_t {

    char const* ptr_ = nullptr;
    std::size_t length_ = 0;
    bool present_ = false;

  public:
    inline value_view_t() = default;
    inline value_view_t(value_view_t const&) = default;
    inline value_view_t& operator=(value_view_t const&) = default;

    inline value_view_t(char const* ptr, std::size_t length) noexcept : ptr_(ptr), length_(length), present_(true) {}
    inline value_view_t(byte_t const* ptr, std::size_t length) noexcept
        : value_view_t(reinterpret_cast<char const*>(ptr), length) {}
    inline value_view_t(byte_t const* begin, byte_t const* end) noexcept
        : value_view_t(begin, static_cast<std::size_t>(end - begin)) {}

    /** @brief Compatibility with `std::string_view` and literals. */
    inline value_view_t(char const* c_str) noexcept : value_view_t(c_str, c_str ? std::strlen(c_str) : 0) {}
    inline value_view_t(std::string_view view) noexcept : value_view_t(view.data(), view.size()) {}
    inline value_view_t(std::string const& str) noexcept : value_view_t(str.data(), str.size()) {}

    inline byte_t const* begin() const noexcept { return reinterpret_cast<byte_t const*>(ptr_); }
    inline byte_t const* end() const noexcept { return begin() + size(); }
    inline char const* c_str() const noexcept { return ptr_; }
    inline char const* data() const noexcept { return ptr_; }
    inline std::size_t size() const noexcept { return length_; }
    inline bool empty() const noexcept { return !length_; }
    inline explicit operator bool() const noexcept { return present_; }
    inline operator std::string_view() const noexcept { return {ptr_, length_}; }
    inline std::string str() const { return {ptr_, length_}; }

    inline value_view_t subspan(std::size_t offset, std::size_t length) const noexcept {
        return {ptr_ + offset, length};
    }

    bool operator==(value_view_t other) const noexcept {
        return size() == other.size() && std::equal(begin(), end(), other.begin());
    }
    bool operator!=(value_view_t other) const noexcept { return !operator==(other); }
};

template <typename container_at>
value_view_t value_view(container_at&& container) {
    using element_t = typename std::remove_reference_t<container_at>::value_type;
    return {reinterpret_cast<char const*>(container.data()), container.size() * sizeof(element_t)};
}

/**
 * @brief 64-bit FNV-1a, used to fingerprint codec configurations.
 */
inline std::uint64_t fnv1a(value_view_t bytes, std::uint64_t seed = 0xcbf29ce484222325ull) noexcept {
    std::uint64_t hash = seed;
    for (byte_t byte : bytes) {
        hash ^= static_cast<std::uint8_t>(byte);
        hash *= 0x100000001b3ull;
    }
    return hash;
}

} // namespace unum::ustash
