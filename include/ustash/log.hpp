/**
 * @file log.hpp
 * @author Ashot Vardanian
 *
 * @brief Printf-style diagnostics to `stderr`.
 * The threshold is read once from the `USTASH_LOG_LEVEL` environment variable:
 * "debug", "info", "warning" (default), "error" or "none".
 */

#pragma once
#include <cstdio>  // `stderr`
#include <cstdlib> // `std::getenv`
#include <cstring> // `std::strcmp`
#include <exception> // `std::exception`

#include <fmt/printf.h> // `fmt::fprintf`

namespace unum::ustash {

enum class log_level_t {
    debug_k = 0,
    info_k,
    warning_k,
    error_k,
    none_k,
};

inline log_level_t log_level_from_env() noexcept {
    char const* level = std::getenv("USTASH_LOG_LEVEL");
    if (!level)
        return log_level_t::warning_k;
    if (std::strcmp(level, "debug") == 0)
        return log_level_t::debug_k;
    if (std::strcmp(level, "info") == 0)
        return log_level_t::info_k;
    if (std::strcmp(level, "error") == 0)
        return log_level_t::error_k;
    if (std::strcmp(level, "none") == 0)
        return log_level_t::none_k;
    return log_level_t::warning_k;
}

inline bool log_enabled(log_level_t level) noexcept {
    static log_level_t const threshold = log_level_from_env();
    return level >= threshold;
}

} // namespace unum::ustash

#define ustash_log_m(level, prefix, ...)                          \
    do {                                                          \
        if (!::unum::ustash::log_enabled(level))                  \
            break;                                                \
        try {                                                     \
            ::fmt::fprintf(stderr, prefix __VA_ARGS__);           \
        }                                                         \
        catch (std::exception const&) {                           \
            std::fputs(prefix "malformed log message\n", stderr); \
        }                                                         \
    } while (false)

#define log_debug_m(...) ustash_log_m(::unum::ustash::log_level_t::debug_k, "[ustash] debug: ", __VA_ARGS__)
#define log_info_m(...) ustash_log_m(::unum::ustash::log_level_t::info_k, "[ustash] ", __VA_ARGS__)
#define log_warning_m(...) ustash_log_m(::unum::ustash::log_level_t::warning_k, "[ustash] warning: ", __VA_ARGS__)
#define log_error_m(...) ustash_log_m(::unum::ustash::log_level_t::error_k, "[ustash] error: ", __VA_ARGS__)
