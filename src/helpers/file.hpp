/**
 * @file file.hpp
 * @author Ashot Vardanian
 *
 * @brief Reading/writing length-prefixed records from/to disk with LibC.
 */
#pragma once
#include <cstdio>  // `std::FILE`
#include <cstdint> // `std::uint32_t`
#include <cstddef> // `std::size_t`

#include "ustash/status.hpp" // `status_t`

namespace unum::ustash {

/** @brief Chunk lengths are stored as little-endian 32-bit integers on every platform. */
static constexpr std::size_t chunk_length_size_k = sizeof(std::uint32_t);

inline void encode_chunk_length(std::uint32_t length, std::uint8_t* bytes) noexcept {
    for (std::size_t i = 0; i != chunk_length_size_k; ++i)
        bytes[i] = static_cast<std::uint8_t>(length >> (i * 8));
}

inline std::uint32_t decode_chunk_length(std::uint8_t const* bytes) noexcept {
    std::uint32_t length = 0;
    for (std::size_t i = 0; i != chunk_length_size_k; ++i)
        length |= static_cast<std::uint32_t>(bytes[i]) << (i * 8);
    return length;
}

class file_handle_t {
    std::FILE* handle_ = nullptr;

  public:
    file_handle_t() = default;
    file_handle_t(file_handle_t const&) = delete;
    file_handle_t& operator=(file_handle_t const&) = delete;

    status_t open(char const* path, char const* mode) {
        return_error_if_m(!handle_, args_wrong_k, "Close previous file before opening the new one!");
        handle_ = std::fopen(path, mode);
        return_error_if_m(handle_, storage_k, fmt::format("Failed to open a file: {}", path));
        return {};
    }

    status_t close() {
        if (!handle_)
            return {};
        auto result = std::fclose(handle_);
        handle_ = nullptr;
        return_error_if_m(result != EOF, storage_k, "Couldn't close the file after write.");
        return {};
    }

    ~file_handle_t() {
        if (handle_)
            std::fclose(handle_);
    }

    operator std::FILE*() const noexcept { return handle_; }

    /** @brief Writes a 32-bit little-endian length followed by the bytes themselves. */
    status_t write_chunk(value_view_t chunk) {
        auto length = static_cast<std::uint32_t>(chunk.size());
        return_error_if_m(length == chunk.size(), args_wrong_k, "Chunk is too long to be persisted");
        std::uint8_t length_bytes[chunk_length_size_k];
        encode_chunk_length(length, length_bytes);
        auto saved_len = std::fwrite(length_bytes, 1, chunk_length_size_k, handle_);
        return_error_if_m(saved_len == chunk_length_size_k, storage_k, "Write partially failed on length.");
        saved_len = std::fwrite(chunk.data(), 1, chunk.size(), handle_);
        return_error_if_m(saved_len == chunk.size(), storage_k, "Write partially failed on content.");
        return {};
    }

    /**
     * @brief Reads a chunk written by `write_chunk`.
     * @param[out] eof Set if the file ended before the chunk started.
     */
    status_t read_chunk(buffer_t& chunk, bool& eof) {
        std::uint8_t length_bytes[chunk_length_size_k];
        auto read_len = std::fread(length_bytes, 1, chunk_length_size_k, handle_);
        eof = read_len == 0;
        if (eof)
            return {};
        return_error_if_m(read_len == chunk_length_size_k, storage_k, "Read partially failed on length.");
        std::uint32_t length = decode_chunk_length(length_bytes);
        chunk.resize(length);
        read_len = std::fread(chunk.data(), 1, length, handle_);
        return_error_if_m(read_len == length, storage_k, "Read partially failed on content.");
        return {};
    }
};

} // namespace unum::ustash
