/**
 * @file pooled_codec.hpp
 * @author Ashot Vardanian
 *
 * @brief Recycling encoders and decoders between unrelated calls.
 *
 * Constructing a primed encoder means replaying the whole preamble.
 * Pools keep released instances around, swapping only their sink or source,
 * so the preamble is replayed once per instance rather than once per value.
 * Instances are never reset on release, so only formats, whose state can't
 * change their output, are admitted: see `is_reuse_safe_gt`.
 */

#pragma once
#include <mutex>  // `std::mutex`
#include <vector> // `std::vector`

#include "ustash/codecs.hpp"
#include "ustash/primed_codec.hpp"

namespace unum::ustash {

/**
 * @brief Marks codecs, which instances can be reused for unrelated streams.
 * Text formats carry no state. Primed codecs only meet primed types, if the
 * caller keeps to them, so their state never grows.
 */
template <typename codec_at>
struct is_reuse_safe_gt : std::false_type {};

template <>
struct is_reuse_safe_gt<json_codec_t> : std::true_type {};
template <>
struct is_reuse_safe_gt<xml_codec_t> : std::true_type {};
template <>
struct is_reuse_safe_gt<primed_codec_t> : std::true_type {};

/**
 * @brief Type-agnostic part of the pooled codec: two unbounded free-lists.
 * Handles refer back to the pool, so it must outlive all of them.
 */
class codec_pool_t {
  public:
    explicit codec_pool_t(codec_ptr_t inner) noexcept;
    ~codec_pool_t() noexcept;
    codec_pool_t(codec_pool_t const&) = delete;
    codec_pool_t& operator=(codec_pool_t const&) = delete;

    encoder_ptr_t acquire_encoder(sink_t& sink) const;
    decoder_ptr_t acquire_decoder(source_t& source) const;
    codec_t const& inner() const noexcept { return *inner_; }

    std::size_t idle_encoders() const noexcept;
    std::size_t idle_decoders() const noexcept;
    std::size_t created_encoders() const noexcept;
    std::size_t created_decoders() const noexcept;

    class pooled_encoder_t;
    class pooled_decoder_t;

  private:
    void release(pooled_encoder_t* encoder) const noexcept;
    void release(pooled_decoder_t* decoder) const noexcept;

    codec_ptr_t inner_;
    mutable std::mutex mutex_;
    mutable std::vector<std::unique_ptr<pooled_encoder_t>> idle_encoders_;
    mutable std::vector<std::unique_ptr<pooled_decoder_t>> idle_decoders_;
    mutable std::size_t created_encoders_ = 0;
    mutable std::size_t created_decoders_ = 0;
};

template <typename codec_at>
class pooled_codec_gt final : public codec_t {
    static_assert(is_reuse_safe_gt<codec_at>::value,
                  "Only stateless or primed codecs can be pooled, others accumulate per-stream state");

    codec_pool_t pool_;

  public:
    explicit pooled_codec_gt(std::shared_ptr<codec_at const> inner) noexcept : pool_(std::move(inner)) {}

    encoder_ptr_t make_encoder(sink_t& sink) const override { return pool_.acquire_encoder(sink); }
    decoder_ptr_t make_decoder(source_t& source) const override { return pool_.acquire_decoder(source); }
    /** Pooling doesn't affect the bytes, so data stays readable without it. */
    std::string fingerprint() const override { return pool_.inner().fingerprint(); }
    bool carries_metadata() const noexcept override { return pool_.inner().carries_metadata(); }

    codec_pool_t const& pool() const noexcept { return pool_; }
};

template <typename codec_at>
std::shared_ptr<pooled_codec_gt<codec_at> const> make_pooled(std::shared_ptr<codec_at const> inner) {
    return std::make_shared<pooled_codec_gt<codec_at>>(std::move(inner));
}

} // namespace unum::ustash
