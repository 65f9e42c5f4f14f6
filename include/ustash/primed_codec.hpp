/**
 * @file primed_codec.hpp
 * @author Ashot Vardanian
 *
 * @brief Codecs with a frozen type-metadata preamble.
 *
 * Self-describing formats pay for type definitions once per stream, which
 * is once per stored value, as every value is a separate stream. Priming
 * encodes a fixed list of samples once, remembers the produced bytes, and
 * replays them into every new encoder and decoder, so definitions of the
 * sampled types never reach the storage.
 *
 * @code{.cpp}
 * auto primed = primer_t(std::make_shared<binary_codec_t>()).sample<person_t>().sample<address_t>().build();
 * @endcode
 *
 * The order of samples defines the type ids. Data written with one primed
 * codec can only be read with a codec primed by the same list in the same order.
 */

#pragma once
#include <functional> // `std::function`
#include <vector>     // `std::vector`

#include "ustash/codec.hpp"

namespace unum::ustash {

/**
 * @brief Type-erased sample value, able to run through an encoder
 * and to be restored from a decoder.
 */
struct primed_sample_t {
    std::string name;
    std::function<status_t(encoder_t&)> encode;
    std::function<status_t(decoder_t&)> decode;
};

class primed_codec_t final : public codec_t {
    friend class primer_t;

    codec_ptr_t base_;
    std::vector<primed_sample_t> samples_;
    buffer_t snapshot_;
    /** Boundaries of every sample in `snapshot_`, one more than samples. */
    std::vector<std::size_t> offsets_;
    std::string fingerprint_;

    primed_codec_t(codec_ptr_t base,
                   std::vector<primed_sample_t> samples,
                   buffer_t snapshot,
                   std::vector<std::size_t> offsets);

  public:
    encoder_ptr_t make_encoder(sink_t& sink) const override;
    decoder_ptr_t make_decoder(source_t& source) const override;
    /** Formats without metadata produce the same bytes primed or not, and share the fingerprint. */
    std::string fingerprint() const override { return fingerprint_; }
    bool carries_metadata() const noexcept override { return base_->carries_metadata(); }

    codec_t const& base() const noexcept { return *base_; }
    std::size_t samples_count() const noexcept { return samples_.size(); }
    value_view_t snapshot() const noexcept { return snapshot_; }
    value_view_t sample_bytes(std::size_t i) const noexcept {
        return value_view_t(snapshot_).subspan(offsets_[i], offsets_[i + 1] - offsets_[i]);
    }
};

using primed_codec_ptr_t = std::shared_ptr<primed_codec_t const>;

/**
 * @brief Collects sample types for a `primed_codec_t`.
 */
class primer_t {
    codec_ptr_t base_;
    std::vector<primed_sample_t> samples_;

  public:
    explicit primer_t(codec_ptr_t base) noexcept : base_(std::move(base)) {}

    /**
     * @brief Appends a sample. Most formats only care about the type,
     * so a default-constructed instance is used unless one is passed.
     */
    template <typename object_at>
    primer_t& sample(object_at object = object_at {}) {
        primed_sample_t sample;
        sample.name = demangled_name(typeid(object_at));
        sample.encode = [object = std::move(object)](encoder_t& encoder) {
            return encoder.encode(object);
        };
        sample.decode = [](decoder_t& decoder) {
            object_at restored {};
            return decoder.decode(restored);
        };
        samples_.push_back(std::move(sample));
        return *this;
    }

    /**
     * @brief Encodes all samples with a single encoder and validates that
     * a single decoder reads them back. This is the only step, where
     * priming can fail.
     */
    expected_gt<primed_codec_ptr_t> build() const noexcept;
};

} // namespace unum::ustash
