/**
 * @file codec_primed.cpp
 * @author Ashot Vardanian
 *
 * @brief Replaying the primed preamble into fresh encoders and decoders.
 */

#include "ustash/primed_codec.hpp"
#include "ustash/log.hpp"

using namespace unum::ustash;
using namespace unum;

/**
 * @brief Encoder, that has already seen every sample.
 * Replay failures can't be reported from a factory, so they are
 * remembered and returned from every following call.
 */
class primed_encoder_t final : public encoder_t {
    discard_sink_t discard_;
    delegate_sink_t delegate_;
    encoder_ptr_t inner_;
    status_t replay_;

  public:
    primed_encoder_t(primed_codec_t const& codec, std::vector<primed_sample_t> const& samples, sink_t& sink) {
        delegate_.rebind(discard_);
        inner_ = codec.base().make_encoder(delegate_);
        for (auto const& sample : samples) {
            replay_ = sample.encode(*inner_);
            if (!replay_) {
                replay_.annotate(fmt::format("Replaying {}", sample.name));
                break;
            }
        }
        delegate_.rebind(sink);
    }

    status_t encode_payload(payload_t const& payload) noexcept override {
        if (!replay_)
            return {replay_.code(), replay_.message()};
        return inner_->encode_payload(payload);
    }
};

class primed_decoder_t final : public decoder_t {
    delegate_source_t delegate_;
    decoder_ptr_t inner_;
    status_t replay_;

  public:
    primed_decoder_t(primed_codec_t const& codec, std::vector<primed_sample_t> const& samples, source_t& source) {
        inner_ = codec.base().make_decoder(delegate_);
        for (std::size_t i = 0; i != samples.size(); ++i) {
            view_source_t segment {codec.sample_bytes(i)};
            delegate_.rebind(segment);
            replay_ = samples[i].decode(*inner_);
            if (!replay_) {
                replay_.annotate(fmt::format("Replaying {}", samples[i].name));
                break;
            }
        }
        delegate_.rebind(source);
    }

    bool wants_shape() const noexcept override { return inner_->wants_shape(); }

    status_t decode_payload(payload_t& payload) noexcept override {
        if (!replay_)
            return {replay_.code(), replay_.message()};
        return inner_->decode_payload(payload);
    }
};

namespace unum::ustash {

primed_codec_t::primed_codec_t(codec_ptr_t base,
                               std::vector<primed_sample_t> samples,
                               buffer_t snapshot,
                               std::vector<std::size_t> offsets)
    : base_(std::move(base)), samples_(std::move(samples)), snapshot_(std::move(snapshot)),
      offsets_(std::move(offsets)) {
    std::string base_fingerprint = base_->fingerprint();
    if (!base_->carries_metadata()) {
        fingerprint_ = std::move(base_fingerprint);
        return;
    }
    std::uint64_t hash = fnv1a(snapshot_, fnv1a(base_fingerprint));
    fingerprint_ = fmt::format("primed({}):{:016x}", base_fingerprint, hash);
}

encoder_ptr_t primed_codec_t::make_encoder(sink_t& sink) const {
    return encoder_ptr_t {new primed_encoder_t(*this, samples_, sink)};
}

decoder_ptr_t primed_codec_t::make_decoder(source_t& source) const {
    return decoder_ptr_t {new primed_decoder_t(*this, samples_, source)};
}

expected_gt<primed_codec_ptr_t> primer_t::build() const noexcept {
    return_error_if_m(base_, args_wrong_k, "Priming requires a base codec");

    primed_codec_ptr_t result;
    status_t status = safe_section("Priming codec", marshal_k, [&]() -> status_t {
        buffer_t snapshot;
        std::vector<std::size_t> offsets {0};

        {
            buffer_sink_t sink {snapshot};
            encoder_ptr_t encoder = base_->make_encoder(sink);
            for (auto const& sample : samples_) {
                status_t encoded = sample.encode(*encoder);
                if (!encoded)
                    return std::move(encoded.annotate(fmt::format("Encoding sample {}", sample.name)));
                offsets.push_back(snapshot.size());
            }
        }

        delegate_source_t delegate;
        decoder_ptr_t decoder = base_->make_decoder(delegate);
        for (std::size_t i = 0; i != samples_.size(); ++i) {
            view_source_t segment {value_view_t(snapshot).subspan(offsets[i], offsets[i + 1] - offsets[i])};
            delegate.rebind(segment);
            status_t decoded = samples_[i].decode(*decoder);
            delegate.unbind();
            if (!decoded)
                return std::move(decoded.annotate(fmt::format("Decoding sample {}", samples_[i].name)));
        }

        result.reset(new primed_codec_t(base_, samples_, std::move(snapshot), std::move(offsets)));
        log_debug_m("Primed %s with %zu samples\n", result->fingerprint().c_str(), samples_.size());
        return {};
    });
    if (!status)
        return {std::move(status), nullptr};
    return {std::move(result)};
}

} // namespace unum::ustash
