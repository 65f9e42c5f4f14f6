/**
 * @file codec_pooled.cpp
 * @author Ashot Vardanian
 *
 * @brief Free-lists of encoders and decoders with swappable sinks and sources.
 */

#include "ustash/pooled_codec.hpp"
#include "ustash/log.hpp"

namespace unum::ustash {

class codec_pool_t::pooled_encoder_t final : public encoder_t {
    codec_pool_t const& pool_;
    delegate_sink_t delegate_;
    encoder_ptr_t inner_;

  public:
    explicit pooled_encoder_t(codec_pool_t const& pool) : pool_(pool) { inner_ = pool.inner().make_encoder(delegate_); }

    void rebind(sink_t& sink) noexcept { delegate_.rebind(sink); }
    status_t encode_payload(payload_t const& payload) noexcept override { return inner_->encode_payload(payload); }

  protected:
    void recycle() noexcept override {
        delegate_.unbind();
        pool_.release(this);
    }
};

class codec_pool_t::pooled_decoder_t final : public decoder_t {
    codec_pool_t const& pool_;
    delegate_source_t delegate_;
    decoder_ptr_t inner_;

  public:
    explicit pooled_decoder_t(codec_pool_t const& pool) : pool_(pool) { inner_ = pool.inner().make_decoder(delegate_); }

    void rebind(source_t& source) noexcept { delegate_.rebind(source); }
    bool wants_shape() const noexcept override { return inner_->wants_shape(); }
    status_t decode_payload(payload_t& payload) noexcept override { return inner_->decode_payload(payload); }

  protected:
    void recycle() noexcept override {
        delegate_.unbind();
        pool_.release(this);
    }
};

codec_pool_t::codec_pool_t(codec_ptr_t inner) noexcept : inner_(std::move(inner)) {}

codec_pool_t::~codec_pool_t() noexcept {
    log_debug_m("Pool of %s created %zu encoders and %zu decoders\n",
                inner_ ? inner_->fingerprint().c_str() : "nothing",
                created_encoders_,
                created_decoders_);
}

encoder_ptr_t codec_pool_t::acquire_encoder(sink_t& sink) const {
    std::unique_ptr<pooled_encoder_t> encoder;
    {
        std::unique_lock _ {mutex_};
        if (!idle_encoders_.empty()) {
            encoder = std::move(idle_encoders_.back());
            idle_encoders_.pop_back();
        }
    }
    if (!encoder) {
        encoder = std::make_unique<pooled_encoder_t>(*this);
        std::unique_lock _ {mutex_};
        ++created_encoders_;
    }
    encoder->rebind(sink);
    return encoder_ptr_t {encoder.release()};
}

decoder_ptr_t codec_pool_t::acquire_decoder(source_t& source) const {
    std::unique_ptr<pooled_decoder_t> decoder;
    {
        std::unique_lock _ {mutex_};
        if (!idle_decoders_.empty()) {
            decoder = std::move(idle_decoders_.back());
            idle_decoders_.pop_back();
        }
    }
    if (!decoder) {
        decoder = std::make_unique<pooled_decoder_t>(*this);
        std::unique_lock _ {mutex_};
        ++created_decoders_;
    }
    decoder->rebind(source);
    return decoder_ptr_t {decoder.release()};
}

void codec_pool_t::release(pooled_encoder_t* encoder) const noexcept {
    std::unique_ptr<pooled_encoder_t> owned {encoder};
    try {
        std::unique_lock _ {mutex_};
        idle_encoders_.push_back(std::move(owned));
    }
    catch (std::exception const& e) {
        log_warning_m("Dropping a pooled encoder: %s\n", e.what());
    }
}

void codec_pool_t::release(pooled_decoder_t* decoder) const noexcept {
    std::unique_ptr<pooled_decoder_t> owned {decoder};
    try {
        std::unique_lock _ {mutex_};
        idle_decoders_.push_back(std::move(owned));
    }
    catch (std::exception const& e) {
        log_warning_m("Dropping a pooled decoder: %s\n", e.what());
    }
}

std::size_t codec_pool_t::idle_encoders() const noexcept {
    std::unique_lock _ {mutex_};
    return idle_encoders_.size();
}

std::size_t codec_pool_t::idle_decoders() const noexcept {
    std::unique_lock _ {mutex_};
    return idle_decoders_.size();
}

std::size_t codec_pool_t::created_encoders() const noexcept {
    std::unique_lock _ {mutex_};
    return created_encoders_;
}

std::size_t codec_pool_t::created_decoders() const noexcept {
    std::unique_lock _ {mutex_};
    return created_decoders_;
}

} // namespace unum::ustash
