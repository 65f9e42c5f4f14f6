/**
 * @file codec.hpp
 * @author Ashot Vardanian
 *
 * @brief Pluggable wire formats.
 *
 * A `codec_t` is a stateless factory of stateful encoders and decoders.
 * Encoders write into a `sink_t`, decoders read from a `source_t`, and both
 * may accumulate format-specific metadata across calls on the same instance.
 *
 * Handles returned by the factories recycle the instance on release:
 * plain codecs delete it, pooled codecs return it to the pool.
 */

#pragma once
#include <algorithm> // `std::min`
#include <cstring>   // `std::memcpy`
#include <memory>    // `std::unique_ptr`
#include <stdexcept> // `std::logic_error`
#include <string>    // `std::string`

#include "ustash/payload.hpp"

namespace unum::ustash {

#pragma region Sinks and Sources

class sink_t {
  public:
    virtual ~sink_t() = default;
    virtual void write(char const* data, std::size_t length) = 0;
};

class buffer_sink_t final : public sink_t {
    buffer_t& buffer_;

  public:
    explicit buffer_sink_t(buffer_t& buffer) noexcept : buffer_(buffer) {}
    void write(char const* data, std::size_t length) override { buffer_.append(data, length); }
};

class discard_sink_t final : public sink_t {
  public:
    void write(char const*, std::size_t) override {}
};

/**
 * @brief Forwards writes to a sink, that can be swapped between uses.
 */
class delegate_sink_t final : public sink_t {
    sink_t* target_ = nullptr;

  public:
    void rebind(sink_t& target) noexcept { target_ = &target; }
    void unbind() noexcept { target_ = nullptr; }
    void write(char const* data, std::size_t length) override {
        if (!target_)
            throw std::logic_error("Encoder isn't bound to a sink");
        target_->write(data, length);
    }
};

class source_t {
  public:
    virtual ~source_t() = default;
    /** @return Number of bytes exported, less than @p length only at the end of input. */
    virtual std::size_t read(char* data, std::size_t length) = 0;
};

class view_source_t final : public source_t {
    value_view_t view_;
    std::size_t offset_ = 0;

  public:
    explicit view_source_t(value_view_t view) noexcept : view_(view) {}
    std::size_t read(char* data, std::size_t length) override {
        std::size_t exported = std::min(length, view_.size() - offset_);
        if (exported)
            std::memcpy(data, view_.data() + offset_, exported);
        offset_ += exported;
        return exported;
    }
    std::size_t remaining() const noexcept { return view_.size() - offset_; }
};

/**
 * @brief Forwards reads to a source, that can be swapped between uses.
 */
class delegate_source_t final : public source_t {
    source_t* target_ = nullptr;

  public:
    void rebind(source_t& target) noexcept { target_ = &target; }
    void unbind() noexcept { target_ = nullptr; }
    std::size_t read(char* data, std::size_t length) override {
        if (!target_)
            throw std::logic_error("Decoder isn't bound to a source");
        return target_->read(data, length);
    }
};

#pragma region Encoders and Decoders

class encoder_t;
class decoder_t;

/**
 * @brief Deleter for encoder and decoder handles.
 */
struct recycle_t {
    void operator()(encoder_t* encoder) const noexcept;
    void operator()(decoder_t* decoder) const noexcept;
};

using encoder_ptr_t = std::unique_ptr<encoder_t, recycle_t>;
using decoder_ptr_t = std::unique_ptr<decoder_t, recycle_t>;

class encoder_t {
  public:
    virtual ~encoder_t() = default;
    virtual status_t encode_payload(payload_t const& payload) noexcept = 0;

    template <typename object_at>
    status_t encode(object_at const& object) noexcept {
        payload_t payload;
        status_t status = safe_section("Converting value", marshal_k, [&] {
            return payload_traits_gt<object_at>::encode(object, payload);
        });
        return_if_error_m(status);
        return encode_payload(payload);
    }

  protected:
    friend struct recycle_t;
    /** @brief Called when the owning handle is released. */
    virtual void recycle() noexcept { delete this; }
};

class decoder_t {
  public:
    virtual ~decoder_t() = default;
    virtual status_t decode_payload(payload_t& payload) noexcept = 0;
    /** @brief Formats without type metadata need the destination's shape. */
    virtual bool wants_shape() const noexcept { return false; }

    template <typename object_at>
    status_t decode(object_at& object) noexcept {
        payload_t payload;
        status_t status = safe_section("Describing destination", unmarshal_k, [&] {
            if (wants_shape())
                payload.shape = payload_traits_gt<object_at>::shape();
        });
        return_if_error_m(status);
        status = decode_payload(payload);
        return_if_error_m(status);
        return safe_section("Converting value", unmarshal_k, [&] {
            return payload_traits_gt<object_at>::decode(payload, object);
        });
    }

  protected:
    friend struct recycle_t;
    virtual void recycle() noexcept { delete this; }
};

inline void recycle_t::operator()(encoder_t* encoder) const noexcept {
    if (encoder)
        encoder->recycle();
}

inline void recycle_t::operator()(decoder_t* decoder) const noexcept {
    if (decoder)
        decoder->recycle();
}

#pragma region Codecs

class codec_t {
  public:
    virtual ~codec_t() = default;
    virtual encoder_ptr_t make_encoder(sink_t& sink) const = 0;
    virtual decoder_ptr_t make_decoder(source_t& source) const = 0;
    /** @brief Names the format and everything that affects its bytes. */
    virtual std::string fingerprint() const = 0;
    /** @brief Whether streams embed type definitions, which priming can omit. */
    virtual bool carries_metadata() const noexcept { return false; }
};

using codec_ptr_t = std::shared_ptr<codec_t const>;

/**
 * @brief Encodes a single value into an owned buffer with a fresh encoder.
 */
template <typename object_at>
status_t marshal(codec_t const& codec, object_at const& object, buffer_t& output) noexcept {
    output.clear();
    buffer_sink_t sink {output};
    encoder_ptr_t encoder;
    status_t status = safe_section("Creating encoder", marshal_k, [&] { encoder = codec.make_encoder(sink); });
    return_if_error_m(status);
    return encoder->encode(object);
}

/**
 * @brief Decodes a single value from a binary view with a fresh decoder.
 */
template <typename object_at>
status_t unmarshal(codec_t const& codec, value_view_t bytes, object_at& object) noexcept {
    view_source_t source {bytes};
    decoder_ptr_t decoder;
    status_t status = safe_section("Creating decoder", unmarshal_k, [&] { decoder = codec.make_decoder(source); });
    return_if_error_m(status);
    return decoder->decode(object);
}

} // namespace unum::ustash
