/**
 * @file codec_json.cpp
 * @author Ashot Vardanian
 *
 * @brief Newline-delimited JSON records.
 *
 * The JSON package provides a number of simple interfaces, which only work with
 * simplest STL types and always allocate the output objects: `dump` and `parse`.
 * They have more flexible alternatives in the form of `nlohmann::detail::serializer`
 * and `nlohmann::detail::parser`, that accept custom adapters. We use those to
 * stream directly to and from our sinks and sources.
 */

#include "ustash/codecs.hpp"

using namespace unum::ustash;
using namespace unum;

/**
 * @brief Output adapter for `nlohmann::detail::serializer`, forwarding into a sink.
 */
struct export_to_sink_t : public nlohmann::detail::output_adapter_protocol<char>,
                          public std::enable_shared_from_this<export_to_sink_t> {
    sink_t* sink_ptr = nullptr;

    export_to_sink_t(sink_t& sink) noexcept : sink_ptr(&sink) {}

    void write_character(char c) override { sink_ptr->write(&c, 1); }
    void write_characters(char const* s, std::size_t length) override { sink_ptr->write(s, length); }
};

/**
 * @brief Input adapter for `nlohmann::detail::parser`, pulling one character at a time.
 * Never reads ahead of the record, so consecutive records can be parsed from one source.
 */
struct import_from_source_t {
    using char_type = char;
    source_t* source_ptr = nullptr;

    std::char_traits<char>::int_type get_character() {
        char c = 0;
        return source_ptr->read(&c, 1) == 1 ? std::char_traits<char>::to_int_type(c) : std::char_traits<char>::eof();
    }
};

class json_encoder_t final : public encoder_t {
    std::shared_ptr<export_to_sink_t> exporter_;
    nlohmann::detail::serializer<json_t> serializer_;

  public:
    explicit json_encoder_t(sink_t& sink)
        : exporter_(std::make_shared<export_to_sink_t>(sink)), serializer_(exporter_, ' ') {}

    status_t encode_payload(payload_t const& payload) noexcept override {
        return safe_section("Encoding JSON", marshal_k, [&] {
            if (payload.body.is_discarded())
                throw std::invalid_argument("Discarded values can't be encoded");
            serializer_.dump(payload.body, false, false, 0, 0);
            exporter_->write_character('\n');
        });
    }
};

class json_decoder_t final : public decoder_t {
    source_t& source_;

  public:
    explicit json_decoder_t(source_t& source) noexcept : source_(source) {}

    status_t decode_payload(payload_t& payload) noexcept override {
        return safe_section("Decoding JSON", unmarshal_k, [&] {
            import_from_source_t adapter {&source_};
            auto parser = nlohmann::detail::parser<json_t, import_from_source_t>(std::move(adapter), nullptr, true, false);
            json_t result;
            parser.parse(false, result);
            payload.body = std::move(result);
            payload.type.clear();
        });
    }
};

namespace unum::ustash {

encoder_ptr_t json_codec_t::make_encoder(sink_t& sink) const {
    return encoder_ptr_t {new json_encoder_t(sink)};
}

decoder_ptr_t json_codec_t::make_decoder(source_t& source) const {
    return decoder_ptr_t {new json_decoder_t(source)};
}

} // namespace unum::ustash
