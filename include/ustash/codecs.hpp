/**
 * @file codecs.hpp
 * @author Ashot Vardanian
 *
 * @brief Concrete wire formats.
 *
 * > `binary_codec_t`: self-describing, length-delimited MessagePack messages.
 *   The first time a stream meets a structure, it emits a type definition
 *   with its name and field names, and refers to it by a numeric id after.
 * > `json_codec_t`: JSON text, one record per line.
 * > `xml_codec_t`: XML markup, one document per record.
 *
 * Text formats carry no type metadata, so their encoders and decoders are
 * stateless and can be reused between unrelated calls.
 */

#pragma once
#include "ustash/codec.hpp"

namespace unum::ustash {

/**
 * @brief Binary format with per-stream type definitions.
 *
 * Every message is a variable-length unsigned length, followed by a
 * MessagePack array:
 * > Type definition: `[-id, name, [field, ...]]`, ids start from 65.
 * > Value: `[id, body]`, where structures are positional arrays of field
 *   values, if the fields match the definition, or full objects otherwise.
 * > Interface value: `[16, name, inner_id, body]`.
 * Decoding matches fields by name, so a structure can be read back into
 * another one, sharing some field names.
 */
class binary_codec_t final : public codec_t {
  public:
    static constexpr std::int64_t first_user_type_id_k = 65;

    encoder_ptr_t make_encoder(sink_t& sink) const override;
    decoder_ptr_t make_decoder(source_t& source) const override;
    std::string fingerprint() const override { return "binary/1"; }
    bool carries_metadata() const noexcept override { return true; }
};

class json_codec_t final : public codec_t {
  public:
    encoder_ptr_t make_encoder(sink_t& sink) const override;
    decoder_ptr_t make_decoder(source_t& source) const override;
    std::string fingerprint() const override { return "json"; }
};

/**
 * @brief XML documents with a `<value>` root.
 * Objects become nested elements, sequences become repeated `<item>` elements,
 * and nulls are marked with a `null="true"` attribute. Decoders consume their
 * source to the end and use the destination's shape to restore scalar types.
 */
class xml_codec_t final : public codec_t {
  public:
    encoder_ptr_t make_encoder(sink_t& sink) const override;
    decoder_ptr_t make_decoder(source_t& source) const override;
    std::string fingerprint() const override { return "xml"; }
};

} // namespace unum::ustash
