/**
 * @file codec_binary.cpp
 * @author Ashot Vardanian
 *
 * @brief Self-describing binary format on top of MessagePack.
 *
 * The stream is a sequence of messages, each prefixed with its length,
 * encoded as an unsigned LEB128 integer. Encoders remember which structures
 * were already described to the other side, decoders remember the received
 * descriptions. Neither can forget, which is why reusing them for unrelated
 * streams is only safe after priming with a closed set of types.
 */

#include <unordered_map>
#include <vector>

#include "ustash/codecs.hpp"

using namespace unum::ustash;
using namespace unum;

/*********************************************************/
/*****************   Structures & Consts  ****************/
/*********************************************************/

static constexpr std::int64_t bool_type_k = 1;
static constexpr std::int64_t int_type_k = 2;
static constexpr std::int64_t uint_type_k = 3;
static constexpr std::int64_t float_type_k = 4;
static constexpr std::int64_t bytes_type_k = 5;
static constexpr std::int64_t string_type_k = 6;
static constexpr std::int64_t array_type_k = 7;
static constexpr std::int64_t object_type_k = 8;
static constexpr std::int64_t null_type_k = 9;
static constexpr std::int64_t interface_type_k = 16;

static constexpr std::size_t max_message_length_k = 1ull << 30;

struct type_definition_t {
    std::int64_t id = 0;
    std::string name;
    std::vector<std::string> fields;
};

/**
 * @brief Output adapter for `nlohmann::detail::binary_writer`, appending into a buffer.
 * The writer only accepts shared pointers to adapters.
 */
struct export_to_buffer_t : public nlohmann::detail::output_adapter_protocol<char>,
                            public std::enable_shared_from_this<export_to_buffer_t> {
    buffer_t buffer;

    void write_character(char c) override { buffer.push_back(c); }
    void write_characters(char const* s, std::size_t length) override { buffer.append(s, length); }
};

inline std::int64_t builtin_type_id(json_t const& body) {
    switch (body.type()) {
    case json_t::value_t::null: return null_type_k;
    case json_t::value_t::boolean: return bool_type_k;
    case json_t::value_t::number_integer: return int_type_k;
    case json_t::value_t::number_unsigned: return uint_type_k;
    case json_t::value_t::number_float: return float_type_k;
    case json_t::value_t::binary: return bytes_type_k;
    case json_t::value_t::string: return string_type_k;
    case json_t::value_t::array: return array_type_k;
    case json_t::value_t::object: return object_type_k;
    default: throw std::invalid_argument("Discarded values can't be encoded");
    }
}

inline bool matches_builtin_type(std::int64_t id, json_t const& body) noexcept {
    switch (id) {
    case null_type_k: return body.is_null();
    case bool_type_k: return body.is_boolean();
    // MessagePack doesn't preserve signedness of non-negative integers.
    case int_type_k:
    case uint_type_k: return body.is_number_integer();
    case float_type_k: return body.is_number();
    case bytes_type_k: return body.is_binary();
    case string_type_k: return body.is_string();
    case array_type_k: return body.is_array();
    case object_type_k: return body.is_object();
    default: return false;
    }
}

/*********************************************************/
/*****************	       Encoder  	  ****************/
/*********************************************************/

class binary_encoder_t final : public encoder_t {
    sink_t& sink_;
    std::unordered_map<std::string, type_definition_t> sent_;
    std::int64_t next_id_ = binary_codec_t::first_user_type_id_k;
    std::shared_ptr<export_to_buffer_t> scratch_;
    nlohmann::detail::binary_writer<json_t, char> writer_;

  public:
    explicit binary_encoder_t(sink_t& sink)
        : sink_(sink), scratch_(std::make_shared<export_to_buffer_t>()), writer_(scratch_) {}

    status_t encode_payload(payload_t const& payload) noexcept override {
        return safe_section("Encoding binary message", marshal_k, [&] {
            if (payload.polymorphic && payload.type.empty() && payload.body.is_null()) {
                emit(json_t::array({interface_type_k, "", null_type_k, nullptr}));
                return;
            }

            auto [id, body] = describe(payload.type, payload.body);
            if (payload.polymorphic)
                emit(json_t::array({interface_type_k, payload.type, id, std::move(body)}));
            else
                emit(json_t::array({id, std::move(body)}));
        });
    }

  private:
    /**
     * @brief Resolves the type id of a value, emitting its definition the
     * first time a structure is met, and packs its fields positionally.
     */
    std::pair<std::int64_t, json_t> describe(std::string const& type, json_t const& body) {
        if (type.empty() || !body.is_object())
            return {builtin_type_id(body), body};

        auto it = sent_.find(type);
        if (it == sent_.end()) {
            type_definition_t definition;
            definition.id = next_id_++;
            definition.name = type;
            for (auto field = body.begin(); field != body.end(); ++field)
                definition.fields.push_back(field.key());
            emit(json_t::array({-definition.id, definition.name, definition.fields}));
            it = sent_.emplace(type, std::move(definition)).first;
        }

        type_definition_t const& definition = it->second;
        bool positional = body.size() == definition.fields.size();
        for (std::size_t i = 0; positional && i != definition.fields.size(); ++i)
            positional = body.contains(definition.fields[i]);
        if (!positional)
            return {definition.id, body};

        json_t packed = json_t::array();
        for (auto const& field : definition.fields)
            packed.push_back(body[field]);
        return {definition.id, std::move(packed)};
    }

    void emit(json_t const& message) {
        scratch_->buffer.clear();
        writer_.write_msgpack(message);

        char prefix[10];
        std::size_t prefix_length = 0;
        std::size_t length = scratch_->buffer.size();
        do {
            char byte = static_cast<char>(length & 0x7F);
            length >>= 7;
            prefix[prefix_length++] = static_cast<char>(byte | (length ? 0x80 : 0));
        } while (length);

        sink_.write(prefix, prefix_length);
        sink_.write(scratch_->buffer.data(), scratch_->buffer.size());
    }
};

/*********************************************************/
/*****************	       Decoder  	  ****************/
/*********************************************************/

class binary_decoder_t final : public decoder_t {
    source_t& source_;
    std::unordered_map<std::int64_t, type_definition_t> received_;
    buffer_t scratch_;

  public:
    explicit binary_decoder_t(source_t& source) noexcept : source_(source) {}

    status_t decode_payload(payload_t& payload) noexcept override {
        return safe_section("Decoding binary message", unmarshal_k, [&]() -> status_t {
            while (true) {
                json_t message;
                status_t status = read_message(message);
                return_if_error_m(status);
                return_error_if_m(message.is_array() && message.size() >= 2 && message[0].is_number_integer(),
                                  unmarshal_k,
                                  "Malformed message header");

                auto id = message[0].get<std::int64_t>();
                if (id < 0) {
                    status = define(-id, message);
                    return_if_error_m(status);
                    continue;
                }

                if (id != interface_type_k)
                    return restore(id, message[1], payload);

                return_error_if_m(message.size() == 4 && message[1].is_string() && message[2].is_number_integer(),
                                  unmarshal_k,
                                  "Malformed interface value");
                payload.polymorphic = true;
                auto inner_id = message[2].get<std::int64_t>();
                if (inner_id == null_type_k && message[1].get_ref<std::string const&>().empty()) {
                    payload.body = nullptr;
                    payload.type.clear();
                    return {};
                }

                status = restore(inner_id, message[3], payload);
                return_if_error_m(status);
                payload.type = message[1].get<std::string>();
                return {};
            }
        });
    }

  private:
    status_t read_message(json_t& message) {
        std::size_t length = 0;
        for (std::size_t shift = 0;; shift += 7) {
            char byte = 0;
            if (source_.read(&byte, 1) != 1)
                return {unmarshal_k, shift ? "Truncated message length" : "Unexpected end of stream"};
            return_error_if_m(shift < 64, unmarshal_k, "Message length overflow");
            auto bits = static_cast<std::uint8_t>(byte);
            length |= static_cast<std::size_t>(bits & 0x7F) << shift;
            if (!(bits & 0x80))
                break;
        }
        return_error_if_m(length <= max_message_length_k, unmarshal_k, "Message is too long");

        scratch_.resize(length);
        std::size_t filled = 0;
        while (filled != length) {
            std::size_t exported = source_.read(scratch_.data() + filled, length - filled);
            return_error_if_m(exported, unmarshal_k, "Truncated message");
            filled += exported;
        }

        message = json_t::from_msgpack(scratch_.begin(), scratch_.end());
        return {};
    }

    status_t define(std::int64_t id, json_t const& message) {
        return_error_if_m(id >= binary_codec_t::first_user_type_id_k, unmarshal_k, "Reserved type id");
        return_error_if_m(message.size() == 3 && message[1].is_string() && message[2].is_array(),
                          unmarshal_k,
                          "Malformed type definition");

        type_definition_t definition;
        definition.id = id;
        definition.name = message[1].get<std::string>();
        definition.fields = message[2].get<std::vector<std::string>>();

        auto it = received_.find(id);
        if (it != received_.end()) {
            bool same = it->second.name == definition.name && it->second.fields == definition.fields;
            return_error_if_m(same, unmarshal_k, fmt::format("Conflicting definitions of type id {}", id));
            return {};
        }
        received_.emplace(id, std::move(definition));
        return {};
    }

    status_t restore(std::int64_t id, json_t& body, payload_t& payload) {
        if (id < binary_codec_t::first_user_type_id_k) {
            return_error_if_m(matches_builtin_type(id, body),
                              unmarshal_k,
                              fmt::format("Value doesn't match builtin type id {}", id));
            payload.body = std::move(body);
            payload.type.clear();
            return {};
        }

        auto it = received_.find(id);
        return_error_if_m(it != received_.end(), unmarshal_k, fmt::format("Unknown type id {}", id));
        type_definition_t const& definition = it->second;
        payload.type = definition.name;

        if (body.is_object()) {
            payload.body = std::move(body);
            return {};
        }

        return_error_if_m(body.is_array() && body.size() == definition.fields.size(),
                          unmarshal_k,
                          fmt::format("Value doesn't match the definition of {}", definition.name));
        payload.body = json_t::object();
        for (std::size_t i = 0; i != definition.fields.size(); ++i)
            payload.body[definition.fields[i]] = std::move(body[i]);
        return {};
    }
};

/*********************************************************/
/*****************	        Codec   	  ****************/
/*********************************************************/

namespace unum::ustash {

encoder_ptr_t binary_codec_t::make_encoder(sink_t& sink) const {
    return encoder_ptr_t {new binary_encoder_t(sink)};
}

decoder_ptr_t binary_codec_t::make_decoder(source_t& source) const {
    return decoder_ptr_t {new binary_decoder_t(source)};
}

} // namespace unum::ustash
