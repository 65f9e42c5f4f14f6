/**
 * @file codec_xml.cpp
 * @author Ashot Vardanian
 *
 * @brief XML documents, built and parsed with @b Boost.PropertyTree.
 *
 * Markup has no native notion of numbers, booleans or sequences, so decoding
 * relies on the shape of the destination, when it is known. Where it isn't,
 * elements with children named `item` become arrays, other elements with
 * children become objects, and scalars are guessed from their text.
 * Values, that would be guessed wrong, carry a `type` attribute.
 */

#include <sstream> // `std::ostringstream`
#include <cctype>  // `std::isalpha`
#include <cerrno>  // `errno`
#include <cstdlib> // `std::strtoll`

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include "ustash/codecs.hpp"

using namespace unum::ustash;
using namespace unum;

namespace pt = boost::property_tree;
using tree_t = pt::ptree;

static constexpr char const* root_tag_k = "value";
static constexpr char const* item_tag_k = "item";
static constexpr char const* attributes_tag_k = "<xmlattr>";
static constexpr char const* null_attribute_k = "<xmlattr>.null";
static constexpr char const* type_attribute_k = "<xmlattr>.type";

inline bool is_valid_tag(std::string const& name) noexcept {
    if (name.empty() || !(std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '_'))
        return false;
    for (char c : name)
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.'))
            return false;
    return true;
}

inline bool is_markup(std::string const& name) noexcept {
    return name == attributes_tag_k || name == "<xmlcomment>" || name == "<xmltext>";
}

/*********************************************************/
/*****************	     JSON to XML	  ****************/
/*********************************************************/

json_t guess_scalar(std::string const& text) {
    if (text == "true")
        return true;
    if (text == "false")
        return false;
    if (text.empty() || std::isspace(static_cast<unsigned char>(text.front())))
        return text;

    char const* begin = text.c_str();
    char* end = nullptr;
    errno = 0;
    long long integer = std::strtoll(begin, &end, 10);
    if (errno == 0 && end == begin + text.size())
        return integer;
    if (errno == ERANGE && text.front() != '-') {
        errno = 0;
        unsigned long long natural = std::strtoull(begin, &end, 10);
        if (errno == 0 && end == begin + text.size())
            return natural;
    }

    errno = 0;
    double real = std::strtod(begin, &end);
    if (errno == 0 && end == begin + text.size())
        return real;
    return text;
}

/**
 * @brief Names the type of values, that can't be inferred back from their
 * markup: strings looking like numbers, empty containers and objects,
 * which fields are all called `item`.
 */
char const* type_hint(json_t const& json) {
    switch (json.type()) {
    case json_t::value_t::string:
        return guess_scalar(json.get_ref<std::string const&>()).is_string() ? nullptr : "string";
    case json_t::value_t::array: return json.empty() ? "array" : nullptr;
    case json_t::value_t::object:
        for (auto field = json.begin(); field != json.end(); ++field)
            if (field.key() != item_tag_k)
                return nullptr;
        return "object";
    default: return nullptr;
    }
}

void export_tree(json_t const& json, tree_t& node) {
    if (char const* hint = type_hint(json))
        node.put(type_attribute_k, hint);
    switch (json.type()) {
    case json_t::value_t::null: node.put(null_attribute_k, "true"); break;
    case json_t::value_t::boolean: node.data() = json.get<bool>() ? "true" : "false"; break;
    case json_t::value_t::number_integer:
    case json_t::value_t::number_unsigned:
    case json_t::value_t::number_float: node.data() = json.dump(); break;
    case json_t::value_t::string: node.data() = json.get<std::string>(); break;
    case json_t::value_t::array:
        for (auto const& element : json) {
            tree_t child;
            export_tree(element, child);
            node.push_back({item_tag_k, std::move(child)});
        }
        break;
    case json_t::value_t::object:
        for (auto field = json.begin(); field != json.end(); ++field) {
            if (!is_valid_tag(field.key()))
                throw std::invalid_argument("Field name isn't a valid XML tag: " + field.key());
            tree_t child;
            export_tree(field.value(), child);
            node.push_back({field.key(), std::move(child)});
        }
        break;
    default: throw std::invalid_argument("Binary and discarded values can't be represented in XML");
    }
}

/*********************************************************/
/*****************	     XML to JSON	  ****************/
/*********************************************************/

template <typename number_at, typename parse_at>
number_at parse_number(std::string const& text, parse_at parse) {
    std::size_t parsed = 0;
    number_at result = parse(text, &parsed);
    if (parsed != text.size())
        throw std::invalid_argument("Not a number: " + text);
    return result;
}

json_t import_tree(tree_t const& node, json_t const& shape) {
    if (node.get<std::string>(null_attribute_k, "") == "true")
        return nullptr;

    switch (shape.type()) {
    case json_t::value_t::boolean: {
        std::string const& text = node.data();
        if (text != "true" && text != "false")
            throw std::invalid_argument("Not a boolean: " + text);
        return text == "true";
    }
    case json_t::value_t::number_integer:
        return parse_number<std::int64_t>(node.data(), [](std::string const& s, std::size_t* n) {
            return std::stoll(s, n);
        });
    case json_t::value_t::number_unsigned:
        return parse_number<std::uint64_t>(node.data(), [](std::string const& s, std::size_t* n) {
            return std::stoull(s, n);
        });
    case json_t::value_t::number_float:
        return parse_number<double>(node.data(), [](std::string const& s, std::size_t* n) { return std::stod(s, n); });
    case json_t::value_t::string: return node.data();
    case json_t::value_t::array: {
        json_t const& element_shape = shape.empty() ? json_t() : shape.front();
        json_t result = json_t::array();
        for (auto const& [name, child] : node)
            if (name == item_tag_k)
                result.push_back(import_tree(child, element_shape));
        return result;
    }
    case json_t::value_t::object: {
        json_t result = json_t::object();
        for (auto const& [name, child] : node) {
            if (is_markup(name))
                continue;
            auto field_shape = shape.find(name);
            result[name] = import_tree(child, field_shape != shape.end() ? *field_shape : json_t());
        }
        return result;
    }
    default: break;
    }

    // Unknown shape: follow the hint or infer from the tree itself.
    std::string hint = node.get<std::string>(type_attribute_k, "");
    if (hint == "string")
        return node.data();
    if (hint == "array")
        return import_tree(node, json_t::array());
    if (hint == "object")
        return import_tree(node, json_t::object());

    bool has_children = false;
    bool only_items = true;
    for (auto const& [name, child] : node) {
        if (is_markup(name))
            continue;
        has_children = true;
        only_items &= name == item_tag_k;
    }
    if (!has_children)
        return guess_scalar(node.data());
    return import_tree(node, only_items ? json_t::array() : json_t::object());
}

/*********************************************************/
/*****************	  Encoder & Decoder	  ****************/
/*********************************************************/

class xml_encoder_t final : public encoder_t {
    sink_t& sink_;

  public:
    explicit xml_encoder_t(sink_t& sink) noexcept : sink_(sink) {}

    status_t encode_payload(payload_t const& payload) noexcept override {
        return safe_section("Encoding XML", marshal_k, [&] {
            tree_t document;
            tree_t& root = document.add_child(root_tag_k, tree_t {});
            export_tree(payload.body, root);

            std::ostringstream stream;
            pt::write_xml(stream, document);
            std::string const& text = stream.str();
            sink_.write(text.data(), text.size());
        });
    }
};

class xml_decoder_t final : public decoder_t {
    source_t& source_;

  public:
    explicit xml_decoder_t(source_t& source) noexcept : source_(source) {}

    bool wants_shape() const noexcept override { return true; }

    status_t decode_payload(payload_t& payload) noexcept override {
        return safe_section("Decoding XML", unmarshal_k, [&]() -> status_t {
            std::string text;
            char chunk[4096];
            while (std::size_t exported = source_.read(chunk, sizeof(chunk)))
                text.append(chunk, exported);
            return_error_if_m(!text.empty(), unmarshal_k, "Unexpected end of stream");

            std::istringstream stream(text);
            tree_t document;
            pt::read_xml(stream, document);
            auto root = document.get_child_optional(root_tag_k);
            return_error_if_m(root, unmarshal_k, "Missing <value> root element");

            payload.body = import_tree(*root, payload.shape);
            payload.type.clear();
            return {};
        });
    }
};

namespace unum::ustash {

encoder_ptr_t xml_codec_t::make_encoder(sink_t& sink) const {
    return encoder_ptr_t {new xml_encoder_t(sink)};
}

decoder_ptr_t xml_codec_t::make_decoder(source_t& source) const {
    return decoder_ptr_t {new xml_decoder_t(source)};
}

} // namespace unum::ustash
