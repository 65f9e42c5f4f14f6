/**
 * @file payload.hpp
 * @author Ashot Vardanian
 *
 * @brief Format-neutral representation of typed values.
 *
 * Every value travels between C++ objects and wire formats as a `payload_t`:
 * a JSON tree, produced by ADL-discovered `to_json`/`from_json` overloads,
 * annotated with the type name and polymorphism flag.
 *
 * Polymorphic values, held by `std::shared_ptr<base_t>`, can only be restored
 * if their dynamic type was registered beforehand:
 * @code{.cpp}
 * register_type<circle_t, shape_t>("circle");
 * @endcode
 */

#pragma once
#include <memory>        // `std::shared_ptr`
#include <shared_mutex>  // `std::shared_mutex`
#include <string>        // `std::string`
#include <typeindex>     // `std::type_index`
#include <typeinfo>      // `std::type_info`
#include <type_traits>   // `std::is_polymorphic_v`
#include <unordered_map> // `std::unordered_map`

#include <nlohmann/json.hpp> // `nlohmann::json`

#include "ustash/status.hpp"

namespace unum::ustash {

using json_t = nlohmann::json;

struct payload_t {
    json_t body;
    /** Registered or derived type name. Empty for maps, sequences and scalars. */
    std::string type;
    /** Whether the value came from, or goes to, an interface slot. */
    bool polymorphic = false;
    /** Serialized default instance of the destination, guiding untyped formats on decode. */
    json_t shape;
};

/** @brief Human-readable name of a C++ type. */
std::string demangled_name(std::type_info const& type);

/**
 * @brief Process-wide mapping between C++ types and stable type names.
 * Entries are never removed, so names and functions stay valid forever.
 */
class type_registry_t {
  public:
    using dump_t = json_t (*)(void const*);
    using make_t = std::shared_ptr<void> (*)(json_t const&);

    static type_registry_t& global() noexcept;

    /**
     * @brief Binds @p name to @p concrete, and allows constructing it from a JSON
     * tree behind pointers to @p interface. Re-registering the same pair is a no-op,
     * reusing a name for another type, or another name for a type, is an error.
     */
    status_t add(std::string const& name,
                 std::type_index concrete,
                 dump_t dump,
                 std::type_index interface,
                 make_t make) noexcept;

    /** @return Registered name of a type, or `nullptr`. */
    std::string const* name_of(std::type_index concrete) const noexcept;
    /** @return Serializer of the registered type, or `nullptr`. */
    dump_t dump_of(std::type_index concrete) const noexcept;
    /** @return Factory constructing the type named @p name behind an @p interface pointer. */
    expected_gt<make_t> make_of(std::string const& name, std::type_index interface) const;

  private:
    struct entry_t {
        std::string name;
        std::type_index concrete;
        dump_t dump = nullptr;
        std::unordered_map<std::type_index, make_t> makers;
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<entry_t>> by_name_;
    std::unordered_map<std::type_index, entry_t*> by_type_;
};

template <typename concrete_at, typename interface_at>
std::shared_ptr<void> make_behind_interface(json_t const& body) {
    std::shared_ptr<interface_at> object = std::make_shared<concrete_at>(body.get<concrete_at>());
    return object;
}

template <typename concrete_at>
json_t dump_concrete(void const* object) {
    return json_t(*static_cast<concrete_at const*>(object));
}

/**
 * @brief Registers a concrete type under a stable @p name, along with all
 * the interfaces it may be restored behind.
 */
template <typename concrete_at, typename... interfaces_at>
status_t register_type(std::string const& name) noexcept {
    static_assert((std::is_base_of_v<interfaces_at, concrete_at> && ...), "Interfaces must be bases of the type");

    type_registry_t& registry = type_registry_t::global();
    status_t status = registry.add(name,
                                   typeid(concrete_at),
                                   &dump_concrete<concrete_at>,
                                   typeid(concrete_at),
                                   &make_behind_interface<concrete_at, concrete_at>);
    return_if_error_m(status);

    type_registry_t::make_t makers[] = {&make_behind_interface<concrete_at, interfaces_at>..., nullptr};
    std::type_index interfaces[] = {std::type_index(typeid(interfaces_at))..., typeid(concrete_at)};
    for (std::size_t i = 0; i != sizeof...(interfaces_at); ++i) {
        status = registry.add(name, typeid(concrete_at), &dump_concrete<concrete_at>, interfaces[i], makers[i]);
        return_if_error_m(status);
    }
    return {};
}

#pragma region Traits

template <typename at, typename = void>
struct has_mapped_type_gt : std::false_type {};
template <typename at>
struct has_mapped_type_gt<at, std::void_t<typename at::mapped_type>> : std::true_type {};

template <typename at, typename = void>
struct has_value_type_gt : std::false_type {};
template <typename at>
struct has_value_type_gt<at, std::void_t<typename at::value_type>> : std::true_type {};

/**
 * @brief Structures get named type definitions in the binary format,
 * while maps and sequences are encoded as builtin shapes.
 */
template <typename at>
constexpr bool is_structure_k = std::is_class_v<at> && !has_mapped_type_gt<at>::value &&
                                !has_value_type_gt<at>::value && !std::is_same_v<at, json_t>;

template <typename at>
constexpr bool is_sequence_k = has_value_type_gt<at>::value && !has_mapped_type_gt<at>::value &&
                               !std::is_same_v<at, std::string> && !std::is_same_v<at, json_t>;

template <typename object_at>
std::string type_name_of() {
    if constexpr (!is_structure_k<object_at>)
        return {};
    else {
        std::string const* registered = type_registry_t::global().name_of(typeid(object_at));
        return registered ? *registered : demangled_name(typeid(object_at));
    }
}

/**
 * @brief Conversions between objects and payloads. Functions may throw,
 * callers wrap them into `safe_section`.
 */
template <typename object_at>
struct payload_traits_gt {

    static status_t encode(object_at const& object, payload_t& payload) {
        payload.body = object;
        payload.type = type_name_of<object_at>();
        return {};
    }

    static status_t decode(payload_t const& payload, object_at& object) {
        if constexpr (std::is_same_v<object_at, json_t>)
            object = payload.body;
        else
            payload.body.get_to(object);
        return {};
    }

    static json_t shape() {
        if constexpr (is_sequence_k<object_at>) {
            using element_t = typename object_at::value_type;
            return json_t::array({payload_traits_gt<element_t>::shape()});
        }
        else if constexpr (std::is_default_constructible_v<object_at>)
            return json_t(object_at {});
        else
            return {};
    }
};

template <typename object_at>
struct payload_traits_gt<std::shared_ptr<object_at>> {

    static status_t encode(std::shared_ptr<object_at> const& object, payload_t& payload) {
        payload.polymorphic = std::is_polymorphic_v<object_at>;
        if (!object) {
            payload.body = nullptr;
            return {};
        }

        if constexpr (std::is_polymorphic_v<object_at>) {
            std::type_index dynamic_type = typeid(*object);
            type_registry_t& registry = type_registry_t::global();
            std::string const* name = registry.name_of(dynamic_type);
            return_error_if_m(name,
                              marshal_k,
                              fmt::format("Type not registered: {}", demangled_name(typeid(*object))));
            payload.body = registry.dump_of(dynamic_type)(dynamic_cast<void const*>(object.get()));
            payload.type = *name;
            return {};
        }
        else
            return payload_traits_gt<object_at>::encode(*object, payload);
    }

    static status_t decode(payload_t const& payload, std::shared_ptr<object_at>& object) {
        if (payload.body.is_null() && payload.type.empty()) {
            object.reset();
            return {};
        }

        if constexpr (std::is_polymorphic_v<object_at>) {
            if (!payload.type.empty()) {
                auto make = type_registry_t::global().make_of(payload.type, typeid(object_at));
                if (!make)
                    return make.release_status();
                object = std::static_pointer_cast<object_at>((*make)(payload.body));
                return {};
            }
        }

        if constexpr (!std::is_abstract_v<object_at> && std::is_default_constructible_v<object_at>) {
            auto fresh = std::make_shared<object_at>();
            status_t status = payload_traits_gt<object_at>::decode(payload, *fresh);
            return_if_error_m(status);
            object = std::move(fresh);
            return {};
        }
        else
            return {unmarshal_k,
                    fmt::format("Missing type name for a polymorphic {}", demangled_name(typeid(object_at)))};
    }

    static json_t shape() {
        if constexpr (!std::is_abstract_v<object_at> && std::is_default_constructible_v<object_at>)
            return payload_traits_gt<object_at>::shape();
        else
            return {};
    }
};

} // namespace unum::ustash
