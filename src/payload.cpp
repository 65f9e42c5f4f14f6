/**
 * @file payload.cpp
 * @author Ashot Vardanian
 *
 * @brief Process-wide registry of named types.
 */

#include <cstdlib>  // `std::free`
#include <mutex>    // `std::unique_lock`
#include <cxxabi.h> // `abi::__cxa_demangle`

#include "ustash/payload.hpp"
#include "ustash/log.hpp"

namespace unum::ustash {

static std::string demangle(char const* mangled) {
    int status = 0;
    char* demangled = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);
    if (status != 0 || !demangled)
        return mangled;
    std::string result = demangled;
    std::free(demangled);
    return result;
}

std::string demangled_name(std::type_info const& type) {
    return demangle(type.name());
}

type_registry_t& type_registry_t::global() noexcept {
    static type_registry_t registry;
    return registry;
}

status_t type_registry_t::add(std::string const& name,
                              std::type_index concrete,
                              dump_t dump,
                              std::type_index interface,
                              make_t make) noexcept {

    return_error_if_m(!name.empty(), args_wrong_k, "Type name can't be empty");
    return safe_section("Registering type", args_wrong_k, [&]() -> status_t {
        std::unique_lock _ {mutex_};

        auto named = by_name_.find(name);
        auto typed = by_type_.find(concrete);
        if (named != by_name_.end() && named->second->concrete != concrete)
            return {args_wrong_k, fmt::format("Name {} is already bound to another type", name)};
        if (typed != by_type_.end() && typed->second->name != name)
            return {args_wrong_k,
                    fmt::format("Type is already registered as {}, can't rename to {}", typed->second->name, name)};

        entry_t* entry = nullptr;
        if (named == by_name_.end()) {
            auto fresh = std::make_unique<entry_t>(entry_t {name, concrete, dump, {}});
            entry = fresh.get();
            by_name_.emplace(name, std::move(fresh));
            by_type_.emplace(concrete, entry);
            log_debug_m("Registered type %s as %s\n", demangle(concrete.name()).c_str(), name.c_str());
        }
        else
            entry = named->second.get();

        entry->makers.emplace(interface, make);
        return {};
    });
}

std::string const* type_registry_t::name_of(std::type_index concrete) const noexcept {
    std::shared_lock _ {mutex_};
    auto it = by_type_.find(concrete);
    return it != by_type_.end() ? &it->second->name : nullptr;
}

type_registry_t::dump_t type_registry_t::dump_of(std::type_index concrete) const noexcept {
    std::shared_lock _ {mutex_};
    auto it = by_type_.find(concrete);
    return it != by_type_.end() ? it->second->dump : nullptr;
}

expected_gt<type_registry_t::make_t> type_registry_t::make_of(std::string const& name,
                                                              std::type_index interface) const {
    std::shared_lock _ {mutex_};
    auto it = by_name_.find(name);
    if (it == by_name_.end())
        return {{unmarshal_k, fmt::format("Unknown type name: {}", name)}, nullptr};

    auto make = it->second->makers.find(interface);
    if (make == it->second->makers.end())
        return {{unmarshal_k, fmt::format("Type {} wasn't registered behind the requested interface", name)},
                nullptr};
    make_t result = make->second;
    return {std::move(result)};
}

} // namespace unum::ustash
