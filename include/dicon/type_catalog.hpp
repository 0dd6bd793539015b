#pragma once

#include "export.hpp"
#include "callable.hpp"
#include "parameter.hpp"
#include "type_traits.hpp"
#include "value.hpp"

#include <functional>
#include <map>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace dicon {

// ---------------------------------------------------------------
// type_catalog — named constructors for container::create()
// ---------------------------------------------------------------

/// Maps type names to constructor descriptors.  Types are registered
/// under their demangled C++ name (see type_name<T>()); abstract types can
/// be recorded so that create() reports them as non-instantiable.
///
/// Populate the catalog before the owning container is used from several
/// threads.
class DICON_EXPORT type_catalog {
public:
    struct entry {
        std::string name;
        callable    constructor;    // empty for abstract types
        bool        instantiable = false;
    };

    /// Default-constructible type, viewable as T or any of Bases.
    template <typename T, typename... Bases>
        requires std::is_default_constructible_v<T>
    type_catalog& add(std::source_location loc = std::source_location::current()) {
        static_assert(!std::is_abstract_v<T>,
            "type_catalog::add<T>: use add_abstract<T>() for abstract types");
        return add(type_name<T>(),
                   fn([]() { return value::make<T, Bases...>(); }, loc));
    }

    /// Type constructed from `Args...`, one `arg` per constructor argument.
    template <typename T, typename... Bases, typename... Args>
        requires constructible_from_deps<T, Args...>
    type_catalog& add(deps_tag<Args...>, std::vector<arg> names,
                      std::source_location loc = std::source_location::current()) {
        static_assert(!std::is_abstract_v<T>,
            "type_catalog::add<T>: use add_abstract<T>() for abstract types");
        return add(type_name<T>(),
                   fn(std::move(names),
                      [](Args... a) { return value::make<T, Bases...>(std::forward<Args>(a)...); },
                      loc));
    }

    /// Record an abstract (non-instantiable) type.
    template <typename T>
    type_catalog& add_abstract() {
        return add_abstract(type_name<T>());
    }

    /// Register a constructor under an arbitrary name.
    type_catalog& add(std::string name, callable constructor);

    type_catalog& add_abstract(std::string name);

    bool contains(std::string_view name) const;

    /// nullptr if unknown.
    const entry* find(std::string_view name) const;

private:
    std::map<std::string, entry, std::less<>> entries_;
};

} // namespace dicon
