#pragma once

#include "export.hpp"
#include "parameter.hpp"
#include "value.hpp"

#include <string_view>

namespace dicon {

class container;

/// Read access to named components.  The resolver only ever talks to
/// components through this interface.
class DICON_EXPORT component_lookup {
public:
    virtual ~component_lookup() = default;

    /// True if a value is stored or a factory is registered under name.
    virtual bool has(std::string_view name) const = 0;

    /// Value of a component, activating it on first use.
    virtual value get(std::string_view name) = 0;
};

/// Construction of registered types with injected constructor arguments.
class DICON_EXPORT factory {
public:
    virtual ~factory() = default;

    virtual value create(std::string_view type_name, const parameter_map& map) = 0;
};

/// A packaged set of registrations, applied with container::add().
class DICON_EXPORT provider {
public:
    virtual ~provider() = default;

    virtual void register_components(container& c) = 0;
};

} // namespace dicon
