#pragma once

#include "export.hpp"
#include "callable.hpp"
#include "parameter.hpp"
#include "value.hpp"

#include <any>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace dicon {

namespace internal {
/// Capture the current stacktrace into a type-erased container.
/// Returns an empty std::any when stacktrace support is disabled.
DICON_EXPORT std::any capture_stacktrace();
} // namespace internal

/// A post-construction hook and its own parameter overrides.
struct configuration_entry {
    callable      fn;
    parameter_map map;
};

// ---------------------------------------------------------------
// component_record — everything known about one component name
// ---------------------------------------------------------------

struct component_record {
    std::optional<value> stored;        // engaged = active (a stored null counts)
    callable             factory;       // empty = no factory registered
    parameter_map        factory_map;
    bool                 initialized = false;
    std::vector<configuration_entry> pending;

    std::source_location registration_location;
    std::any             registration_stacktrace;   // boost::stacktrace when enabled
};

// ---------------------------------------------------------------
// registry
// ---------------------------------------------------------------

/// Per-name lifecycle state.  A name moves from unregistered to
/// registered (factory present) to active (value stored).  The
/// initialized flag freezes a name: it is set once activation has
/// finished and is never cleared.
///
/// Not synchronised; the container serialises access.
class DICON_EXPORT registry {
public:
    registry();
    ~registry();

    registry(const registry&) = delete;
    registry& operator=(const registry&) = delete;
    registry(registry&&) noexcept;
    registry& operator=(registry&&) noexcept;

    /// A value is stored or a factory is registered.
    bool exists(std::string_view name) const;

    /// A value is stored, however it got there.
    bool is_active(std::string_view name) const;

    bool is_initialized(std::string_view name) const;

    /// Store a value; lookups now short-circuit any factory.  Callers
    /// decide whether an initialized name may change (configuration
    /// replacements may, direct injection may not).
    void put_value(std::string_view name, value v,
                   std::source_location loc = std::source_location::current());

    /// Register a factory and drop any stored raw value.
    /// Throws lifecycle_error if the name is initialized.
    void put_factory(std::string_view name, callable factory, parameter_map map,
                     std::source_location loc = std::source_location::current(),
                     std::any stacktrace = {});

    /// Drop a stored value (activation rollback).  No-op for initialized
    /// names.
    void erase_value(std::string_view name);

    void mark_initialized(std::string_view name);

    /// Throws not_found if the name has neither value nor factory.
    void queue_configuration(std::string_view name, configuration_entry entry);

    /// Return and clear the pending configuration entries.
    std::vector<configuration_entry> drain_configurations(std::string_view name);

    /// Put entries back in front of whatever is pending.
    void restore_configurations(std::string_view name,
                                std::vector<configuration_entry> entries);

    /// nullptr if the name was never seen.
    const component_record* find(std::string_view name) const;

    std::vector<std::string> names() const;

private:
    component_record* find_mutable(std::string_view name);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dicon
