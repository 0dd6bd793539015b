#pragma once

#include "export.hpp"
#include "callable.hpp"
#include "interfaces.hpp"
#include "parameter.hpp"
#include "registry.hpp"
#include "type_catalog.hpp"
#include "value.hpp"

#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace spdlog {
class logger;
} // namespace spdlog

namespace dicon {

struct container_options {
    /// Fail with cyclic_dependency when a component is requested while it
    /// is being activated.  Off: the recursion runs until the stack is
    /// exhausted.
    bool detect_cycles = true;

    /// Record a registration stacktrace for every factory (needs a build
    /// with DICON_HAS_STACKTRACE), reported by di_error::full_diagnostic().
    bool capture_stacktraces = false;

    /// Null selects spdlog::default_logger().
    std::shared_ptr<spdlog::logger> logger;
};

// ---------------------------------------------------------------
// container
// ---------------------------------------------------------------

/// Dependency-injection container.  Components are registered by name,
/// built on first get(), and frozen once built.
///
/// The container registers itself as an initialized component under
/// type_name<container>(), type_name<component_lookup>() and
/// type_name<factory>(), so a `container&` parameter resolves to it.
///
/// All public operations are serialised by one recursive mutex; a factory
/// may call back into the container from the same thread.
class DICON_EXPORT container : public component_lookup, public factory {
public:
    explicit container(container_options options = {});
    ~container() override;

    container(const container&) = delete;
    container& operator=(const container&) = delete;
    container(container&&) = delete;
    container& operator=(container&&) = delete;

    // ===============================================================
    // Registration
    // ===============================================================

    /// Register a factory function.  `map` overrides its parameters.
    container& register_factory(std::string_view name, callable factory,
                                parameter_map map = {},
                                std::source_location loc = std::source_location::current());

    /// Register the catalog type called `name`, constructed with `map`.
    container& register_type(std::string_view name, parameter_map map = {},
                             std::source_location loc = std::source_location::current());

    /// Register the catalog type `type_name` under another `name` (e.g.
    /// an implementation under its interface name).
    container& register_type_as(std::string_view name, std::string type_name,
                                parameter_map map = {},
                                std::source_location loc = std::source_location::current());

    /// `name` resolves to whatever `ref_name` resolves to, fetched on first
    /// use of `name`.
    container& alias(std::string_view name, std::string ref_name,
                     std::source_location loc = std::source_location::current());

    /// Inject a ready-made value.
    container& set(std::string_view name, value v,
                   std::source_location loc = std::source_location::current());

    /// Add a configuration function.  Its first parameter receives the
    /// component; a non-null return value replaces the component.  Applied
    /// on activation, or immediately if the component already has a value.
    container& configure(std::string_view name, callable fn, parameter_map map = {});

    /// Apply a packaged set of registrations.
    container& add(provider& p);

    // ===============================================================
    // Resolution
    // ===============================================================

    bool has(std::string_view name) const override;
    bool is_active(std::string_view name) const;
    bool is_initialized(std::string_view name) const;

    value get(std::string_view name) override;

    /// get() viewed as T.  The reference stays valid while the container
    /// holds the component.
    template <typename T>
    T& get(std::string_view name) {
        return get(name).as<T>();
    }

    /// Resolve the callable's parameters and invoke it.
    value call(const callable& fn, const parameter_map& map = {});

    /// Construct a catalog type with injected constructor arguments.
    value create(std::string_view type_name, const parameter_map& map = {}) override;

    /// Boxed reference to a component; nothing is activated until the
    /// resolver consumes it.
    value ref(std::string_view name);

    /// Boxed call: `fn` is resolved and invoked when the box is consumed.
    value defer(callable fn, parameter_map map = {});

    // ===============================================================
    // Introspection
    // ===============================================================

    type_catalog& types() noexcept;
    std::vector<std::string> names() const;
    const container_options& options() const noexcept;

private:
    value activate(std::string_view name);
    void apply_configuration(std::string_view name, const configuration_entry& entry);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dicon
