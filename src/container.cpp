#include "dicon/container.hpp"
#include "dicon/boxed.hpp"
#include "dicon/exceptions.hpp"
#include "dicon/registry.hpp"
#include "dicon/resolver.hpp"
#include "dicon/type_traits.hpp"
#include "logging.hpp"
#include "stacktrace_utils.hpp"

#include <algorithm>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace dicon {

// ---------------------------------------------------------------
// Impl
// ---------------------------------------------------------------

struct container::Impl {
    container_options options;
    std::shared_ptr<spdlog::logger> logger;

    registry components;
    type_catalog catalog;
    resolver args;

    // Guards every public operation; re-entered by factories.
    mutable std::recursive_mutex mutex;

    // Names whose factory is currently running, outermost first.
    std::vector<std::string> activating;

    Impl(container& self, container_options opts)
        : options(std::move(opts))
        , logger(internal::select_logger(options.logger))
        , args(self, logger)
    {}
};

namespace {

/// Pops the activation stack on every exit path.
class activation_frame {
public:
    activation_frame(std::vector<std::string>& stack, std::string_view name)
        : stack_(stack) { stack_.emplace_back(name); }
    ~activation_frame() { stack_.pop_back(); }

    activation_frame(const activation_frame&) = delete;
    activation_frame& operator=(const activation_frame&) = delete;

private:
    std::vector<std::string>& stack_;
};

} // namespace

// ---------------------------------------------------------------
// Constructors / Destructor
// ---------------------------------------------------------------

container::container(container_options options)
    : impl_(std::make_unique<Impl>(*this, std::move(options)))
{
    // Non-owning handle: the container outlives everything it stores.
    auto self = value::wrap<container, component_lookup, factory>(
        std::shared_ptr<container>(std::shared_ptr<container>{}, this));

    for (const auto& name : {type_name<container>(),
                             type_name<component_lookup>(),
                             type_name<factory>()}) {
        impl_->components.put_value(name, self);
        impl_->components.mark_initialized(name);
    }
}

container::~container() = default;

// ---------------------------------------------------------------
// Registration
// ---------------------------------------------------------------

container& container::register_factory(std::string_view name, callable factory,
                                       parameter_map map, std::source_location loc) {
    std::lock_guard lock(impl_->mutex);
    const auto& activating = impl_->activating;
    if (std::find(activating.begin(), activating.end(), name) != activating.end()) {
        throw lifecycle_error(name, "attempted re-registration of component during its activation",
                              loc);
    }
    auto trace = impl_->options.capture_stacktraces ? internal::capture_stacktrace()
                                                    : std::any{};
    impl_->components.put_factory(name, std::move(factory), std::move(map),
                                  loc, std::move(trace));
    impl_->logger->debug("registered component {}", name);
    return *this;
}

container& container::register_type(std::string_view name, parameter_map map,
                                    std::source_location loc) {
    return register_type_as(name, std::string(name), std::move(map), loc);
}

container& container::register_type_as(std::string_view name, std::string type_name,
                                       parameter_map map, std::source_location loc) {
    return register_factory(
        name,
        fn([this, type = std::move(type_name), map = std::move(map)]() {
            return create(type, map);
        }, loc),
        {}, loc);
}

container& container::alias(std::string_view name, std::string ref_name,
                            std::source_location loc) {
    return register_factory(
        name,
        fn([this, target = std::move(ref_name)]() { return get(target); }, loc),
        {}, loc);
}

container& container::set(std::string_view name, value v, std::source_location loc) {
    std::lock_guard lock(impl_->mutex);
    if (impl_->components.is_initialized(name)) {
        throw lifecycle_error(name, "attempted overwrite of initialized component", loc);
    }
    impl_->components.put_value(name, std::move(v), loc);
    impl_->logger->debug("injected component {}", name);
    return *this;
}

container& container::configure(std::string_view name, callable fn, parameter_map map) {
    std::lock_guard lock(impl_->mutex);
    if (!fn) {
        throw invalid_argument("expected callable");
    }

    configuration_entry entry{std::move(fn), std::move(map)};

    if (impl_->components.is_active(name)) {
        apply_configuration(name, entry);
        return *this;
    }

    impl_->components.queue_configuration(name, std::move(entry));
    impl_->logger->debug("queued configuration for component {}", name);
    return *this;
}

container& container::add(provider& p) {
    std::lock_guard lock(impl_->mutex);
    p.register_components(*this);
    return *this;
}

// ---------------------------------------------------------------
// Queries
// ---------------------------------------------------------------

bool container::has(std::string_view name) const {
    std::lock_guard lock(impl_->mutex);
    return impl_->components.exists(name);
}

bool container::is_active(std::string_view name) const {
    std::lock_guard lock(impl_->mutex);
    return impl_->components.is_active(name);
}

bool container::is_initialized(std::string_view name) const {
    std::lock_guard lock(impl_->mutex);
    return impl_->components.is_initialized(name);
}

std::vector<std::string> container::names() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->components.names();
}

type_catalog& container::types() noexcept {
    return impl_->catalog;
}

const container_options& container::options() const noexcept {
    return impl_->options;
}

// ---------------------------------------------------------------
// get / activation
// ---------------------------------------------------------------

value container::get(std::string_view name) {
    std::lock_guard lock(impl_->mutex);
    const auto* rec = impl_->components.find(name);
    if (rec && rec->stored.has_value()) {
        return *rec->stored;
    }
    if (!rec || !rec->factory) {
        throw not_found(name);
    }
    return activate(name);
}

value container::activate(std::string_view name) {
    auto& impl = *impl_;

    if (impl.options.detect_cycles) {
        auto it = std::find(impl.activating.begin(), impl.activating.end(), name);
        if (it != impl.activating.end()) {
            std::vector<std::string> cycle(it, impl.activating.end());
            cycle.emplace_back(name);
            throw cyclic_dependency(cycle);
        }
    }

    // Copies: the factory may register other names while it runs.
    const auto* rec = impl.components.find(name);
    callable producer = rec->factory;
    parameter_map map = rec->factory_map;
    const auto registration_loc = rec->registration_location;

    activation_frame frame(impl.activating, name);
    std::vector<configuration_entry> pending;

    auto rollback = [&] {
        impl.components.erase_value(name);
        impl.components.restore_configurations(name, std::move(pending));
        impl.logger->warn("activation of component {} failed; component left inactive", name);
    };

    try {
        impl.logger->debug("activating component {}", name);
        impl.components.put_value(name, impl.args.invoke(producer, map));

        pending = impl.components.drain_configurations(name);
        for (const auto& entry : pending) {
            apply_configuration(name, entry);
        }

        impl.components.mark_initialized(name);
    } catch (di_error& e) {
        // Caught by non-const reference so the chain can be appended
        // before rethrowing.
        rollback();
        e.append_resolution_context(std::string(name));
        if (e.diagnostic_detail().empty()) {
            if (const auto* r = impl.components.find(name)) {
                auto trace = internal::format_registration_trace(name, *r);
                if (!trace.empty()) e.set_diagnostic_detail(trace);
            }
        }
        throw;
    } catch (const std::exception& e) {
        rollback();
        auto ex = activation_error(name, e, registration_loc);
        if (const auto* r = impl.components.find(name)) {
            ex.set_diagnostic_detail(internal::format_registration_trace(name, *r));
        }
        throw ex;
    } catch (...) {
        rollback();
        throw;
    }

    impl.logger->debug("component {} is active", name);
    return *impl.components.find(name)->stored;
}

void container::apply_configuration(std::string_view name, const configuration_entry& entry) {
    const auto& params = entry.fn.parameters();
    parameter_map map = entry.map;
    if (!params.empty()) {
        map.set(params.front().name, *impl_->components.find(name)->stored);
    }

    value replacement = impl_->args.invoke(entry.fn, map);
    if (replacement.has_value()) {
        impl_->components.put_value(name, std::move(replacement));
    }
    impl_->logger->debug("applied configuration to component {}", name);
}

// ---------------------------------------------------------------
// call / create / ref
// ---------------------------------------------------------------

value container::call(const callable& fn, const parameter_map& map) {
    std::lock_guard lock(impl_->mutex);
    return impl_->args.invoke(fn, map);
}

value container::create(std::string_view type_name, const parameter_map& map) {
    std::lock_guard lock(impl_->mutex);
    const auto* entry = impl_->catalog.find(type_name);
    if (!entry) {
        throw invalid_argument("unable to create component: " + std::string(type_name));
    }
    if (!entry->instantiable) {
        throw invalid_argument("unable to create instance of abstract type: "
                               + std::string(type_name));
    }
    return impl_->args.invoke(entry->constructor, map);
}

value container::ref(std::string_view name) {
    return value(std::make_shared<boxed_reference>(*this, std::string(name)));
}

value container::defer(callable fn, parameter_map map) {
    return value(std::make_shared<boxed_callback>(
        [this, fn = std::move(fn), map = std::move(map)]() { return call(fn, map); }));
}

} // namespace dicon
