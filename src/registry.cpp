#include "dicon/registry.hpp"
#include "dicon/exceptions.hpp"

#include <functional>
#include <iterator>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace dicon {

// ---------------------------------------------------------------
// Impl
// ---------------------------------------------------------------

struct registry::Impl {
    // One record per name; records are never removed, only emptied.
    std::map<std::string, component_record, std::less<>> records;

    component_record& slot(std::string_view name) {
        auto it = records.find(name);
        if (it == records.end()) {
            it = records.emplace(std::string(name), component_record{}).first;
        }
        return it->second;
    }
};

// ---------------------------------------------------------------
// Constructors / Destructor / Move
// ---------------------------------------------------------------

registry::registry()
    : impl_(std::make_unique<Impl>())
{}

registry::~registry() = default;

registry::registry(registry&&) noexcept = default;
registry& registry::operator=(registry&&) noexcept = default;

// ---------------------------------------------------------------
// Queries
// ---------------------------------------------------------------

const component_record* registry::find(std::string_view name) const {
    auto it = impl_->records.find(name);
    if (it == impl_->records.end()) return nullptr;
    return &it->second;
}

component_record* registry::find_mutable(std::string_view name) {
    auto it = impl_->records.find(name);
    if (it == impl_->records.end()) return nullptr;
    return &it->second;
}

bool registry::exists(std::string_view name) const {
    const auto* rec = find(name);
    return rec && (rec->stored.has_value() || static_cast<bool>(rec->factory));
}

bool registry::is_active(std::string_view name) const {
    const auto* rec = find(name);
    return rec && rec->stored.has_value();
}

bool registry::is_initialized(std::string_view name) const {
    const auto* rec = find(name);
    return rec && rec->initialized;
}

std::vector<std::string> registry::names() const {
    std::vector<std::string> result;
    for (const auto& [name, rec] : impl_->records) {
        if (rec.stored.has_value() || rec.factory) result.push_back(name);
    }
    return result;
}

// ---------------------------------------------------------------
// Mutation
// ---------------------------------------------------------------

void registry::put_value(std::string_view name, value v, std::source_location loc) {
    auto& rec = impl_->slot(name);
    rec.stored = std::move(v);
    if (!rec.factory) rec.registration_location = loc;
}

void registry::put_factory(std::string_view name, callable factory, parameter_map map,
                           std::source_location loc, std::any stacktrace) {
    if (!factory) {
        throw invalid_argument("Component factory cannot be empty: " + std::string(name), loc);
    }
    auto& rec = impl_->slot(name);
    if (rec.initialized) {
        throw lifecycle_error(name, "attempted re-registration of active component", loc);
    }
    rec.factory = std::move(factory);
    rec.factory_map = std::move(map);
    rec.stored.reset();
    rec.registration_location = loc;
    rec.registration_stacktrace = std::move(stacktrace);
}

void registry::erase_value(std::string_view name) {
    auto* rec = find_mutable(name);
    if (rec && !rec->initialized) rec->stored.reset();
}

void registry::mark_initialized(std::string_view name) {
    impl_->slot(name).initialized = true;
}

void registry::queue_configuration(std::string_view name, configuration_entry entry) {
    if (!exists(name)) {
        throw not_found(name);
    }
    find_mutable(name)->pending.push_back(std::move(entry));
}

std::vector<configuration_entry> registry::drain_configurations(std::string_view name) {
    auto* rec = find_mutable(name);
    if (!rec) return {};
    return std::exchange(rec->pending, {});
}

void registry::restore_configurations(std::string_view name,
                                      std::vector<configuration_entry> entries) {
    if (entries.empty()) return;
    auto& rec = impl_->slot(name);
    entries.insert(entries.end(),
                   std::make_move_iterator(rec.pending.begin()),
                   std::make_move_iterator(rec.pending.end()));
    rec.pending = std::move(entries);
}

} // namespace dicon
