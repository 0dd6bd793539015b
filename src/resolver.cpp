#include "dicon/resolver.hpp"
#include "dicon/callable.hpp"
#include "dicon/exceptions.hpp"
#include "dicon/interfaces.hpp"
#include "logging.hpp"

#include <string>
#include <utility>
#include <vector>

namespace dicon {

resolver::resolver(component_lookup& lookup, std::shared_ptr<spdlog::logger> logger)
    : lookup_(&lookup)
    , logger_(internal::select_logger(std::move(logger)))
{}

// ---------------------------------------------------------------
// resolve — the argument-resolution algorithm
// ---------------------------------------------------------------

std::vector<value> resolver::resolve(const std::vector<parameter>& params,
                                     const parameter_map& map,
                                     std::string_view function_location) const {
    std::vector<value> args;
    args.reserve(params.size());

    for (std::size_t index = 0; index < params.size(); ++index) {
        const auto& param = params[index];
        value selected;

        if (const value* named = map.find(std::string_view(param.name))) {
            selected = *named;
        } else if (const value* positional = map.find(index)) {
            selected = *positional;
        } else if (!param.type_name.empty() && lookup_->has(param.type_name)) {
            logger_->trace("parameter {} resolved by type {}", param.name, param.type_name);
            selected = lookup_->get(param.type_name);
        } else if (lookup_->has(param.name)) {
            logger_->trace("parameter {} resolved by name", param.name);
            selected = lookup_->get(param.name);
        } else if (param.is_optional) {
            // Each call gets its own copy of the declared default.
            selected = param.default_value.clone();
        } else {
            throw resolution_error(param.name, param.type_name, function_location);
        }

        if (selected.is_boxed()) {
            selected = selected.unbox();
        }

        args.push_back(std::move(selected));
    }

    return args;
}

value resolver::invoke(const callable& fn, const parameter_map& map) const {
    if (!fn) {
        throw invalid_argument("expected callable");
    }
    auto args = resolve(fn.parameters(), map, fn.location());
    return fn(args);
}

} // namespace dicon
