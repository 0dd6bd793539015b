#pragma once

#include "export.hpp"
#include "parameter.hpp"
#include "value.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace spdlog {
class logger;
} // namespace spdlog

namespace dicon {

class callable;
class component_lookup;

/// Turns a parameter list plus overrides into a positional argument list.
///
/// For each parameter, in declaration order, the first match wins:
///   1. named override
///   2. positional override
///   3. component registered under the declared type name
///   4. component registered under the parameter name
///   5. the default value of an optional parameter
/// and otherwise resolution_error.  A boxed value selected by any of these
/// is unboxed exactly once before it is placed.
class DICON_EXPORT resolver {
public:
    /// A null logger selects spdlog's default logger.
    explicit resolver(component_lookup& lookup,
                      std::shared_ptr<spdlog::logger> logger = nullptr);

    std::vector<value> resolve(const std::vector<parameter>& params,
                               const parameter_map& map,
                               std::string_view function_location) const;

    /// Resolve the callable's parameters and invoke it.
    value invoke(const callable& fn, const parameter_map& map) const;

private:
    component_lookup* lookup_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace dicon
