#pragma once

#include "export.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <source_location>
#include <typeindex>
#include <vector>

namespace dicon {

namespace internal {
/// Demangle a type_index to human-readable name (GCC/Clang ABI-based).
DICON_EXPORT std::string demangle(std::type_index type);
} // namespace internal

class DICON_EXPORT di_error : public std::runtime_error {
public:
    explicit di_error(const std::string& message,
                      std::source_location loc = std::source_location::current());

    const std::source_location& location() const noexcept { return location_; }

    /// Set extended diagnostic detail (e.g. registration stacktrace).
    void set_diagnostic_detail(std::string detail);

    /// Get extended diagnostic detail (empty if none).
    const std::string& diagnostic_detail() const noexcept { return diagnostic_detail_; }

    /// Return what() plus diagnostic detail (if present), separated by newline.
    std::string full_diagnostic() const;

    /// Append resolution context to this exception.  When activation of a
    /// component fails, each enclosing activation appends its component
    /// name so that the final what() message shows the full chain, e.g.:
    ///   "... (while resolving mailer -> user_service)"
    /// May be called multiple times for nested activations.
    void append_resolution_context(const std::string& component_name);

    /// Override to append resolution context (if any) to the base message.
    const char* what() const noexcept override;

private:
    std::source_location location_;
    std::string diagnostic_detail_;
    std::string resolution_context_;
    mutable std::string cached_what_;

    static std::string format_message(const std::string& msg,
                                      const std::source_location& loc);
};

/// A name holds neither a value nor a factory.
class DICON_EXPORT not_found : public di_error {
public:
    explicit not_found(std::string_view name,
                       std::source_location loc = std::source_location::current());

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

/// Registration or direct injection against an initialized component.
class DICON_EXPORT lifecycle_error : public di_error {
public:
    lifecycle_error(std::string_view name, std::string_view reason,
                    std::source_location loc = std::source_location::current());

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

/// A parameter could not be satisfied by override, lookup or default.
class DICON_EXPORT resolution_error : public di_error {
public:
    resolution_error(std::string_view parameter_name,
                     std::string_view type_name,
                     std::string_view function_location,
                     std::source_location loc = std::source_location::current());

    const std::string& parameter_name() const noexcept { return parameter_name_; }
    const std::string& type_name() const noexcept { return type_name_; }
    const std::string& function_location() const noexcept { return function_location_; }

private:
    std::string parameter_name_;
    std::string type_name_;
    std::string function_location_;
};

/// Malformed callables, unknown or non-instantiable types.
class DICON_EXPORT invalid_argument : public di_error {
public:
    explicit invalid_argument(const std::string& message,
                              std::source_location loc = std::source_location::current());
};

class DICON_EXPORT cyclic_dependency : public di_error {
public:
    explicit cyclic_dependency(const std::vector<std::string>& cycle,
                               std::source_location loc = std::source_location::current());

    const std::vector<std::string>& cycle() const noexcept { return cycle_; }

private:
    std::vector<std::string> cycle_;
    static std::string build_message(const std::vector<std::string>& cycle);
};

/// A factory or configuration function threw something that is not a
/// di_error.
class DICON_EXPORT activation_error : public di_error {
public:
    activation_error(std::string_view name, const std::exception& inner,
                     std::source_location registration_loc);

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

class DICON_EXPORT bad_value_cast : public di_error {
public:
    bad_value_cast(std::type_index held, std::type_index requested,
                   std::source_location loc = std::source_location::current());

    std::type_index held_type() const noexcept { return held_; }
    std::type_index requested_type() const noexcept { return requested_; }

private:
    std::type_index held_;
    std::type_index requested_;
};

} // namespace dicon
