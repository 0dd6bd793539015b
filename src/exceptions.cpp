#include "dicon/exceptions.hpp"

#include <cstdlib>
#include <typeindex>
#include <string>
#include <memory>

#if defined(__GNUC__)
#include <cxxabi.h>
#endif

namespace dicon {

namespace internal {

std::string demangle(std::type_index type) {
#if defined(__GNUC__)
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled(
        abi::__cxa_demangle(type.name(), nullptr, nullptr, &status),
        &std::free);
    if (status == 0 && demangled) {
        return std::string(demangled.get());
    }
#endif
    return std::string(type.name());
}

} // namespace internal

std::string di_error::format_message(const std::string& msg,
                                     const std::source_location& loc) {
    return msg + " [at " + loc.file_name() + ":"
           + std::to_string(loc.line()) + "]";
}

di_error::di_error(const std::string& message, std::source_location loc)
    : std::runtime_error(format_message(message, loc))
    , location_(loc)
{}

void di_error::set_diagnostic_detail(std::string detail) {
    diagnostic_detail_ = std::move(detail);
}

void di_error::append_resolution_context(const std::string& component_name) {
    if (!resolution_context_.empty()) {
        resolution_context_ += " -> ";
    }
    resolution_context_ += component_name;
    cached_what_.clear();
}

const char* di_error::what() const noexcept {
    if (resolution_context_.empty()) {
        return std::runtime_error::what();
    }
    if (cached_what_.empty()) {
        try {
            cached_what_ = std::string(std::runtime_error::what())
                           + " (while resolving " + resolution_context_ + ")";
        } catch (const std::bad_alloc&) {
            return std::runtime_error::what();
        }
    }
    return cached_what_.c_str();
}

std::string di_error::full_diagnostic() const {
    if (diagnostic_detail_.empty()) {
        return what();
    }
    return std::string(what()) + "\n" + diagnostic_detail_;
}

not_found::not_found(std::string_view name, std::source_location loc)
    : di_error("Component not found: " + std::string(name), loc)
    , name_(name)
{}

lifecycle_error::lifecycle_error(std::string_view name, std::string_view reason,
                                 std::source_location loc)
    : di_error(std::string(reason) + ": " + std::string(name), loc)
    , name_(name)
{}

resolution_error::resolution_error(std::string_view parameter_name,
                                   std::string_view type_name,
                                   std::string_view function_location,
                                   std::source_location loc)
    : di_error([&]() {
          std::string msg = "Unable to resolve \"" + std::string(type_name)
                            + "\" for parameter: " + std::string(parameter_name);
          if (!function_location.empty())
              msg += " in " + std::string(function_location);
          return msg;
      }(), loc)
    , parameter_name_(parameter_name)
    , type_name_(type_name)
    , function_location_(function_location)
{}

invalid_argument::invalid_argument(const std::string& message,
                                   std::source_location loc)
    : di_error(message, loc)
{}

std::string cyclic_dependency::build_message(const std::vector<std::string>& cycle) {
    std::string msg = "Cyclic dependency detected: ";
    for (std::size_t i = 0; i < cycle.size(); ++i) {
        if (i > 0) msg += " -> ";
        msg += cycle[i];
    }
    return msg;
}

cyclic_dependency::cyclic_dependency(const std::vector<std::string>& cycle,
                                     std::source_location loc)
    : di_error(build_message(cycle), loc)
    , cycle_(cycle)
{}

activation_error::activation_error(std::string_view name,
                                   const std::exception& inner,
                                   std::source_location registration_loc)
    : di_error([&]() {
          std::string msg = "Failed to activate component " + std::string(name)
                            + ": " + inner.what();
          if (registration_loc.file_name()[0]) {
              msg += " (registered at " + std::string(registration_loc.file_name())
                     + ":" + std::to_string(registration_loc.line()) + ")";
          }
          return msg;
      }(), registration_loc)
    , name_(name)
{}

bad_value_cast::bad_value_cast(std::type_index held, std::type_index requested,
                               std::source_location loc)
    : di_error([&]() {
          if (held == std::type_index(typeid(void))) {
              return "Cannot convert null value to " + internal::demangle(requested);
          }
          return "Value of type " + internal::demangle(held)
                 + " is not convertible to " + internal::demangle(requested);
      }(), loc)
    , held_(held)
    , requested_(requested)
{}

} // namespace dicon
