#pragma once

// Internal helper for stacktrace capture and formatting.
// This header is NOT installed — it is only used by the library's .cpp files.

#include "dicon/registry.hpp"

#include <any>
#include <string>
#include <string_view>
#include <sstream>

#ifdef DICON_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace dicon::internal {

// capture_stacktrace() is declared in registry.hpp (public header)
// and implemented in stacktrace_capture.cpp.

/// Format a stacktrace stored in a std::any into a human-readable string.
/// Returns an empty string if the any is empty or stacktrace support is
/// disabled.
inline std::string format_stacktrace(const std::any& st) {
#ifdef DICON_HAS_STACKTRACE
    if (const auto* trace = std::any_cast<boost::stacktrace::stacktrace>(&st)) {
        if (trace->size() > 0) {
            std::ostringstream oss;
            oss << *trace;
            return oss.str();
        }
    }
#else
    (void)st;
#endif
    return {};
}

/// Format one component's registration trace for diagnostic output.
/// Returns a block like:
///   "Registration stacktrace for mailer:\n  #0 ...\n"
/// or an empty string if no stacktrace is available.
inline std::string format_registration_trace(std::string_view name,
                                             const component_record& rec) {
    std::string trace = format_stacktrace(rec.registration_stacktrace);
    if (trace.empty()) return {};
    return "Registration stacktrace for " + std::string(name) + ":\n" + trace;
}

} // namespace dicon::internal
