#include "dicon/registry.hpp"

#include <any>
#include <cstddef>

#ifdef DICON_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace dicon::internal {

namespace {

// Frames of capture_stacktrace() and container::register_factory().
constexpr std::size_t skipped_frames = 2;

// Registration sites are rarely deeper than this below main().
constexpr std::size_t max_frames = 32;

} // namespace

std::any capture_stacktrace() {
#ifdef DICON_HAS_STACKTRACE
    return std::any(boost::stacktrace::stacktrace(skipped_frames, max_frames));
#else
    return {};
#endif
}

} // namespace dicon::internal
