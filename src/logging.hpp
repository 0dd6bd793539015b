#pragma once

// Internal logging helpers.  Not installed.

#include <spdlog/spdlog.h>

#include <memory>

namespace dicon::internal {

/// The given logger, or spdlog's default logger when none was supplied.
inline std::shared_ptr<spdlog::logger> select_logger(std::shared_ptr<spdlog::logger> logger) {
    if (logger) return logger;
    return spdlog::default_logger();
}

} // namespace dicon::internal
