#pragma once
/**
 * @file log.hpp
 * @brief Process-wide spdlog logger for the reconciliation core.
 */

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace negsync::obs {

    /// Shared "negsync" logger (stderr, colored). Created on first use.
    std::shared_ptr<spdlog::logger> logger();

    /**
     * @brief Set the logger level by name ("trace", "debug", "info", "warn", "error", "off").
     * @return false if the name is not a known level (level left unchanged).
     */
    bool set_log_level(std::string_view level);

} // namespace negsync::obs
