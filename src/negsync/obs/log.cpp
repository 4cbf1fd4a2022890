/**
 * @file log.cpp
 * @brief Lazy creation of the shared logger.
 */
#include "negsync/obs/log.hpp"

#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

#include "negsync/config/constants.hpp"

namespace negsync::obs {

    std::shared_ptr<spdlog::logger> logger() {
        static const std::shared_ptr<spdlog::logger> instance = [] {
            const std::string name(config::constants::LOGGER_NAME);
            if (auto existing = spdlog::get(name)) return existing;
            auto lg = spdlog::stderr_color_mt(name);
            lg->set_level(spdlog::level::from_str(std::string(config::constants::LOG_LEVEL_DEFAULT)));
            return lg;
        }();
        return instance;
    }

    bool set_log_level(std::string_view level) {
        const std::string name(level);
        const auto lvl = spdlog::level::from_str(name);
        // from_str() maps unknown names to "off"; only accept "off" when asked for.
        if (lvl == spdlog::level::off && name != "off") return false;
        logger()->set_level(lvl);
        return true;
    }

} // namespace negsync::obs
