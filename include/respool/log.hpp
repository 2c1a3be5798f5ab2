#pragma once

#include <memory>

#include <spdlog/logger.h>

namespace respool {

    /// @brief Name of the logger shared by pools that were not given one.
    inline constexpr const char* default_logger_name = "respool";

    /// @brief The shared "respool" logger (stderr), created on first use.
    std::shared_ptr<spdlog::logger> default_logger();

}  // namespace respool
