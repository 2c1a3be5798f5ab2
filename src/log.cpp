#include "respool/log.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace respool {

    std::shared_ptr<spdlog::logger> default_logger() {
        static std::mutex mu;
        std::lock_guard<std::mutex> lk(mu);

        if (auto existing = spdlog::get(default_logger_name)) return existing;
        return spdlog::stderr_color_mt(default_logger_name);
    }

}  // namespace respool
