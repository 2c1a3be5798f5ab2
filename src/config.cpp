#include "respool/config.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

namespace respool {

    void validate_configuration(const PoolConfiguration& cfg) {
        if (cfg.max_size == 0) {
            throw std::invalid_argument("pool '" + cfg.name +
                                        "': max_size must be positive");
        }
        if (cfg.idle_target > cfg.max_size) {
            throw std::invalid_argument(
                "pool '" + cfg.name + "': idle_target (" +
                std::to_string(cfg.idle_target) + ") exceeds max_size (" +
                std::to_string(cfg.max_size) + ")");
        }
        if (cfg.acquire_timeout_default &&
            cfg.acquire_timeout_default->count() < 0) {
            throw std::invalid_argument(
                "pool '" + cfg.name +
                "': acquire_timeout_default must not be negative");
        }
        if (cfg.idle_ttl.count() < 0) {
            throw std::invalid_argument("pool '" + cfg.name +
                                        "': idle_ttl must not be negative");
        }
    }

    std::optional<ViolationPolicy> parse_violation_policy(
        std::string_view text) {
        std::string lowered(text);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        if (lowered == "strict") return ViolationPolicy::Strict;
        if (lowered == "lenient") return ViolationPolicy::Lenient;
        return std::nullopt;
    }

    const char* to_string(ViolationPolicy policy) noexcept {
        switch (policy) {
            case ViolationPolicy::Strict:
                return "strict";
            case ViolationPolicy::Lenient:
                return "lenient";
        }
        return "unknown";
    }

}  // namespace respool
