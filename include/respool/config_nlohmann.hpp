#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

#include "respool/config.hpp"

namespace respool {

    // Keys: name, max_size, acquire_timeout_ms, validate_on_release,
    // idle_target, idle_ttl_ms, violation_policy. Only max_size is required;
    // a null acquire_timeout_ms waits forever, a null validate_on_release
    // follows the factory.

    namespace detail {
        inline std::size_t count_at(const nlohmann::json& j, const char* key) {
            const auto v = j.at(key).get<std::int64_t>();
            if (v < 0) {
                throw std::invalid_argument(std::string(key) +
                                            " must not be negative");
            }
            return static_cast<std::size_t>(v);
        }
    }  // namespace detail

    inline void from_json(const nlohmann::json& j, PoolConfiguration& cfg) {
        if (j.contains("name")) j.at("name").get_to(cfg.name);
        cfg.max_size = detail::count_at(j, "max_size");

        if (auto it = j.find("acquire_timeout_ms"); it != j.end()) {
            if (it->is_null()) {
                cfg.acquire_timeout_default.reset();
            } else {
                cfg.acquire_timeout_default =
                    std::chrono::milliseconds(it->get<std::int64_t>());
            }
        }

        if (auto it = j.find("validate_on_release"); it != j.end()) {
            if (it->is_null()) {
                cfg.validate_on_release.reset();
            } else {
                cfg.validate_on_release = it->get<bool>();
            }
        }

        if (j.contains("idle_target")) {
            cfg.idle_target = detail::count_at(j, "idle_target");
        }
        if (j.contains("idle_ttl_ms")) {
            cfg.idle_ttl =
                std::chrono::milliseconds(j.at("idle_ttl_ms").get<std::int64_t>());
        }

        if (j.contains("violation_policy")) {
            const auto text = j.at("violation_policy").get<std::string>();
            auto policy = parse_violation_policy(text);
            if (!policy) {
                throw std::invalid_argument("unknown violation_policy: " + text);
            }
            cfg.violation_policy = *policy;
        }
    }

    inline void to_json(nlohmann::json& j, const PoolConfiguration& cfg) {
        j = nlohmann::json{
            {"name", cfg.name},
            {"max_size", cfg.max_size},
            {"idle_target", cfg.idle_target},
            {"idle_ttl_ms", cfg.idle_ttl.count()},
            {"violation_policy", to_string(cfg.violation_policy)},
        };
        if (cfg.acquire_timeout_default) {
            j["acquire_timeout_ms"] = cfg.acquire_timeout_default->count();
        } else {
            j["acquire_timeout_ms"] = nullptr;
        }
        if (cfg.validate_on_release) {
            j["validate_on_release"] = *cfg.validate_on_release;
        } else {
            j["validate_on_release"] = nullptr;
        }
    }

    /// @brief Parse and validate a pool configuration
    /// @throws nlohmann::json::exception on malformed input,
    /// std::invalid_argument on unusable values
    inline PoolConfiguration load_configuration(const nlohmann::json& j) {
        PoolConfiguration cfg = j.get<PoolConfiguration>();
        validate_configuration(cfg);
        return cfg;
    }

}  // namespace respool
