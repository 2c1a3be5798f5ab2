#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

namespace respool {

    /**
     * @brief What a pool does when release() is handed a lease it does not
     * track (already released, empty, or owned by another pool).
     */
    enum class ViolationPolicy : std::uint8_t {
        Strict,  /**< Log and throw ContractViolation. */
        Lenient  /**< Log and return DoubleReleaseOrUnknownHandle. */
    };

#ifdef NDEBUG
    inline constexpr ViolationPolicy default_violation_policy =
        ViolationPolicy::Lenient;
#else
    inline constexpr ViolationPolicy default_violation_policy =
        ViolationPolicy::Strict;
#endif

    /// @brief Wait bound for acquire; std::nullopt blocks indefinitely.
    using Timeout = std::optional<std::chrono::milliseconds>;

    /**
     * @brief Configuration for a resource pool.
     */
    struct PoolConfiguration {
        /** @brief Name used in log lines. */
        std::string name{"pool"};

        /** @brief Maximum number of simultaneously live resources. Required. */
        std::size_t max_size{0};

        /** @brief Wait bound used when acquire() is called without one. */
        Timeout acquire_timeout_default{};

        /**
         * @brief Whether returned resources are health-checked before reuse.
         * Unset means "if the factory supports validation".
         */
        std::optional<bool> validate_on_release{};

        /** @brief Idle count that shrink_idle() and reap_idle() keep. */
        std::size_t idle_target{0};

        /** @brief Idle age after which reap_idle() evicts. Zero disables. */
        std::chrono::milliseconds idle_ttl{0};

        /** @brief Handling of release contract violations. */
        ViolationPolicy violation_policy{default_violation_policy};

        /** @brief Logger for pool events; null selects default_logger(). */
        std::shared_ptr<spdlog::logger> logger{};
    };

    /// @brief Throws std::invalid_argument if the configuration is unusable
    void validate_configuration(const PoolConfiguration& cfg);

    /// @brief Parse "strict" or "lenient" (case-insensitive)
    std::optional<ViolationPolicy> parse_violation_policy(
        std::string_view text);

    const char* to_string(ViolationPolicy policy) noexcept;

}  // namespace respool
