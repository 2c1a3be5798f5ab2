#pragma once
#include <exception>
#include <stdexcept>
#include <string>

namespace respool {
    /**
     * @brief Represents an error reported by a pool operation.
     */
    struct Error {
        /** @brief Enumeration of error codes. */
        enum class Code {
            CreationFailed,   /**< The factory failed to build a resource. */
            PoolExhausted,    /**< No slot became free within the bound. */
            DoubleReleaseOrUnknownHandle, /**< Lease not checked out here. */
            ValidationFailed, /**< The factory's health check threw. */
            ResetFailed,      /**< The factory's reset threw. */
            Cancelled,        /**< The waiting caller gave up. */
            Shutdown,         /**< The pool has been shut down. */
        };

        /** @brief The error code. */
        Code code;
        /** @brief A descriptive error message. */
        std::string message;
        /** @brief Exception raised by user code, if any. */
        std::exception_ptr cause{};
    };

    /// @brief Convert an error code to string for logging or diagnostics
    const char* to_string(Error::Code code) noexcept;

    /// @brief Best-effort description of a captured exception
    std::string describe(std::exception_ptr ep);

    /**
     * @brief Thrown on release contract violations when the pool runs with
     * ViolationPolicy::Strict.
     */
    class ContractViolation : public std::logic_error {
       public:
        using std::logic_error::logic_error;
    };
}  // namespace respool
