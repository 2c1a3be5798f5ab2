#pragma once

#include <cassert>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include "error.hpp"

namespace respool {

    /// @brief Result<T> holds either a value of type T or an Error.
    /// @tparam T The type of the successful value, e.g. a Pool<R>::Lease.
    /// @note Similar to std::expected<T, Error> in C++23. Pool operations
    /// report backpressure, creation failures and contract violations through
    /// this type instead of throwing.
    template <typename T>
    class [[nodiscard]] Result {
       public:
        /// @brief Create a successful Result by constructing T in place.
        /// @tparam Args The types of the arguments to construct T.
        /// @param args The arguments forwarded to T's constructor.
        /// @return A Result holding the constructed T.
        template <typename... Args, typename = std::enable_if_t<
                                        std::is_constructible_v<T, Args&&...>>>
        static Result ok(Args&&... args) {
            return Result(std::in_place_type<T>, std::forward<Args>(args)...);
        }

        /// @brief Create a failed Result.
        /// @param error The Error to store, copied.
        /// @return A Result holding error.
        static Result err(const Error& error) {
            return Result(std::in_place_type<Error>, error);
        }

        /// @brief Create a failed Result.
        /// @param error The Error to store, moved.
        /// @return A Result holding error.
        static Result err(Error&& error) {
            return Result(std::in_place_type<Error>, std::move(error));
        }

        // State inspection

        /// @brief Allow `if (auto lease = pool.acquire()) { ... }`.
        explicit operator bool() const noexcept { return has_value(); }

        /// @return Whether the active alternative is T.
        bool has_value() const noexcept {
            return std::holds_alternative<T>(m_state);
        }

        /// @return Whether the active alternative is Error.
        bool has_error() const noexcept {
            return std::holds_alternative<Error>(m_state);
        }

        // Value access

        /// @brief Get the stored value (const lvalue overload).
        /// @return Reference to the value; only valid when has_value().
        const T& value() const& {
            const T* p = value_ptr();
            // Debug builds catch misuse; release builds trust the caller.
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return *p;
        }

        /// @brief Get the stored value (mutable lvalue overload).
        /// @return Reference to the value; only valid when has_value().
        T& value() & {
            T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return *p;
        }

        /// @brief Move the value out, e.g. `std::move(r).value()` for a lease.
        /// @return Rvalue reference to the value; only valid when has_value().
        T&& value() && {
            T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return std::move(*p);
        }

        /// @return Pointer to the value, or nullptr when holding an Error.
        [[nodiscard]] const T* value_ptr() const noexcept {
            return std::get_if<T>(&m_state);
        }

        /// @return Pointer to the value, or nullptr when holding an Error.
        [[nodiscard]] T* value_ptr() noexcept {
            return std::get_if<T>(&m_state);
        }

        // Error access

        /// @brief Get the stored error (const lvalue overload).
        /// @return Reference to the Error; only valid when has_error().
        const Error& error() const& {
            const Error* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return *p;
        }

        /// @brief Get the stored error (mutable lvalue overload).
        /// @return Reference to the Error; only valid when has_error().
        Error& error() & {
            Error* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return *p;
        }

        /// @brief Move the error out.
        /// @return Rvalue reference to the Error; only valid when has_error().
        Error&& error() && {
            Error* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return std::move(*p);
        }

        /// @return Pointer to the Error, or nullptr when holding a value.
        [[nodiscard]] const Error* error_ptr() const noexcept {
            return std::get_if<Error>(&m_state);
        }

        /// @return Pointer to the Error, or nullptr when holding a value.
        [[nodiscard]] Error* error_ptr() noexcept {
            return std::get_if<Error>(&m_state);
        }

        // Fallbacks

        /// @brief Value if present, otherwise the result of make_fallback().
        /// @param make_fallback Invoked only when there is no value.
        /// @return A copy of the value or the fallback.
        template <typename F,
                  typename = std::enable_if_t<std::is_invocable_r_v<T, F&&>>>
        T value_or_else(F&& make_fallback) const& {
            return has_value() ? value() : std::forward<F>(make_fallback)();
        }

        /// @brief Rvalue overload of value_or_else; moves the value out.
        /// @param make_fallback Invoked only when there is no value.
        /// @return The moved value or the fallback.
        template <typename F,
                  typename = std::enable_if_t<std::is_invocable_r_v<T, F&&>>>
        T value_or_else(F&& make_fallback) && {
            return has_value() ? std::move(*this).value()
                               : std::forward<F>(make_fallback)();
        }

        /// @brief Eager form of value_or_else.
        /// @param fallback Returned when there is no value.
        /// @return A copy of the value or fallback.
        T value_or(T fallback) const& {
            return value_or_else([&] { return std::move(fallback); });
        }

        /// @brief Rvalue overload of value_or; moves the value out.
        /// @param fallback Returned when there is no value.
        /// @return The moved value or fallback.
        T value_or(T fallback) && {
            return std::move(*this).value_or_else(
                [&] { return std::move(fallback); });
        }

        /// @param fallback Returned when this Result holds a value.
        /// @return The stored Error, or fallback.
        const Error& error_or(const Error& fallback) const noexcept {
            return has_error() ? *error_ptr() : fallback;
        }

       private:
        template <typename... Args>
        explicit Result(std::in_place_type_t<T>, Args&&... args)
            : m_state(std::in_place_type<T>, std::forward<Args>(args)...) {}

        explicit Result(std::in_place_type_t<Error>, const Error& error)
            : m_state(std::in_place_type<Error>, error) {}

        explicit Result(std::in_place_type_t<Error>, Error&& error)
            : m_state(std::in_place_type<Error>, std::move(error)) {}

        /// @brief Storage: exactly one of {T, Error} is active at any time.
        std::variant<T, Error> m_state;
    };

    /// @brief Result for operations that only report success or an Error,
    /// such as Pool<R>::release().
    template <>
    class [[nodiscard]] Result<void> {
       public:
        /// @return A successful Result.
        static Result ok() noexcept { return Result(); }

        /// @param error The Error to store, copied.
        /// @return A Result holding error.
        static Result err(const Error& error) { return Result(error); }

        /// @param error The Error to store, moved.
        /// @return A Result holding error.
        static Result err(Error&& error) { return Result(std::move(error)); }

        /// @brief Allow `if (!pool.release(...)) { ... }`.
        explicit operator bool() const noexcept { return has_value(); }

        /// @return Whether the operation succeeded.
        bool has_value() const noexcept { return !m_error.has_value(); }

        /// @return Whether the operation failed.
        bool has_error() const noexcept { return m_error.has_value(); }

        /// @return Reference to the Error; only valid when has_error().
        const Error& error() const& {
            assert(m_error &&
                   "Result::error() called but this Result holds a value");
            return *m_error;
        }

        /// @return Rvalue reference to the Error; only valid when has_error().
        Error&& error() && {
            assert(m_error &&
                   "Result::error() called but this Result holds a value");
            return std::move(*m_error);
        }

        /// @return Pointer to the Error, or nullptr on success.
        [[nodiscard]] const Error* error_ptr() const noexcept {
            return m_error ? &*m_error : nullptr;
        }

        /// @param fallback Returned on success.
        /// @return The stored Error, or fallback.
        const Error& error_or(const Error& fallback) const noexcept {
            return m_error ? *m_error : fallback;
        }

       private:
        Result() = default;
        explicit Result(Error error) : m_error(std::move(error)) {}

        std::optional<Error> m_error;
    };

}  // namespace respool
