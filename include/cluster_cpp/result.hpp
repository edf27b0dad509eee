#pragma once

#include <cassert>
#include <type_traits>
#include <utility>
#include <variant>

#include "error.hpp"

namespace cluster_cpp {

    /// @brief Result<T> holds either a value of type T or an Error.
    /// @tparam T The type of the successful value.
    /// @note Same shape as std::expected<T, Error> in C++23.
    template <typename T>
    class [[nodiscard]] Result {
       public:
        /// @brief Create a successful Result, constructing T in place.
        /// @tparam Args Types of the arguments forwarded to T's constructor.
        /// @param args Arguments forwarded to T's constructor.
        /// @return A Result holding the new T.
        /// @note Only participates in overload resolution when T is
        /// constructible from Args.
        template <typename... Args, typename = std::enable_if_t<
                                        std::is_constructible_v<T, Args&&...>>>
        static Result ok(Args&&... args) {
            return Result(std::in_place_type<T>, std::forward<Args>(args)...);
        }

        /// @brief Create an error Result holding a copy of `error`.
        /// @param error The Error to store.
        /// @return A Result holding the Error.
        static Result err(const Error& error) {
            return Result(std::in_place_type<Error>, error);
        }

        /// @brief Create an error Result, moving `error` in.
        /// @param error The Error to store.
        /// @return A Result holding the Error.
        static Result err(Error&& error) {
            return Result(std::in_place_type<Error>, std::move(error));
        }

        /// @brief Shorthand for err(Error{code, message}).
        /// @param code What went wrong.
        /// @param message Human readable detail, used in logs.
        static Result err(Error::Code code, std::string message) {
            return Result(std::in_place_type<Error>,
                          Error{code, std::move(message)});
        }

        /// @brief Allow `if (result) { ... }` to mean "if success".
        explicit operator bool() const noexcept { return has_value(); }

        /// @brief True if this Result holds a T.
        bool has_value() const noexcept {
            return std::holds_alternative<T>(m_state);
        }

        /// @brief True if this Result holds an Error.
        bool has_error() const noexcept {
            return std::holds_alternative<Error>(m_state);
        }

        /// @brief The stored value (const lvalue overload).
        /// @note Precondition: has_value(). Checked by assert in debug builds.
        const T& value() const& {
            const T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return *p;
        }

        /// @brief The stored value (mutable lvalue overload).
        /// @return A mutable reference to the stored T.
        T& value() & {
            T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return *p;
        }

        /// @brief The stored value (rvalue overload), ready to be moved out.
        T&& value() && {
            T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return std::move(*p);
        }

        /// @brief Pointer to the stored value, or nullptr (const).
        [[nodiscard]] const T* value_ptr() const noexcept {
            return std::get_if<T>(&m_state);
        }

        /// @brief Pointer to the stored value, or nullptr (mutable).
        [[nodiscard]] T* value_ptr() noexcept {
            return std::get_if<T>(&m_state);
        }

        /// @brief The stored error (const lvalue overload).
        /// @note Precondition: has_error(). Checked by assert in debug builds.
        const Error& error() const& {
            const Error* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return *p;
        }

        /// @brief The stored error (mutable lvalue overload).
        Error& error() & {
            Error* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return *p;
        }

        /// @brief The stored error (rvalue overload), so it can be moved out.
        Error&& error() && {
            Error* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return std::move(*p);
        }

        /// @brief Pointer to the stored error, or nullptr (const).
        [[nodiscard]] const Error* error_ptr() const noexcept {
            return std::get_if<Error>(&m_state);
        }

        /// @brief Pointer to the stored error, or nullptr (mutable).
        [[nodiscard]] Error* error_ptr() noexcept {
            return std::get_if<Error>(&m_state);
        }

        /// @brief Error code shortcut, only meaningful when has_error().
        Error::Code code() const noexcept {
            const Error* p = error_ptr();
            return p ? p->code : Error::Code::Unknown;
        }

        /// @brief Eager fallback: the stored value or `fallback`.
        T value_or(T fallback) const& {
            return has_value() ? value() : std::move(fallback);
        }

        /// @brief Rvalue overload of value_or(); moves the value out.
        T value_or(T fallback) && {
            return has_value() ? std::move(*this).value() : std::move(fallback);
        }

        /// @brief The stored error, or `fallback` when this holds a value.
        ///
        /// Handy on logging paths that want a reference without branching.
        const Error& error_or(const Error& fallback) const noexcept {
            return has_error() ? *error_ptr() : fallback;
        }

        /// @brief Re-wrap the error of this Result into a Result<U>.
        /// @note Precondition: has_error().
        template <typename U>
        Result<U> forward_error() const& {
            return Result<U>::err(error());
        }

       private:
        /// @brief Construct the value alternative in place.
        template <typename... Args>
        explicit Result(std::in_place_type_t<T>, Args&&... args)
            : m_state(std::in_place_type<T>, std::forward<Args>(args)...) {}

        /// @brief Construct the error alternative by copy.
        explicit Result(std::in_place_type_t<Error>, const Error& error)
            : m_state(std::in_place_type<Error>, error) {}

        /// @brief Construct the error alternative by move.
        explicit Result(std::in_place_type_t<Error>, Error&& error)
            : m_state(std::in_place_type<Error>, std::move(error)) {}

        /// @brief Exactly one of {T, Error} is active at any time.
        std::variant<T, Error> m_state;
    };

    /// @brief Result of an operation that produces no value.
    using Status = Result<std::monostate>;

}  // namespace cluster_cpp
