#pragma once

#include <cassert>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "error.hpp"

namespace httpool {

    /// @brief Result<T> holds either a value of type T or an Error.
    /// @tparam T The type of the successful value.
    /// @note Plays the part of std::expected<T, Error>; acquisitions, builds
    /// and URL parsing all report through it.
    template <typename T>
    class [[nodiscard]] Result {
       public:
        /// @brief Create a successful Result, constructing T in place.
        template <typename... Args, typename = std::enable_if_t<
                                        std::is_constructible_v<T, Args&&...>>>
        static Result ok(Args&&... args) {
            return Result(std::in_place_type<T>, std::forward<Args>(args)...);
        }

        /// @brief Create an error Result with the given Error.
        static Result err(const Error& error) {
            return Result(std::in_place_type<Error>, error);
        }

        /// @brief Create an error Result with the given Error.
        static Result err(Error&& error) {
            return Result(std::in_place_type<Error>, std::move(error));
        }

        /// @brief Create an error Result from a code and a message.
        static Result err(Error::Code code, std::string message) {
            return Result(std::in_place_type<Error>,
                          Error{code, std::move(message)});
        }

        /// @brief Allow `if (result) { ... }` to mean "if success".
        explicit operator bool() const noexcept { return has_value(); }

        bool has_value() const noexcept {
            return std::holds_alternative<T>(m_state);
        }

        bool has_error() const noexcept {
            return std::holds_alternative<Error>(m_state);
        }

        /// @brief Get the stored value. Asserts that a value is held.
        const T& value() const& {
            const T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return *p;
        }

        T& value() & {
            T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return *p;
        }

        T&& value() && {
            T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return std::move(*p);
        }

        [[nodiscard]] const T* value_ptr() const noexcept {
            return std::get_if<T>(&m_state);
        }

        [[nodiscard]] T* value_ptr() noexcept {
            return std::get_if<T>(&m_state);
        }

        /// @brief Get the stored error. Asserts that an error is held.
        const Error& error() const& {
            const Error* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return *p;
        }

        Error& error() & {
            Error* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return *p;
        }

        Error&& error() && {
            Error* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return std::move(*p);
        }

        [[nodiscard]] const Error* error_ptr() const noexcept {
            return std::get_if<Error>(&m_state);
        }

        [[nodiscard]] Error* error_ptr() noexcept {
            return std::get_if<Error>(&m_state);
        }

        /// @brief Stored value if present, otherwise the fallback.
        T value_or(T fallback) const& {
            return has_value() ? value() : std::move(fallback);
        }

        T value_or(T fallback) && {
            return has_value() ? std::move(*this).value()
                               : std::move(fallback);
        }

        /// @brief Error code if this Result holds an error, otherwise the
        /// fallback code.
        Error::Code code_or(Error::Code fallback) const noexcept {
            const Error* e = error_ptr();
            return e ? e->code : fallback;
        }

       private:
        template <typename... Args>
        explicit Result(std::in_place_type_t<T>, Args&&... args)
            : m_state(std::in_place_type<T>, std::forward<Args>(args)...) {}

        explicit Result(std::in_place_type_t<Error>, const Error& error)
            : m_state(std::in_place_type<Error>, error) {}

        explicit Result(std::in_place_type_t<Error>, Error&& error)
            : m_state(std::in_place_type<Error>, std::move(error)) {}

        /// @brief Exactly one of {T, Error} is active at any time.
        std::variant<T, Error> m_state;
    };

}  // namespace httpool
