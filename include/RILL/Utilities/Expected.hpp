/// @file Expected.hpp
/// @brief `RILL::Utilities::Expected<T, E>`: a minimal value-or-error return type.
#pragma once

#include <RILL/Exceptions/Exception.hpp>

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace RILL::Utilities
{
    /// @brief Wrapper used to explicitly construct an error value for `Expected<T, E>`.
    ///
    /// @tparam E Error type.
    template <class E>
    class Unexpected
    {
    public:
        /// @brief Error type.
        using ErrorType = E;

        /// @brief Constructs by copying an error.
        constexpr explicit Unexpected(const E& error) noexcept(std::is_nothrow_copy_constructible_v<E>)
            : m_error {error}
        {
        }

        /// @brief Constructs by moving an error.
        constexpr explicit Unexpected(E&& error) noexcept(std::is_nothrow_move_constructible_v<E>)
            : m_error {std::move(error)}
        {
        }

        [[nodiscard]] constexpr E&       Error() & noexcept { return m_error; }
        [[nodiscard]] constexpr const E& Error() const& noexcept { return m_error; }
        [[nodiscard]] constexpr E&&      Error() && noexcept { return std::move(m_error); }

    private:
        E m_error;
    };

    namespace detail
    {
        [[noreturn]] inline void ExpectedFailNoValue()
        {
            throw Exceptions::Exception("RILL::Utilities::Expected::Value called when holding error");
        }

        [[noreturn]] inline void ExpectedFailNoError()
        {
            throw Exceptions::Exception("RILL::Utilities::Expected::Error called when holding value");
        }
    }// namespace detail

    /// @brief Inline "value or error" return type.
    ///
    /// The `...Unsafe` accessors do not check which alternative is held; `Value` and `Error`
    /// throw `Exceptions::Exception` when called on the wrong alternative.
    ///
    /// @tparam T Value type.
    /// @tparam E Error type.
    template <class T, class E>
    class [[nodiscard]] Expected
    {
        static_assert(!std::is_reference_v<T>, "Expected<T&,...> is not supported.");
        static_assert(!std::is_reference_v<E>, "Expected<...,E&> is not supported.");
        static_assert(!std::is_same_v<T, E>, "Expected<T, T> is ambiguous.");

    public:
        using ValueType = T;
        using ErrorType = E;

        constexpr explicit Expected(const T& value)
            : m_storage {std::in_place_index<0>, value}
        {
        }

        constexpr explicit Expected(T&& value)
            : m_storage {std::in_place_index<0>, std::move(value)}
        {
        }

        constexpr explicit Expected(Unexpected<E>&& unexpected)
            : m_storage {std::in_place_index<1>, std::move(unexpected).Error()}
        {
        }

        [[nodiscard]] constexpr bool HasValue() const noexcept { return m_storage.index() == 0; }
        constexpr explicit operator bool() const noexcept { return HasValue(); }

        [[nodiscard]] constexpr T&       ValueUnsafe() & noexcept { return *std::get_if<0>(&m_storage); }
        [[nodiscard]] constexpr const T& ValueUnsafe() const& noexcept { return *std::get_if<0>(&m_storage); }
        [[nodiscard]] constexpr T&&      ValueUnsafe() && noexcept { return std::move(*std::get_if<0>(&m_storage)); }

        [[nodiscard]] constexpr E&       ErrorUnsafe() & noexcept { return *std::get_if<1>(&m_storage); }
        [[nodiscard]] constexpr const E& ErrorUnsafe() const& noexcept { return *std::get_if<1>(&m_storage); }
        [[nodiscard]] constexpr E&&      ErrorUnsafe() && noexcept { return std::move(*std::get_if<1>(&m_storage)); }

        [[nodiscard]] constexpr const T& Value() const&
        {
            if (!HasValue())
                detail::ExpectedFailNoValue();
            return ValueUnsafe();
        }

        [[nodiscard]] constexpr T&& Value() &&
        {
            if (!HasValue())
                detail::ExpectedFailNoValue();
            return std::move(*this).ValueUnsafe();
        }

        [[nodiscard]] constexpr const E& Error() const&
        {
            if (HasValue())
                detail::ExpectedFailNoError();
            return ErrorUnsafe();
        }

        /// @brief Returns the value, or @p fallback when holding an error.
        template <class U>
        [[nodiscard]] constexpr T ValueOr(U&& fallback) const&
        {
            return HasValue() ? ValueUnsafe() : static_cast<T>(std::forward<U>(fallback));
        }

    private:
        std::variant<T, E> m_storage;
    };

    /// @brief `Expected` specialization for operations that only report success or an error.
    template <class E>
    class [[nodiscard]] Expected<void, E>
    {
    public:
        using ValueType = void;
        using ErrorType = E;

        constexpr Expected() noexcept = default;

        constexpr explicit Expected(Unexpected<E>&& unexpected)
            : m_error {std::move(unexpected).Error()}
        {
        }

        [[nodiscard]] constexpr bool HasValue() const noexcept { return !m_error.has_value(); }
        constexpr explicit operator bool() const noexcept { return HasValue(); }

        [[nodiscard]] constexpr E&       ErrorUnsafe() & noexcept { return *m_error; }
        [[nodiscard]] constexpr const E& ErrorUnsafe() const& noexcept { return *m_error; }
        [[nodiscard]] constexpr E&&      ErrorUnsafe() && noexcept { return std::move(*m_error); }

        [[nodiscard]] constexpr const E& Error() const&
        {
            if (HasValue())
                detail::ExpectedFailNoError();
            return *m_error;
        }

    private:
        std::optional<E> m_error {};
    };
}// namespace RILL::Utilities
