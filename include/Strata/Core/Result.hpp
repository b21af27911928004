#pragma once

#include <memory>
#include <type_traits>
#include <utility>

#include "Base.hpp"
#include "Error.hpp"

namespace Strata
{
    template<typename E>
    struct ErrorValue
    {
        E value;

        constexpr explicit ErrorValue(const E& e) : value(e) {}
        constexpr explicit ErrorValue(E&& e) : value(std::move(e)) {}
    };

    template<typename E>
    constexpr ErrorValue<std::decay_t<E>> Err(E&& e)
    {
        return ErrorValue<std::decay_t<E>>(std::forward<E>(e));
    }

    // Shorthand for Err(MakeError(...)), the common case inside the library
    constexpr ErrorValue<Error> Err(ErrorCode code, const char* message = nullptr, std::uintptr_t address = 0)
    {
        return ErrorValue<Error>(MakeError(code, message, address));
    }

    struct OkTag {};
    constexpr OkTag OK{};

    /**
     * @brief Value-or-error return type used by every fallible operation
     *
     * Holds either a T or an E. Accessing the wrong alternative asserts in
     * debug builds.
     */
    template<typename T, typename E = Error>
    class Result
    {
        static_assert(!std::is_reference_v<T>, "T cannot be a reference type");
        static_assert(!std::is_reference_v<E>, "E cannot be a reference type");

    public:
        using ValueType = T;
        using ErrorType = E;

        constexpr Result(const T& value) : m_hasValue(true)
        {
            std::construct_at(&m_value, value);
        }

        constexpr Result(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>) : m_hasValue(true)
        {
            std::construct_at(&m_value, std::move(value));
        }

        constexpr Result(const ErrorValue<E>& err) : m_hasValue(false)
        {
            std::construct_at(&m_error, err.value);
        }

        constexpr Result(ErrorValue<E>&& err) noexcept(std::is_nothrow_move_constructible_v<E>) : m_hasValue(false)
        {
            std::construct_at(&m_error, std::move(err.value));
        }

        constexpr Result(const Result& other) : m_hasValue(other.m_hasValue)
        {
            if (m_hasValue)
                std::construct_at(&m_value, other.m_value);
            else
                std::construct_at(&m_error, other.m_error);
        }

        constexpr Result(Result&& other) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>)
            : m_hasValue(other.m_hasValue)
        {
            if (m_hasValue)
                std::construct_at(&m_value, std::move(other.m_value));
            else
                std::construct_at(&m_error, std::move(other.m_error));
        }

        constexpr ~Result()
        {
            Destroy();
        }

        constexpr Result& operator=(const Result& other)
        {
            if (this != &other)
            {
                Destroy();
                m_hasValue = other.m_hasValue;
                if (m_hasValue)
                    std::construct_at(&m_value, other.m_value);
                else
                    std::construct_at(&m_error, other.m_error);
            }
            return *this;
        }

        constexpr Result& operator=(Result&& other) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>)
        {
            if (this != &other)
            {
                Destroy();
                m_hasValue = other.m_hasValue;
                if (m_hasValue)
                    std::construct_at(&m_value, std::move(other.m_value));
                else
                    std::construct_at(&m_error, std::move(other.m_error));
            }
            return *this;
        }

        [[nodiscard]] constexpr bool IsOk() const noexcept { return m_hasValue; }
        [[nodiscard]] constexpr bool IsErr() const noexcept { return !m_hasValue; }
        [[nodiscard]] constexpr explicit operator bool() const noexcept { return m_hasValue; }

        constexpr T& Value() &
        {
            STRATA_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return m_value;
        }

        constexpr const T& Value() const&
        {
            STRATA_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return m_value;
        }

        constexpr T&& Value() &&
        {
            STRATA_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return std::move(m_value);
        }

        constexpr const E& Error() const&
        {
            STRATA_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return m_error;
        }

        constexpr E&& Error() &&
        {
            STRATA_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return std::move(m_error);
        }

        constexpr T& operator*() & { return Value(); }
        constexpr const T& operator*() const& { return Value(); }

        constexpr T* operator->() noexcept
        {
            STRATA_ASSERT(m_hasValue, "Called operator-> on Result containing error");
            return &m_value;
        }

        constexpr const T* operator->() const noexcept
        {
            STRATA_ASSERT(m_hasValue, "Called operator-> on Result containing error");
            return &m_value;
        }

        template<typename U>
        [[nodiscard]] constexpr T ValueOr(U&& fallback) const&
        {
            return m_hasValue ? m_value : static_cast<T>(std::forward<U>(fallback));
        }

        // Error code or ErrorCode::None, handy for assertions in tests
        [[nodiscard]] constexpr ErrorCode Code() const noexcept requires std::is_same_v<E, Strata::Error>
        {
            return m_hasValue ? ErrorCode::None : m_error.code;
        }

    private:
        constexpr void Destroy()
        {
            if (m_hasValue)
                std::destroy_at(&m_value);
            else
                std::destroy_at(&m_error);
        }

        union
        {
            T m_value;
            E m_error;
        };
        bool m_hasValue;
    };

    template<typename E>
    class Result<void, E>
    {
        static_assert(!std::is_reference_v<E>, "E cannot be a reference type");

    public:
        using ValueType = void;
        using ErrorType = E;

        constexpr Result() noexcept : m_hasValue(true) {}
        constexpr Result(OkTag) noexcept : m_hasValue(true) {}

        constexpr Result(const ErrorValue<E>& err) : m_hasValue(false)
        {
            std::construct_at(&m_error, err.value);
        }

        constexpr Result(ErrorValue<E>&& err) noexcept(std::is_nothrow_move_constructible_v<E>) : m_hasValue(false)
        {
            std::construct_at(&m_error, std::move(err.value));
        }

        constexpr Result(const Result& other) : m_hasValue(other.m_hasValue)
        {
            if (!m_hasValue)
                std::construct_at(&m_error, other.m_error);
        }

        constexpr Result(Result&& other) noexcept(std::is_nothrow_move_constructible_v<E>) : m_hasValue(other.m_hasValue)
        {
            if (!m_hasValue)
                std::construct_at(&m_error, std::move(other.m_error));
        }

        constexpr ~Result()
        {
            if (!m_hasValue)
                std::destroy_at(&m_error);
        }

        constexpr Result& operator=(const Result& other)
        {
            if (this != &other)
            {
                if (!m_hasValue)
                    std::destroy_at(&m_error);
                m_hasValue = other.m_hasValue;
                if (!m_hasValue)
                    std::construct_at(&m_error, other.m_error);
            }
            return *this;
        }

        constexpr Result& operator=(Result&& other) noexcept(std::is_nothrow_move_constructible_v<E>)
        {
            if (this != &other)
            {
                if (!m_hasValue)
                    std::destroy_at(&m_error);
                m_hasValue = other.m_hasValue;
                if (!m_hasValue)
                    std::construct_at(&m_error, std::move(other.m_error));
            }
            return *this;
        }

        [[nodiscard]] constexpr bool IsOk() const noexcept { return m_hasValue; }
        [[nodiscard]] constexpr bool IsErr() const noexcept { return !m_hasValue; }
        [[nodiscard]] constexpr explicit operator bool() const noexcept { return m_hasValue; }

        constexpr const E& Error() const&
        {
            STRATA_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return m_error;
        }

        constexpr E&& Error() &&
        {
            STRATA_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return std::move(m_error);
        }

        [[nodiscard]] constexpr ErrorCode Code() const noexcept requires std::is_same_v<E, Strata::Error>
        {
            return m_hasValue ? ErrorCode::None : m_error.code;
        }

    private:
        union
        {
            E m_error;
        };
        bool m_hasValue;
    };

    inline Result<void, Error> Ok()
    {
        return Result<void, Error>();
    }

    template<typename T>
    inline auto Ok(T&& value) -> Result<std::decay_t<T>, Error>
    {
        return Result<std::decay_t<T>, Error>(std::forward<T>(value));
    }
}
