#pragma once

#include <memory>
#include <type_traits>
#include <utility>

#include "Base.hpp"
#include "Error.hpp"

namespace Orrery
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

    inline constexpr ErrorValue<Error> Err(ErrorCode code, const char* message = nullptr)
    {
        return ErrorValue<Error>(Error(code, message));
    }

    struct OkTag {};
    inline constexpr OkTag OK{};

    /**
     * Value-or-error return type used across the public API.
     * Holds exactly one of T or E; accessing the wrong side is checked in debug builds.
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

        template<typename G>
            requires std::is_constructible_v<E, const G&>
        constexpr Result(const ErrorValue<G>& err) : m_hasValue(false)
        {
            std::construct_at(&m_error, err.value);
        }

        template<typename G>
            requires std::is_constructible_v<E, G&&>
        constexpr Result(ErrorValue<G>&& err) : m_hasValue(false)
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

        ORRERY_NODISCARD constexpr bool HasValue() const noexcept { return m_hasValue; }
        ORRERY_NODISCARD constexpr bool IsOk() const noexcept { return m_hasValue; }
        ORRERY_NODISCARD constexpr bool IsErr() const noexcept { return !m_hasValue; }
        ORRERY_NODISCARD constexpr explicit operator bool() const noexcept { return m_hasValue; }

        constexpr T& Value() &
        {
            ORRERY_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return m_value;
        }

        constexpr const T& Value() const&
        {
            ORRERY_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return m_value;
        }

        constexpr T&& Value() &&
        {
            ORRERY_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return std::move(m_value);
        }

        constexpr const E& Error() const&
        {
            ORRERY_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return m_error;
        }

        constexpr E&& Error() &&
        {
            ORRERY_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return std::move(m_error);
        }

        constexpr T& operator*() & { return Value(); }
        constexpr const T& operator*() const& { return Value(); }

        constexpr T* operator->() noexcept
        {
            ORRERY_ASSERT(m_hasValue, "Called operator-> on Result containing error");
            return &m_value;
        }

        constexpr const T* operator->() const noexcept
        {
            ORRERY_ASSERT(m_hasValue, "Called operator-> on Result containing error");
            return &m_value;
        }

        template<typename U>
        ORRERY_NODISCARD constexpr T ValueOr(U&& fallback) const&
        {
            return m_hasValue ? m_value : static_cast<T>(std::forward<U>(fallback));
        }

        template<typename U>
        ORRERY_NODISCARD constexpr T ValueOr(U&& fallback) &&
        {
            return m_hasValue ? std::move(m_value) : static_cast<T>(std::forward<U>(fallback));
        }

    private:
        constexpr void Destroy() noexcept
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

        template<typename G>
            requires std::is_constructible_v<E, const G&>
        constexpr Result(const ErrorValue<G>& err) : m_hasValue(false)
        {
            std::construct_at(&m_error, err.value);
        }

        template<typename G>
            requires std::is_constructible_v<E, G&&>
        constexpr Result(ErrorValue<G>&& err) : m_hasValue(false)
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

        ORRERY_NODISCARD constexpr bool HasValue() const noexcept { return m_hasValue; }
        ORRERY_NODISCARD constexpr bool IsOk() const noexcept { return m_hasValue; }
        ORRERY_NODISCARD constexpr bool IsErr() const noexcept { return !m_hasValue; }
        ORRERY_NODISCARD constexpr explicit operator bool() const noexcept { return m_hasValue; }

        constexpr const E& Error() const&
        {
            ORRERY_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return m_error;
        }

    private:
        union
        {
            E m_error;
        };
        bool m_hasValue;
    };

    template<typename T, typename E>
    ORRERY_NODISCARD constexpr bool operator==(const Result<T, E>& lhs, const ErrorValue<E>& rhs)
    {
        return lhs.IsErr() && lhs.Error() == rhs.value;
    }

    template<typename T, typename E>
    ORRERY_NODISCARD constexpr bool operator==(const Result<T, E>& lhs, ErrorCode code)
    {
        return lhs.IsErr() && lhs.Error() == code;
    }
}
