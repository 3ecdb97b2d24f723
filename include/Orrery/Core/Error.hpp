#pragma once

#include <cstdint>
#include <functional>
#include <string_view>

#include <fmt/format.h>

namespace Orrery
{
    enum class ErrorCode : std::uint32_t
    {
        None = 0,

        InvalidArgument,
        NotFound,
        AlreadyExists,

        InvalidEntity,
        InvalidSystem,
        SystemNotScheduled,

        CapacityExceeded,

        Unknown = 0xFFFFFFFF
    };

    struct Error
    {
        ErrorCode code;
        const char* message;

        constexpr Error(ErrorCode c = ErrorCode::None, const char* msg = nullptr) noexcept
            : code(c), message(msg ? msg : GetDefaultMessage(c))
        {}

        [[nodiscard]] constexpr bool operator==(const Error& other) const noexcept
        {
            return code == other.code;
        }

        [[nodiscard]] constexpr bool operator==(ErrorCode other) const noexcept
        {
            return code == other;
        }

        [[nodiscard]] static constexpr const char* GetDefaultMessage(ErrorCode code) noexcept
        {
            switch (code)
            {
                case ErrorCode::None: return "No error";
                case ErrorCode::InvalidArgument: return "Invalid argument";
                case ErrorCode::NotFound: return "Item not found";
                case ErrorCode::AlreadyExists: return "Item already exists";
                case ErrorCode::InvalidEntity: return "Invalid or stale entity handle";
                case ErrorCode::InvalidSystem: return "Invalid or stale system handle";
                case ErrorCode::SystemNotScheduled: return "System is not scheduled in this world";
                case ErrorCode::CapacityExceeded: return "Capacity exceeded";
                case ErrorCode::Unknown: return "Unknown error";
                default: return "Unspecified error";
            }
        }
    };

    inline constexpr Error MakeError(ErrorCode code, const char* message = nullptr) noexcept
    {
        return Error(code, message);
    }
}

namespace std
{
    template<>
    struct hash<Orrery::Error>
    {
        std::size_t operator()(const Orrery::Error& e) const noexcept
        {
            return std::hash<std::uint32_t>{}(static_cast<std::uint32_t>(e.code));
        }
    };
}

template<>
struct fmt::formatter<Orrery::Error> : fmt::formatter<std::string_view>
{
    template<typename FormatContext>
    auto format(const Orrery::Error& error, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{} (code {})", error.message, static_cast<std::uint32_t>(error.code));
    }
};
