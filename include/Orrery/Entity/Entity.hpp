#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <limits>

#include <fmt/format.h>

#include "../Core/Base.hpp"

namespace Orrery
{
    namespace Detail
    {
        /**
         * 32-bit generation-checked arena handle: 24-bit slot index, 8-bit version.
         * Tag keeps entity and system handles from converting into each other.
         */
        template<typename Tag>
        class BasicHandle
        {
        public:
            using IDType = std::uint32_t;
            using VersionType = std::uint8_t;

            static constexpr std::size_t ID_BITS = 24;
            static constexpr std::size_t VERSION_SHIFT = ID_BITS;
            static constexpr IDType ID_MASK = (IDType{1} << ID_BITS) - 1;
            static constexpr IDType VERSION_MASK = 0xFF;
            static constexpr IDType INVALID = std::numeric_limits<IDType>::max();

            constexpr BasicHandle() noexcept : m_value{INVALID} {}
            constexpr explicit BasicHandle(IDType value) noexcept : m_value{value} {}
            constexpr BasicHandle(IDType id, VersionType version) noexcept
                : m_value{(static_cast<IDType>(version) << VERSION_SHIFT) | (id & ID_MASK)}
            {}

            ORRERY_NODISCARD constexpr explicit operator bool() const noexcept { return IsValid(); }

            ORRERY_NODISCARD constexpr bool operator==(const BasicHandle& other) const noexcept = default;
            ORRERY_NODISCARD constexpr auto operator<=>(const BasicHandle& other) const noexcept = default;

            ORRERY_NODISCARD constexpr IDType GetID() const noexcept { return m_value & ID_MASK; }
            ORRERY_NODISCARD constexpr VersionType GetVersion() const noexcept
            {
                return static_cast<VersionType>((m_value >> VERSION_SHIFT) & VERSION_MASK);
            }
            ORRERY_NODISCARD constexpr IDType GetValue() const noexcept { return m_value; }

            ORRERY_NODISCARD constexpr bool IsValid() const noexcept { return m_value != INVALID; }

            ORRERY_NODISCARD static constexpr BasicHandle Invalid() noexcept { return BasicHandle{}; }

        private:
            IDType m_value;
        };

        struct EntityTag {};
        struct SystemTag {};
    }

    using Entity = Detail::BasicHandle<Detail::EntityTag>;
    using SystemHandle = Detail::BasicHandle<Detail::SystemTag>;

    constexpr std::size_t MAX_ENTITIES = Entity::ID_MASK;

    template<typename T>
    inline constexpr bool IsHandle = false;

    template<typename Tag>
    inline constexpr bool IsHandle<Detail::BasicHandle<Tag>> = true;
}

namespace std
{
    template<typename Tag>
    struct hash<Orrery::Detail::BasicHandle<Tag>>
    {
        ORRERY_NODISCARD std::size_t operator()(const Orrery::Detail::BasicHandle<Tag>& handle) const noexcept
        {
            std::uint64_t x = handle.GetValue();
            x ^= x >> 16;
            x *= 0x9E3779B97F4A7C15ULL;
            x ^= x >> 29;
            return static_cast<std::size_t>(x);
        }
    };
}

template<>
struct fmt::formatter<Orrery::Entity> : fmt::formatter<std::string_view>
{
    template<typename FormatContext>
    auto format(const Orrery::Entity& entity, FormatContext& ctx) const
    {
        if (!entity.IsValid())
            return fmt::format_to(ctx.out(), "Entity(invalid)");
        return fmt::format_to(ctx.out(), "Entity({}v{})", entity.GetID(), entity.GetVersion());
    }
};

template<>
struct fmt::formatter<Orrery::SystemHandle> : fmt::formatter<std::string_view>
{
    template<typename FormatContext>
    auto format(const Orrery::SystemHandle& system, FormatContext& ctx) const
    {
        if (!system.IsValid())
            return fmt::format_to(ctx.out(), "System(invalid)");
        return fmt::format_to(ctx.out(), "System({}v{})", system.GetID(), system.GetVersion());
    }
};
