#pragma once

#include <initializer_list>
#include <span>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "../Component/Component.hpp"
#include "../Component/ComponentBag.hpp"
#include "../Component/ComponentRegistry.hpp"
#include "../Core/Base.hpp"
#include "../Core/Log.hpp"
#include "../Core/Result.hpp"
#include "../Core/TypeID.hpp"

namespace Orrery
{
    // Type-list tags for Aspect::Make
    template<typename... Ts> struct Required {};
    template<typename... Ts> struct Excluded {};
    template<typename... Ts> struct OneOf {};

    namespace Detail
    {
        template<typename List>
        struct AspectList;

        template<template<typename...> class Tag, typename... Ts>
        struct AspectList<Tag<Ts...>>
        {
            static ComponentMask Mask()
            {
                ComponentMask mask;
                (mask.Set(TypeID<Ts>::Value()), ...);
                return mask;
            }
        };

        template<template<typename...> class Tag, typename... Lists>
        struct FindList
        {
            using Type = Tag<>;
        };

        template<template<typename...> class Tag, typename First, typename... Rest>
        struct FindList<Tag, First, Rest...>
        {
            using Type = typename FindList<Tag, Rest...>::Type;
        };

        template<template<typename...> class Tag, typename... Ts, typename... Rest>
        struct FindList<Tag, Tag<Ts...>, Rest...>
        {
            using Type = Tag<Ts...>;
        };

        template<typename T>
        inline constexpr bool IsAspectList = false;
        template<typename... Ts>
        inline constexpr bool IsAspectList<Required<Ts...>> = true;
        template<typename... Ts>
        inline constexpr bool IsAspectList<Excluded<Ts...>> = true;
        template<typename... Ts>
        inline constexpr bool IsAspectList<OneOf<Ts...>> = true;
    }

    /**
     * Immutable predicate over an entity's component set.
     *
     * An entity matches when it has every required component, none of the
     * excluded ones and, if the one-of set is non-empty, at least one of those.
     * The empty aspect matches nothing; contradictory inputs collapse into it.
     */
    class Aspect
    {
    public:
        // The empty aspect
        Aspect() noexcept = default;

        Aspect(std::initializer_list<ComponentID> required,
               std::initializer_list<ComponentID> excluded = {},
               std::initializer_list<ComponentID> oneRequired = {})
            : Aspect(FromMasks(ToMask(required), ToMask(excluded), ToMask(oneRequired)))
        {}

        ORRERY_NODISCARD static Aspect FromIDs(std::span<const ComponentID> required,
                                               std::span<const ComponentID> excluded = {},
                                               std::span<const ComponentID> oneRequired = {})
        {
            return FromMasks(ToMask(required), ToMask(excluded), ToMask(oneRequired));
        }

        /**
         * Canonical construction every other factory funnels into:
         * 1. no required and no one-of components gives the empty aspect
         * 2. a component both required and excluded gives the empty aspect
         * 3. a one-of component that is also required clears the one-of set,
         *    otherwise excluded components are dropped from it
         */
        ORRERY_NODISCARD static Aspect FromMasks(const ComponentMask& required,
                                                 const ComponentMask& excluded,
                                                 const ComponentMask& oneRequired) noexcept
        {
            if (required.None() && oneRequired.None())
                return Aspect{};

            if (required.HasAny(excluded))
                return Aspect{};

            Aspect aspect;
            if (!oneRequired.HasAny(required))
            {
                aspect.m_oneRequired = oneRequired & ~excluded;
            }
            aspect.m_required = required;
            aspect.m_excluded = excluded;
            aspect.m_isEmpty = false;
            return aspect;
        }

        /**
         * Builds an aspect from component types:
         *   Aspect::Make<Required<Position, Velocity>, Excluded<Frozen>>()
         * Each of Required, Excluded and OneOf may appear at most once, in any order.
         */
        template<typename... Lists>
            requires (Detail::IsAspectList<Lists> && ...)
        ORRERY_NODISCARD static Aspect Make()
        {
            using RequiredList = typename Detail::FindList<Orrery::Required, Lists...>::Type;
            using ExcludedList = typename Detail::FindList<Orrery::Excluded, Lists...>::Type;
            using OneOfList = typename Detail::FindList<Orrery::OneOf, Lists...>::Type;

            return FromMasks(Detail::AspectList<RequiredList>::Mask(),
                             Detail::AspectList<ExcludedList>::Mask(),
                             Detail::AspectList<OneOfList>::Mask());
        }

        /**
         * Builds an aspect from registered component names
         * @return NotFound if any name is unknown to the registry
         */
        ORRERY_NODISCARD static Result<Aspect> FromNames(const ComponentRegistry& registry,
                                                         std::initializer_list<std::string_view> required,
                                                         std::initializer_list<std::string_view> excluded = {},
                                                         std::initializer_list<std::string_view> oneRequired = {})
        {
            auto requiredIds = registry.Resolve(required);
            if (!requiredIds) return Err(requiredIds.Error());
            auto excludedIds = registry.Resolve(excluded);
            if (!excludedIds) return Err(excludedIds.Error());
            auto oneRequiredIds = registry.Resolve(oneRequired);
            if (!oneRequiredIds) return Err(oneRequiredIds.Error());

            return FromIDs(*requiredIds, *excludedIds, *oneRequiredIds);
        }

        /**
         * Conjunction: the result matches exactly the entities every input matches.
         * Any empty input, or no input at all, yields the empty aspect.
         */
        ORRERY_NODISCARD static Aspect Compose(std::span<const Aspect> aspects) noexcept
        {
            if (aspects.empty())
                return Aspect{};

            ComponentMask required, excluded, oneRequired;
            for (const Aspect& aspect : aspects)
            {
                if (aspect.m_isEmpty)
                    return Aspect{};

                required |= aspect.m_required;
                excluded |= aspect.m_excluded;
                oneRequired |= aspect.m_oneRequired;
            }
            return FromMasks(required, excluded, oneRequired);
        }

        template<typename... Aspects>
            requires (std::is_same_v<std::remove_cvref_t<Aspects>, Aspect> && ...)
        ORRERY_NODISCARD static Aspect Compose(const Aspects&... aspects)
        {
            if constexpr (sizeof...(Aspects) == 0)
            {
                return Aspect{};
            }
            else
            {
                const Aspect list[] = {aspects...};
                return Compose(std::span<const Aspect>(list));
            }
        }

        ORRERY_NODISCARD bool Matches(const ComponentMask& mask) const noexcept
        {
            if (m_isEmpty)
                return false;
            if (!mask.HasAll(m_required))
                return false;
            if (mask.HasAny(m_excluded))
                return false;
            if (m_oneRequired.Any())
                return mask.HasAny(m_oneRequired);
            return true;
        }

        ORRERY_NODISCARD bool Matches(const ComponentBag& bag) const noexcept
        {
            return Matches(bag.GetMask());
        }

        ORRERY_NODISCARD const ComponentMask& Required() const noexcept { return m_required; }
        ORRERY_NODISCARD const ComponentMask& Excluded() const noexcept { return m_excluded; }
        ORRERY_NODISCARD const ComponentMask& OneRequired() const noexcept { return m_oneRequired; }
        ORRERY_NODISCARD bool IsEmpty() const noexcept { return m_isEmpty; }

        ORRERY_NODISCARD bool operator==(const Aspect& other) const noexcept = default;

    private:
        template<typename Range>
        static ComponentMask ToMask(const Range& ids)
        {
            ComponentMask mask;
            for (ComponentID id : ids)
            {
                if (id >= MAX_COMPONENTS) ORRERY_UNLIKELY
                {
                    GlobalLogger().Warn("Ignoring component id {} outside aspect range [0, {})", id, MAX_COMPONENTS);
                    continue;
                }
                mask.Set(id);
            }
            return mask;
        }

        ComponentMask m_required;
        ComponentMask m_excluded;
        ComponentMask m_oneRequired;
        bool m_isEmpty = true;
    };
}

template<>
struct fmt::formatter<Orrery::Aspect> : fmt::formatter<std::string_view>
{
    template<typename FormatContext>
    auto format(const Orrery::Aspect& aspect, FormatContext& ctx) const
    {
        if (aspect.IsEmpty())
            return fmt::format_to(ctx.out(), "Aspect<>");

        auto join = [](const Orrery::ComponentMask& mask)
        {
            std::string out;
            mask.ForEachSet([&out](std::size_t id)
            {
                if (!out.empty())
                    out += ", ";
                out += fmt::to_string(id);
            });
            return out;
        };

        return fmt::format_to(ctx.out(), "Aspect<Required: {{{}}}, Excluded: {{{}}}, OneOf: {{{}}}>",
                              join(aspect.Required()), join(aspect.Excluded()), join(aspect.OneRequired()));
    }
};
