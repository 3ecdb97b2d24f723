#pragma once

#include <atomic>
#include <string_view>
#include <type_traits>

#include "../Component/Component.hpp"
#include "Base.hpp"

namespace Orrery
{
    namespace Detail
    {
        template<typename T>
        constexpr std::string_view TypeNameInternal() noexcept
        {
            #if defined(ORRERY_COMPILER_MSVC)
                constexpr std::string_view funcName = __FUNCSIG__;
                constexpr std::string_view prefix = "TypeNameInternal<";
                constexpr std::string_view suffix = ">(void)";
            #elif defined(ORRERY_COMPILER_CLANG)
                constexpr std::string_view funcName = __PRETTY_FUNCTION__;
                constexpr std::string_view prefix = "TypeNameInternal() [T = ";
                constexpr std::string_view suffix = "]";
            #else
                constexpr std::string_view funcName = __PRETTY_FUNCTION__;
                constexpr std::string_view prefix = "TypeNameInternal() [with T = ";
                constexpr std::string_view suffix = "]";
            #endif

            std::size_t start = funcName.find(prefix);
            if (start == std::string_view::npos)
                return "Unknown";
            start += prefix.size();

            std::size_t end = funcName.rfind(suffix);
            if (end == std::string_view::npos || end <= start)
                return "Unknown";

            std::string_view typeName = funcName.substr(start, end - start);

            #if defined(ORRERY_COMPILER_MSVC)
                if (typeName.starts_with("struct "))
                    typeName.remove_prefix(7);
                else if (typeName.starts_with("class "))
                    typeName.remove_prefix(6);
            #endif

            return typeName;
        }

        class TypeIDGenerator
        {
        public:
            ORRERY_NODISCARD static ComponentID Next() noexcept
            {
                return s_nextId.fetch_add(1, std::memory_order_relaxed);
            }

        private:
            inline static std::atomic<ComponentID> s_nextId{0};
        };

        template<typename T>
        struct TypeIDStorage
        {
            ORRERY_NODISCARD static ComponentID Value() noexcept
            {
                static const ComponentID s_id = TypeIDGenerator::Next();
                return s_id;
            }
        };
    }

    /**
     * Process-wide dense id per component type, assigned on first use.
     * Ids are not stable across runs; names are.
     */
    template<typename T>
    struct TypeID
    {
        using Type = std::remove_cvref_t<T>;

        ORRERY_NODISCARD static ComponentID Value() noexcept
        {
            return Detail::TypeIDStorage<Type>::Value();
        }

        ORRERY_NODISCARD static constexpr std::string_view Name() noexcept
        {
            return Detail::TypeNameInternal<Type>();
        }
    };
}
