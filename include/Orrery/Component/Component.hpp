#pragma once

#include <cstdint>
#include <limits>
#include <type_traits>

#include "../Container/Bitmap.hpp"
#include "../Core/Config.hpp"

namespace Orrery
{
    using ComponentID = std::uint16_t;

    inline constexpr ComponentID INVALID_COMPONENT = std::numeric_limits<ComponentID>::max();

    constexpr std::size_t MAX_COMPONENTS = config::MAX_COMPONENTS;

    // Presence set over component ids, the only thing aspects look at
    using ComponentMask = Bitmap<MAX_COMPONENTS>;

    template<typename T>
    concept Component = std::is_object_v<T> &&
                        !std::is_const_v<T> &&
                        std::is_nothrow_destructible_v<T> &&
                        std::is_move_constructible_v<T>;
}
