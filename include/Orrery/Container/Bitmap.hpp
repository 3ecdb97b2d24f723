#pragma once

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>

#include "../Core/Base.hpp"

namespace Orrery
{
    /**
     * Fixed-size bit set with the set-algebra operations aspects are built on.
     * Out-of-range indices are ignored by Set/Reset and read as unset by Test.
     */
    template<std::size_t Bits>
    class Bitmap
    {
    public:
        static constexpr std::size_t BITS_PER_WORD = 64;
        static constexpr std::size_t WORD_COUNT = (Bits + BITS_PER_WORD - 1) / BITS_PER_WORD;

        using Word = std::uint64_t;

        constexpr Bitmap() noexcept = default;

        static constexpr std::size_t Size() noexcept { return Bits; }

        constexpr void Set(std::size_t index) noexcept
        {
            if (index < Bits) ORRERY_LIKELY
            {
                m_words[index / BITS_PER_WORD] |= Word(1) << (index % BITS_PER_WORD);
            }
        }

        constexpr void Reset(std::size_t index) noexcept
        {
            if (index < Bits) ORRERY_LIKELY
            {
                m_words[index / BITS_PER_WORD] &= ~(Word(1) << (index % BITS_PER_WORD));
            }
        }

        constexpr void Clear() noexcept
        {
            m_words.fill(0);
        }

        ORRERY_NODISCARD constexpr bool Test(std::size_t index) const noexcept
        {
            if (index >= Bits) ORRERY_UNLIKELY return false;
            return (m_words[index / BITS_PER_WORD] & (Word(1) << (index % BITS_PER_WORD))) != 0;
        }

        // True if every bit set in mask is also set here
        ORRERY_NODISCARD constexpr bool HasAll(const Bitmap& mask) const noexcept
        {
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
            {
                if ((m_words[i] & mask.m_words[i]) != mask.m_words[i])
                    return false;
            }
            return true;
        }

        // True if at least one bit set in mask is also set here
        ORRERY_NODISCARD constexpr bool HasAny(const Bitmap& mask) const noexcept
        {
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
            {
                if ((m_words[i] & mask.m_words[i]) != 0)
                    return true;
            }
            return false;
        }

        ORRERY_NODISCARD constexpr bool Any() const noexcept
        {
            for (Word word : m_words)
            {
                if (word != 0)
                    return true;
            }
            return false;
        }

        ORRERY_NODISCARD constexpr bool None() const noexcept { return !Any(); }

        ORRERY_NODISCARD constexpr std::size_t Count() const noexcept
        {
            std::size_t count = 0;
            for (Word word : m_words)
            {
                count += static_cast<std::size_t>(std::popcount(word));
            }
            return count;
        }

        template<typename Func>
        constexpr void ForEachSet(Func&& func) const
        {
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
            {
                Word word = m_words[i];
                while (word != 0)
                {
                    const int bit = std::countr_zero(word);
                    func(i * BITS_PER_WORD + static_cast<std::size_t>(bit));
                    word &= word - 1;
                }
            }
        }

        ORRERY_NODISCARD constexpr bool operator==(const Bitmap& other) const noexcept = default;

        ORRERY_NODISCARD constexpr Bitmap operator&(const Bitmap& other) const noexcept
        {
            Bitmap result;
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
            {
                result.m_words[i] = m_words[i] & other.m_words[i];
            }
            return result;
        }

        ORRERY_NODISCARD constexpr Bitmap operator|(const Bitmap& other) const noexcept
        {
            Bitmap result;
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
            {
                result.m_words[i] = m_words[i] | other.m_words[i];
            }
            return result;
        }

        ORRERY_NODISCARD constexpr Bitmap operator~() const noexcept
        {
            Bitmap result;
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
            {
                result.m_words[i] = ~m_words[i];
            }
            result.TrimTail();
            return result;
        }

        constexpr Bitmap& operator&=(const Bitmap& other) noexcept { return *this = *this & other; }
        constexpr Bitmap& operator|=(const Bitmap& other) noexcept { return *this = *this | other; }

    private:
        constexpr void TrimTail() noexcept
        {
            if constexpr (Bits % BITS_PER_WORD != 0)
            {
                m_words[WORD_COUNT - 1] &= (Word(1) << (Bits % BITS_PER_WORD)) - 1;
            }
        }

        std::array<Word, WORD_COUNT> m_words{};
    };
}
