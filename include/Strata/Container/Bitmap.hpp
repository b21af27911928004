#pragma once

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>

#include "../Core/Base.hpp"

namespace Strata
{
    /**
     * @brief Fixed-width bit set used for component presence and access masks
     */
    template<std::size_t Bits>
    class Bitmap
    {
    public:
        static constexpr std::size_t BITS_PER_WORD = 64;
        static constexpr std::size_t WORD_COUNT = (Bits + BITS_PER_WORD - 1) / BITS_PER_WORD;

        using Word = std::uint64_t;

        constexpr Bitmap() noexcept : m_words{} {}

        // Out of range indices are ignored
        constexpr void Set(std::size_t index) noexcept
        {
            if (index < Bits) STRATA_LIKELY
            {
                m_words[index / BITS_PER_WORD] |= (Word(1) << (index % BITS_PER_WORD));
            }
        }

        constexpr void Reset(std::size_t index) noexcept
        {
            if (index < Bits) STRATA_LIKELY
            {
                m_words[index / BITS_PER_WORD] &= ~(Word(1) << (index % BITS_PER_WORD));
            }
        }

        constexpr void Clear() noexcept
        {
            m_words.fill(0);
        }

        STRATA_NODISCARD constexpr bool Test(std::size_t index) const noexcept
        {
            if (index >= Bits) STRATA_UNLIKELY return false;
            return (m_words[index / BITS_PER_WORD] & (Word(1) << (index % BITS_PER_WORD))) != 0;
        }

        // True when every bit of mask is also set here
        STRATA_NODISCARD constexpr bool HasAll(const Bitmap& mask) const noexcept
        {
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
            {
                if ((m_words[i] & mask.m_words[i]) != mask.m_words[i]) STRATA_UNLIKELY
                    return false;
            }
            return true;
        }

        STRATA_NODISCARD constexpr bool Intersects(const Bitmap& other) const noexcept
        {
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
            {
                if ((m_words[i] & other.m_words[i]) != 0)
                    return true;
            }
            return false;
        }

        STRATA_NODISCARD constexpr bool operator==(const Bitmap& other) const noexcept = default;

        STRATA_NODISCARD constexpr Bitmap operator&(const Bitmap& other) const noexcept
        {
            Bitmap result = *this;
            result &= other;
            return result;
        }

        STRATA_NODISCARD constexpr Bitmap operator|(const Bitmap& other) const noexcept
        {
            Bitmap result = *this;
            result |= other;
            return result;
        }

        constexpr Bitmap& operator&=(const Bitmap& other) noexcept
        {
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
                m_words[i] &= other.m_words[i];
            return *this;
        }

        constexpr Bitmap& operator|=(const Bitmap& other) noexcept
        {
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
                m_words[i] |= other.m_words[i];
            return *this;
        }

        STRATA_NODISCARD constexpr std::size_t Count() const noexcept
        {
            std::size_t count = 0;
            for (Word word : m_words)
                count += static_cast<std::size_t>(std::popcount(word));
            return count;
        }

        STRATA_NODISCARD constexpr bool Any() const noexcept
        {
            for (Word word : m_words)
            {
                if (word != 0) return true;
            }
            return false;
        }

        STRATA_NODISCARD constexpr bool None() const noexcept
        {
            return !Any();
        }

        // Calls fn(index) for every set bit in ascending order
        template<typename Fn>
        constexpr void ForEachSetBit(Fn&& fn) const
        {
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
            {
                Word word = m_words[i];
                while (word != 0)
                {
                    const auto bit = static_cast<std::size_t>(std::countr_zero(word));
                    fn(i * BITS_PER_WORD + bit);
                    word &= word - 1;
                }
            }
        }

        STRATA_NODISCARD static constexpr std::size_t Size() noexcept { return Bits; }

    private:
        std::array<Word, WORD_COUNT> m_words;
    };
}
