#pragma once

#include "common.hpp"

namespace framewarp
{
    namespace detail
    {
        inline std::uint64_t fnv1a64(std::span<const std::byte> bytes) noexcept
        {
            std::uint64_t h = 1469598103934665603ULL;
            for (const std::byte b : bytes)
            {
                h ^= static_cast<std::uint64_t>(static_cast<unsigned char>(b));
                h *= 1099511628211ULL;
            }
            return h;
        }

        inline std::uint64_t fnv1a64_raw(const void *p, std::size_t n) noexcept
        {
            return fnv1a64(std::span<const std::byte>(static_cast<const std::byte *>(p), n));
        }

        inline std::uint64_t splitmix64(std::uint64_t x) noexcept
        {
            x += 0x9e3779b97f4a7c15ULL;
            x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
            x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
            return x ^ (x >> 31);
        }

        inline std::uint64_t mix_u64(std::uint64_t a, std::uint64_t b) noexcept
        {
            return splitmix64(a ^ splitmix64(b));
        }
    }

    // Checksum over the hashable fields of a snapshot.
    //
    // Each field contributes one term binding the field hash to the component type and to the
    // entity's ordinal in RollbackId order. The ordinal is used instead of the id itself because
    // entities spawned during resimulation receive fresh ids while keeping their relative order.
    // Terms are combined with a wrapping sum.
    class ChecksumAccumulator
    {
    public:
        void add_field(std::uint64_t ordinal, ComponentTypeId type, std::uint64_t fieldHash) noexcept
        {
            std::uint64_t x = detail::mix_u64(ordinal, static_cast<std::uint64_t>(type));
            x = detail::mix_u64(x, fieldHash);
            m_sum += x;
            ++m_terms;
        }

        // Presence of an entity with no hashable field still has to show up.
        void add_entity(std::uint64_t ordinal) noexcept
        {
            m_sum += detail::splitmix64(ordinal ^ 0x5bd1e995ULL);
        }

        std::uint64_t value() const noexcept { return m_sum; }
        std::size_t terms() const noexcept { return m_terms; }

    private:
        std::uint64_t m_sum = 0;
        std::size_t m_terms = 0;
    };
}
