#pragma once

#include "checksum.hpp"
#include "common.hpp"

namespace framewarp
{
    // Deterministic randomness for rollback simulations.
    //
    // Values are a pure function of (seed, frame, stream, key, draw), so a frame that is
    // resimulated after a rollback sees exactly the values it saw the first time, and no
    // generator state has to be captured in snapshots.
    //
    // `key` identifies the consumer within a frame: a player handle or a value stored in a
    // component. RollbackIds of entities spawned during advance are a poor key, since a
    // resimulation hands those entities fresh ids.
    inline std::uint64_t rng_u64(std::uint64_t seed,
                                 Frame frame,
                                 std::uint32_t stream,
                                 std::uint64_t key,
                                 std::uint32_t draw = 0) noexcept
    {
        std::uint64_t x = detail::mix_u64(seed, static_cast<std::uint64_t>(static_cast<std::uint32_t>(frame)));
        x = detail::mix_u64(x, (static_cast<std::uint64_t>(stream) << 32) | draw);
        return detail::mix_u64(x, key);
    }

    // Per-frame draw cursor. Construct one inside ISimulation::advance (never keep it across
    // frames); successive calls advance the draw index.
    class FrameRng
    {
    public:
        FrameRng(std::uint64_t seed, Frame frame, std::uint32_t stream, std::uint64_t key) noexcept
            : m_seed(seed), m_frame(frame), m_stream(stream), m_key(key)
        {
        }

        std::uint64_t next_u64() noexcept { return rng_u64(m_seed, m_frame, m_stream, m_key, m_draw++); }

        // [0, 1) from the top 53 bits.
        double next_unit() noexcept
        {
            return static_cast<double>(next_u64() >> 11) * 0x1.0p-53;
        }

        // [lo, hi] inclusive; lo must not exceed hi. Modulo bias is tolerated.
        std::int64_t next_range(std::int64_t lo, std::int64_t hi) noexcept
        {
            const std::uint64_t width = static_cast<std::uint64_t>(hi - lo) + 1;
            if (width == 0)
            {
                return static_cast<std::int64_t>(next_u64());
            }
            return lo + static_cast<std::int64_t>(next_u64() % width);
        }

        bool next_chance(double p) noexcept { return next_unit() < p; }

        std::uint32_t draws() const noexcept { return m_draw; }

    private:
        std::uint64_t m_seed = 0;
        Frame m_frame = 0;
        std::uint32_t m_stream = 0;
        std::uint64_t m_key = 0;
        std::uint32_t m_draw = 0;
    };
}
