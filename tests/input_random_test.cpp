/*
Purpose: Unit tests for the deterministic helpers handed to simulations.

What this tests: input::pack/unpack validate sizes with ObjectLevelError and unpack_or
falls back for disconnected or empty inputs; the stateless RNG and its per-frame cursor
give the same values whenever a frame is replayed and honour their ranges.
*/

#include "input.hpp"
#include "random.hpp"

#include <cassert>
#include <cstdint>

namespace
{
    struct Stick
    {
        std::int16_t x = 0;
        std::int16_t y = 0;
        std::uint8_t buttons = 0;
    };
}

int main()
{
    using namespace framewarp;

    {
        const Stick s{-3, 12, 0x5};
        const PlayerInput in{input::pack(s), InputStatus::Confirmed};
        assert(in.bytes.size() == sizeof(Stick));
        const Stick back = input::unpack<Stick>(in);
        assert(back.x == -3 && back.y == 12 && back.buttons == 0x5);

        bool threw = false;
        try
        {
            (void)input::unpack<std::uint64_t>(in, "stick");
        }
        catch (const ObjectLevelError &)
        {
            threw = true;
        }
        assert(threw);

        const PlayerInput gone{input::pack(s), InputStatus::Disconnected};
        assert(input::unpack_or<std::int32_t>(gone, -1) == -1);
        assert(input::unpack_or<std::int32_t>(PlayerInput{}, 4) == 4);
        assert(input::unpack_or<Stick>(in, Stick{}).y == 12);
    }

    {
        const std::uint64_t a = rng_u64(42, 10, 1, 7, 0);
        assert(a == rng_u64(42, 10, 1, 7, 0));
        assert(a != rng_u64(42, 11, 1, 7, 0));
        assert(a != rng_u64(42, 10, 2, 7, 0));
        assert(a != rng_u64(42, 10, 1, 8, 0));
        assert(a != rng_u64(42, 10, 1, 7, 1));
        assert(a != rng_u64(43, 10, 1, 7, 0));
    }

    // A cursor rebuilt for the same frame replays the same sequence.
    {
        FrameRng first(9, 3, 0, 1);
        FrameRng replay(9, 3, 0, 1);
        FrameRng nextFrame(9, 4, 0, 1);
        assert(first.next_u64() == rng_u64(9, 3, 0, 1, 0));
        assert(replay.next_u64() == rng_u64(9, 3, 0, 1, 0));
        assert(nextFrame.next_u64() != rng_u64(9, 3, 0, 1, 0));

        for (int i = 0; i < 200; ++i)
        {
            const double u = first.next_unit();
            assert(u == replay.next_unit());
            assert(u >= 0.0 && u < 1.0);

            const std::int64_t r = first.next_range(-2, 2);
            assert(r == replay.next_range(-2, 2));
            assert(r >= -2 && r <= 2);
        }
        assert(first.draws() == 401);
        assert(!first.next_chance(0.0));
        assert(first.next_chance(1.0));
    }

    return 0;
}
