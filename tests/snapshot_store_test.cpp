/*
Purpose: Unit tests for the fixed-capacity SnapshotStore ring.

What this tests: a frame stays retrievable until a save `capacity` frames later reuses
its slot, after which fetching it raises SnapshotNotFound (a ProtocolFatal); never-written
frames, negative frames and zero capacity are rejected.
*/

#include "snapshot_store.hpp"

#include <cassert>

namespace
{
    framewarp::WorldSnapshot make_snapshot(framewarp::Frame f)
    {
        framewarp::WorldSnapshot s;
        s.frame = f;
        s.checksum = static_cast<std::uint64_t>(f) * 31u;
        s.hasChecksum = true;
        return s;
    }
}

int main()
{
    using namespace framewarp;

    {
        bool threw = false;
        try
        {
            SnapshotStore zero(0);
        }
        catch (const ConfigurationError &)
        {
            threw = true;
        }
        assert(threw);
    }

    constexpr std::size_t Capacity = 4;
    SnapshotStore store(Capacity);
    assert(store.capacity() == Capacity);
    assert(store.latest() == NullFrame);

    // Never written.
    {
        bool threw = false;
        try
        {
            (void)store.load(0);
        }
        catch (const SnapshotNotFound &e)
        {
            threw = true;
            assert(e.requested() == 0);
            assert(e.stored() == NullFrame);
        }
        assert(threw);
    }

    for (Frame f = 0; f < 4; ++f)
    {
        store.save(make_snapshot(f));
    }
    for (Frame f = 0; f < 4; ++f)
    {
        assert(store.contains(f));
        assert(store.load(f).checksum == static_cast<std::uint64_t>(f) * 31u);
    }
    assert(store.latest() == 3);

    // Frame 0 is still there until frame 0 + capacity is saved.
    store.save(make_snapshot(4));
    assert(!store.contains(0));
    assert(store.contains(4));
    {
        bool threw = false;
        try
        {
            (void)store.load(0);
        }
        catch (const ProtocolFatal &e)
        {
            threw = true;
            const auto *nf = dynamic_cast<const SnapshotNotFound *>(&e);
            assert(nf);
            assert(nf->requested() == 0);
            assert(nf->stored() == 4);
        }
        assert(threw);
    }

    // A frame beyond anything saved maps onto an occupied slot and is still not found.
    assert(!store.contains(9));

    // Overwriting the same frame replaces the slot.
    {
        auto s = make_snapshot(4);
        s.checksum = 7;
        store.save(std::move(s));
        assert(store.load(4).checksum == 7);
    }

    {
        bool threw = false;
        try
        {
            store.save(make_snapshot(-3));
        }
        catch (const ProtocolFatal &)
        {
            threw = true;
        }
        assert(threw);
    }

    store.reset();
    assert(!store.contains(4));
    assert(store.latest() == NullFrame);

    return 0;
}
