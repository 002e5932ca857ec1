#pragma once

#include "session.hpp"
#include "world.hpp"

namespace framewarp
{
    // What the deterministic step sees while it runs.
    class IFrameContext
    {
    public:
        virtual ~IFrameContext() = default;

        virtual Frame frame() const noexcept = 0;

        // One entry per player, in PlayerHandle order. Empty during on_start.
        virtual const std::vector<PlayerInput> &inputs() const noexcept = 0;

        virtual World &world() = 0;

        // Spawns an entity carrying the rollback marker (fresh RollbackId, bound at creation).
        virtual EntityHandle spawn_rollback() = 0;

        // Tracked or untracked; tracked entities are unbound from their RollbackId.
        virtual void despawn(EntityHandle h) = 0;

        // Hides a tracked entity until its frame is confirmed, so a rollback past this frame
        // brings it back on the same handle.
        virtual void despawn_rollback(EntityHandle h) = 0;

        virtual std::optional<RollbackId> rollback_id(EntityHandle h) const = 0;
    };

    class ISimulation
    {
    public:
        virtual ~ISimulation() = default;

        // Called once by SessionDriver::start, before any request runs (optional hook).
        virtual void on_start(IFrameContext &) {}

        // Advance the tracked state by exactly one frame. Must be deterministic: the same
        // restored state and the same inputs must produce the same result.
        virtual void advance(IFrameContext &ctx) = 0;
    };
}
