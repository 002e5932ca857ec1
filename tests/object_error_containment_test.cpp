/*
Purpose: Checks that a failure scoped to one entity does not stop reconciliation.

What this tests: a component whose assign refuses one particular value makes restore skip
that entity (counted and logged) while every other entity is restored; a field whose clone
fails is captured as unreadable, so a later restore keeps the entity alive and leaves that
field alone; an entity-ref mapper that throws skips only its entity; and bindings to
handles that died without a despawn notification are dropped and counted instead of
failing the frame.
*/

#include "reconcile.hpp"

#include <cassert>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace
{
    enum : framewarp::ComponentTypeId
    {
        FragileType = 1,
        LabelType = 2,
        LinkType = 3,
    };

    constexpr std::int32_t Poison = -1;
    constexpr std::int32_t Unclonable = -2;

    struct Fragile
    {
        std::int32_t v = 0;
    };

    struct Label
    {
        std::int32_t v = 0;
    };

    struct Link
    {
        framewarp::EntityHandle to{};
    };

    framewarp::ComponentTypeOps fragile_ops()
    {
        framewarp::ComponentTypeOps ops;
        ops.type = FragileType;
        ops.name = "Fragile";
        ops.cppType = &typeid(Fragile);
        ops.create = []() -> void *
        { return new Fragile{}; };
        ops.destroy = [](void *p)
        { delete static_cast<Fragile *>(p); };
        ops.clone = [](const void *p) -> std::shared_ptr<const void>
        {
            const auto &f = *static_cast<const Fragile *>(p);
            if (f.v == Unclonable)
            {
                throw framewarp::ObjectLevelError("Fragile: cannot clone");
            }
            return std::make_shared<const Fragile>(f);
        };
        ops.assign = [](void *dst, const void *src)
        {
            const auto &f = *static_cast<const Fragile *>(src);
            if (f.v == Poison)
            {
                throw framewarp::ObjectLevelError("Fragile: refusing poisoned value");
            }
            *static_cast<Fragile *>(dst) = f;
        };
        ops.hash = [](const void *p) -> std::uint64_t
        { return static_cast<std::uint64_t>(static_cast<const Fragile *>(p)->v); };
        return ops;
    }
}

int main()
{
    using namespace framewarp;

    ComponentRegistry registry;
    registry.register_type(fragile_ops());
    registry.register_copy<Label>(LabelType, "Label");
    registry.register_copy<Link>(LinkType, "Link");
    registry.register_entity_refs<Link>(LinkType, [](Link &l, const EntityMapper &m)
                                        {
                                            if (l.to.is_null())
                                            {
                                                throw ObjectLevelError("dangling ref");
                                            }
                                            l.to = m.map(l.to); });

    // Object errors are logged at Warn with the stage as scope; keep stderr quiet.
    std::vector<std::string> warnings;
    Logger::instance().set_level(LogLevel::Warn);
    Logger::instance().set_sink(nullptr);
    Logger::instance().set_callback([&](LogLevel lvl, Frame, std::string_view scope, std::string_view msg)
                                    {
                                        if (lvl == LogLevel::Warn)
                                        {
                                            warnings.push_back(std::string(scope) + ": " + std::string(msg));
                                        } });
    Logger::instance().reset_counts();

    // Restore skips the poisoned entity and restores the rest.
    {
        World world(registry);
        IdentityMap ids;
        Diagnostics diag;
        world.set_despawn_hook([&](EntityHandle h)
                               { ids.on_despawn(h); });

        std::vector<EntityHandle> hs;
        for (std::int32_t v : {1, Poison, 3})
        {
            const EntityHandle h = world.spawn();
            ids.bind(ids.allocate(), h);
            world.insert<Fragile>(h, FragileType, Fragile{v});
            hs.push_back(h);
        }

        const WorldSnapshot snap = capture(2, world, registry, ids, diag);
        assert(snap.entities.size() == 3);

        for (const auto h : hs)
        {
            world.get_mut<Fragile>(h, FragileType).v = 50;
        }

        const RestoreReport rep = restore(snap, world, registry, ids, diag);
        assert(rep.skipped == 1);
        assert(diag.objectErrors == 1);
        assert(world.get<Fragile>(hs[0], FragileType).v == 1);
        assert(world.get<Fragile>(hs[1], FragileType).v == 50);
        assert(world.get<Fragile>(hs[2], FragileType).v == 3);

        assert(warnings.size() == 1);
        assert(warnings[0].rfind("restore/apply: skipping RollbackId=2", 0) == 0);
        assert(Logger::instance().count(LogLevel::Warn) == 1);
    }

    // Capture keeps an entity whose clone fails; restore leaves the unreadable field alone.
    {
        World world(registry);
        IdentityMap ids;
        Diagnostics diag;
        world.set_despawn_hook([&](EntityHandle h)
                               { ids.on_despawn(h); });

        const EntityHandle good = world.spawn();
        ids.bind(ids.allocate(), good);
        world.insert<Fragile>(good, FragileType, Fragile{4});

        const EntityHandle bad = world.spawn();
        ids.bind(ids.allocate(), bad);
        world.insert<Fragile>(bad, FragileType, Fragile{Unclonable});
        world.insert<Label>(bad, LabelType, Label{7});

        const WorldSnapshot snap = capture(0, world, registry, ids, diag);
        assert(snap.entities.size() == 2);
        assert(snap.entities[1].id == 2);
        assert(snap.entities[1].is_unreadable(FragileType));
        assert(!snap.entities[1].find(FragileType));
        assert(snap.entities[1].find(LabelType));
        assert(diag.objectErrors == 1);
        assert(warnings.size() == 2);
        assert(warnings[1].rfind("capture: skipping RollbackId=2", 0) == 0);

        world.get_mut<Fragile>(good, FragileType).v = 40;
        world.get_mut<Label>(bad, LabelType).v = 70;

        const RestoreReport rep = restore(snap, world, registry, ids, diag);
        assert(rep.destroyed == 0);
        assert(rep.skipped == 0);
        assert(diag.objectErrors == 1);
        assert(world.alive(bad));
        assert(ids.resolve(2) == bad);
        assert(world.get<Fragile>(bad, FragileType).v == Unclonable);
        assert(world.get<Label>(bad, LabelType).v == 7);
        assert(world.get<Fragile>(good, FragileType).v == 4);
    }

    // A mapper that throws skips its entity; later entities are still remapped.
    {
        World world(registry);
        IdentityMap ids;
        Diagnostics diag;
        world.set_despawn_hook([&](EntityHandle h)
                               { ids.on_despawn(h); });

        const EntityHandle a = world.spawn();
        const RollbackId aId = ids.allocate();
        ids.bind(aId, a);
        world.insert<Link>(a, LinkType, Link{});

        const EntityHandle b = world.spawn();
        ids.bind(ids.allocate(), b);
        world.insert<Link>(b, LinkType, Link{a});

        const WorldSnapshot snap = capture(5, world, registry, ids, diag);

        // a comes back on a different handle.
        world.despawn(a);
        const EntityHandle filler = world.spawn();
        assert(filler.index == a.index);

        const RestoreReport rep = restore(snap, world, registry, ids, diag);
        assert(rep.created == 1);
        assert(rep.skipped == 1);
        assert(diag.objectErrors == 1);

        const EntityHandle newA = *ids.resolve(aId);
        assert(world.alive(newA));
        assert(world.get<Link>(b, LinkType).to == newA);
        assert(warnings.size() == 3);
        assert(warnings[2].rfind("restore/map: skipping RollbackId=1", 0) == 0);
    }

    // Binding to a handle that died without notification.
    {
        World world(registry);
        IdentityMap ids;
        Diagnostics diag;

        const EntityHandle h = world.spawn();
        const RollbackId id = ids.allocate();
        ids.bind(id, h);
        world.insert<Fragile>(h, FragileType, Fragile{8});
        const WorldSnapshot snap = capture(0, world, registry, ids, diag);

        // No despawn hook installed: the identity map still thinks h is live.
        world.despawn(h);
        assert(ids.resolve(id) == h);

        const RestoreReport rep = restore(snap, world, registry, ids, diag);
        assert(diag.staleBindings == 1);
        assert(diag.objectErrors == 0);
        assert(rep.created == 1);
        const EntityHandle back = *ids.resolve(id);
        assert(world.alive(back));
        assert(world.get<Fragile>(back, FragileType).v == 8);
        // Stale bindings are not object errors; Debug is filtered at Warn.
        assert(warnings.size() == 3);
    }

    Logger::instance().set_callback({});
    Logger::instance().set_sink(stderr);
    Logger::instance().set_level(LogLevel::Off);

    return 0;
}
