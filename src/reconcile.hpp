#pragma once

#include "checksum.hpp"
#include "identity_map.hpp"
#include "log.hpp"
#include "snapshot_store.hpp"
#include "world.hpp"

#include <unordered_set>

namespace framewarp
{
    // Object-level failure counters. Nothing the engine skips goes uncounted.
    struct Diagnostics
    {
        std::uint64_t objectErrors = 0;
        std::uint64_t staleBindings = 0;
    };

    struct RestoreReport
    {
        Frame frame = NullFrame;
        std::size_t created = 0;
        std::size_t destroyed = 0;
        std::size_t applied = 0;
        std::size_t removed = 0;
        std::size_t skipped = 0;

        // Hidden by a rollback despawn and present at the target frame.
        std::size_t resurrected = 0;

        // Handle at capture time -> handle after restore, for every restored entity.
        EntityMap entityMap;
    };

    namespace detail
    {
        inline void report_object_error(Diagnostics &diag, Frame frame, RollbackId id, const char *stage, const std::exception &e)
        {
            ++diag.objectErrors;
            Logger::instance().logf(LogLevel::Warn, frame, stage, "skipping RollbackId=%llu: %s",
                                    static_cast<unsigned long long>(id), e.what());
        }

        // A binding whose handle died without a despawn notification.
        inline bool drop_stale_binding(const World &world, IdentityMap &ids, Diagnostics &diag, Frame frame, RollbackId id)
        {
            const auto h = ids.resolve(id);
            if (!h || world.alive(*h))
            {
                return false;
            }
            ++diag.staleBindings;
            Logger::instance().logf(LogLevel::Debug, frame, "reconcile", "stale binding: RollbackId=%llu handle=%s",
                                    static_cast<unsigned long long>(id), to_string(*h).c_str());
            ids.unbind(id);
            return true;
        }
    }

    // Captures every tracked entity's registered components into a new snapshot. Entities
    // hidden by a rollback despawn are not part of the frame. A field that fails to extract
    // is recorded as unreadable; the rest of the entity is still captured.
    inline WorldSnapshot capture(Frame frame,
                                 const World &world,
                                 const ComponentRegistry &registry,
                                 IdentityMap &ids,
                                 Diagnostics &diag,
                                 bool withChecksum = true)
    {
        WorldSnapshot snap;
        snap.frame = frame;

        const auto types = registry.types();
        ChecksumAccumulator checksum;

        for (const RollbackId id : ids.live_ids())
        {
            if (detail::drop_stale_binding(world, ids, diag, frame, id))
            {
                continue;
            }
            const EntityHandle h = *ids.resolve(id);
            if (!world.enabled(h))
            {
                continue;
            }

            EntitySnapshot entity;
            entity.id = id;
            entity.handle = h;

            std::vector<std::pair<ComponentTypeId, std::uint64_t>> hashes;
            for (const ComponentTypeId type : types)
            {
                try
                {
                    auto value = registry.extract(type, world, h);
                    if (!value)
                    {
                        continue;
                    }
                    const auto &ops = registry.get(type);
                    if (withChecksum && ops.hash)
                    {
                        hashes.emplace_back(type, ops.hash(value->get()));
                    }
                    entity.fields.emplace(type, std::move(*value));
                }
                catch (const ObjectLevelError &e)
                {
                    detail::report_object_error(diag, frame, id, "capture", e);
                    entity.unreadable.push_back(type);
                }
            }

            if (withChecksum)
            {
                const std::uint64_t ordinal = snap.entities.size();
                checksum.add_entity(ordinal);
                for (const auto &[type, hash] : hashes)
                {
                    checksum.add_field(ordinal, type, hash);
                }
            }
            snap.entities.push_back(std::move(entity));
        }

        if (withChecksum)
        {
            snap.checksum = checksum.value();
            snap.hasChecksum = true;
        }
        return snap;
    }

    // Makes the live world match `target` exactly for every tracked entity and registered
    // component. Untracked entities and unregistered components are left alone, and so are
    // hidden entities the target frame does not contain.
    inline RestoreReport restore(const WorldSnapshot &target,
                                 World &world,
                                 const ComponentRegistry &registry,
                                 IdentityMap &ids,
                                 Diagnostics &diag)
    {
        RestoreReport report;
        report.frame = target.frame;
        const Frame frame = target.frame;

        // 1) live set, dropping bindings to handles that died behind our back.
        std::vector<RollbackId> live;
        for (const RollbackId id : ids.live_ids())
        {
            if (!detail::drop_stale_binding(world, ids, diag, frame, id))
            {
                live.push_back(id);
            }
        }

        // 2) tracked now, absent at the target frame.
        for (const RollbackId id : live)
        {
            if (target.find(id))
            {
                continue;
            }
            try
            {
                const EntityHandle h = *ids.resolve(id);
                if (!world.enabled(h))
                {
                    // Already despawned for the game; the confirmed-frame sweep destroys it.
                    continue;
                }
                world.despawn(h);
                ids.unbind(id);
                ++report.destroyed;
            }
            catch (const ObjectLevelError &e)
            {
                detail::report_object_error(diag, frame, id, "restore/despawn", e);
                ++report.skipped;
            }
        }

        // 3) present at the target frame, gone now. Same RollbackId, new handle.
        std::unordered_set<RollbackId> failed;
        for (const auto &entity : target.entities)
        {
            if (ids.resolve(entity.id))
            {
                continue;
            }
            try
            {
                const EntityHandle h = world.spawn();
                try
                {
                    ids.bind(entity.id, h);
                }
                catch (const ObjectLevelError &)
                {
                    world.despawn(h);
                    throw;
                }
                ++report.created;
            }
            catch (const ObjectLevelError &e)
            {
                detail::report_object_error(diag, frame, entity.id, "restore/spawn", e);
                failed.insert(entity.id);
                ++report.skipped;
            }
        }

        // 4) overwrite, create or remove every registered field.
        const auto types = registry.types();
        for (const auto &entity : target.entities)
        {
            if (failed.count(entity.id) != 0)
            {
                continue;
            }
            try
            {
                const EntityHandle h = *ids.resolve(entity.id);
                if (!world.enabled(h))
                {
                    world.set_enabled(h, true);
                    ++report.resurrected;
                }
                for (const ComponentTypeId type : types)
                {
                    if (const FieldValue *value = entity.find(type))
                    {
                        registry.apply(type, world, h, *value);
                        ++report.applied;
                    }
                    else if (entity.is_unreadable(type))
                    {
                        continue;
                    }
                    else if (registry.remove(type, world, h))
                    {
                        ++report.removed;
                    }
                }
                if (!entity.handle.is_null())
                {
                    report.entityMap.emplace(entity.handle, h);
                }
            }
            catch (const ObjectLevelError &e)
            {
                detail::report_object_error(diag, frame, entity.id, "restore/apply", e);
                failed.insert(entity.id);
                ++report.skipped;
            }
        }

        // 5) rewrite handles stored inside restored components.
        const EntityMapper mapper(report.entityMap);
        for (const ComponentTypeId type : types)
        {
            const auto &ops = registry.get(type);
            if (!ops.mapEntities)
            {
                continue;
            }
            for (const auto &entity : target.entities)
            {
                if (failed.count(entity.id) != 0)
                {
                    continue;
                }
                try
                {
                    const EntityHandle h = *ids.resolve(entity.id);
                    if (void *p = world.component(h, type))
                    {
                        ops.mapEntities(p, mapper);
                    }
                }
                catch (const ObjectLevelError &e)
                {
                    detail::report_object_error(diag, frame, entity.id, "restore/map", e);
                    failed.insert(entity.id);
                    ++report.skipped;
                }
            }
        }

        Logger::instance().logf(LogLevel::Debug, frame, "restore", "created=%zu destroyed=%zu resurrected=%zu applied=%zu removed=%zu skipped=%zu",
                                report.created, report.destroyed, report.resurrected, report.applied, report.removed, report.skipped);
        return report;
    }
}
