#pragma once

#include "common.hpp"
#include "world.hpp"

namespace framewarp
{
    struct EntitySnapshot
    {
        RollbackId id = 0;

        // Handle the entity had when captured. Only used to remap stored references on restore.
        EntityHandle handle{};

        // Absence of a type means the entity did not carry that component at this frame.
        std::map<ComponentTypeId, FieldValue> fields;

        // Types the entity carried but whose extraction failed, ascending. Restore leaves
        // these fields as they are instead of removing them.
        std::vector<ComponentTypeId> unreadable;

        const FieldValue *find(ComponentTypeId type) const
        {
            auto it = fields.find(type);
            return it == fields.end() ? nullptr : &it->second;
        }

        bool is_unreadable(ComponentTypeId type) const
        {
            return std::binary_search(unreadable.begin(), unreadable.end(), type);
        }
    };

    struct WorldSnapshot
    {
        Frame frame = NullFrame;

        // Ascending RollbackId.
        std::vector<EntitySnapshot> entities;

        std::uint64_t checksum = 0;
        bool hasChecksum = false;

        const EntitySnapshot *find(RollbackId id) const
        {
            auto it = std::lower_bound(entities.begin(), entities.end(), id,
                                       [](const EntitySnapshot &e, RollbackId v)
                                       { return e.id < v; });
            if (it == entities.end() || it->id != id)
            {
                return nullptr;
            }
            return &(*it);
        }

        std::vector<RollbackId> ids() const
        {
            std::vector<RollbackId> out;
            out.reserve(entities.size());
            for (const auto &e : entities)
            {
                out.push_back(e.id);
            }
            return out;
        }

        // Field-by-field comparison. Types without an equality op compare by hash when they
        // have one and are otherwise treated as equal. With `compareIds == false` entities are
        // matched by position, which tolerates fresh ids handed out during resimulation.
        bool same_state(const WorldSnapshot &other, const ComponentRegistry &registry, bool compareIds = true) const
        {
            if (entities.size() != other.entities.size())
            {
                return false;
            }
            for (std::size_t i = 0; i < entities.size(); ++i)
            {
                const auto &a = entities[i];
                const auto &b = other.entities[i];
                if ((compareIds && a.id != b.id) || a.fields.size() != b.fields.size() || a.unreadable != b.unreadable)
                {
                    return false;
                }
                for (const auto &[type, value] : a.fields)
                {
                    const FieldValue *rhs = b.find(type);
                    if (!rhs)
                    {
                        return false;
                    }
                    const auto &ops = registry.get(type);
                    if (ops.equals)
                    {
                        if (!ops.equals(value.get(), rhs->get()))
                        {
                            return false;
                        }
                    }
                    else if (ops.hash && ops.hash(value.get()) != ops.hash(rhs->get()))
                    {
                        return false;
                    }
                }
            }
            return true;
        }
    };

    // Fixed-capacity ring of world snapshots addressed by `frame mod capacity`.
    class SnapshotStore
    {
    public:
        explicit SnapshotStore(std::size_t capacity) : m_slots(capacity)
        {
            if (capacity == 0)
            {
                throw ConfigurationError("SnapshotStore: capacity must be non-zero");
            }
        }

        std::size_t capacity() const noexcept { return m_slots.size(); }

        // Overwrites whatever the slot held.
        void save(WorldSnapshot snapshot)
        {
            if (snapshot.frame < 0)
            {
                throw ProtocolFatal("SnapshotStore::save: negative frame=" + std::to_string(snapshot.frame));
            }
            const std::size_t pos = slot_index_(snapshot.frame);
            m_slots[pos] = std::move(snapshot);
        }

        const WorldSnapshot &load(Frame frame) const
        {
            if (frame < 0)
            {
                throw SnapshotNotFound(frame, NullFrame);
            }
            const auto &slot = m_slots[slot_index_(frame)];
            if (slot.frame != frame)
            {
                throw SnapshotNotFound(frame, slot.frame);
            }
            return slot;
        }

        bool contains(Frame frame) const noexcept
        {
            return frame >= 0 && m_slots[slot_index_(frame)].frame == frame;
        }

        // True if any held frame contains the entity. An unbound id no held frame mentions can
        // never be rebound by a restore.
        bool references(RollbackId id) const
        {
            for (const auto &s : m_slots)
            {
                if (s.frame != NullFrame && s.find(id))
                {
                    return true;
                }
            }
            return false;
        }

        // Newest frame held, or NullFrame when empty.
        Frame latest() const noexcept
        {
            Frame out = NullFrame;
            for (const auto &s : m_slots)
            {
                out = std::max(out, s.frame);
            }
            return out;
        }

        void reset()
        {
            for (auto &s : m_slots)
            {
                s = WorldSnapshot{};
            }
        }

    private:
        std::size_t slot_index_(Frame frame) const noexcept
        {
            return static_cast<std::size_t>(frame) % m_slots.size();
        }

        std::vector<WorldSnapshot> m_slots;
    };
}
