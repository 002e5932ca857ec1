#pragma once

#include "common.hpp"

#include <unordered_map>

namespace framewarp
{
    // RollbackId <-> live EntityHandle translation table.
    //
    // A RollbackId is assigned once and outlives any number of underlying handles. Every
    // unbind bumps the id's generation so a binding observed before the entity was destroyed
    // can be told apart from a later rebinding of the same id.
    //
    // Ids are never handed out twice. An unbound id that no held snapshot mentions can never
    // be rebound, so retire_unbound() drops its entry; the id still counts as allocated.
    class IdentityMap
    {
    public:
        struct Binding
        {
            EntityHandle handle{};
            std::uint32_t generation = 0;
            bool bound = false;
        };

        RollbackId allocate()
        {
            const RollbackId id = m_nextId++;
            if (id == 0)
            {
                throw ConfigurationError("IdentityMap: RollbackId counter overflow");
            }
            m_entries.emplace(id, Binding{});
            return id;
        }

        void bind(RollbackId id, EntityHandle h)
        {
            auto &entry = entry_(id);
            if (h.is_null())
            {
                throw ObjectLevelError("bind: null handle for RollbackId=" + std::to_string(id));
            }
            if (entry.bound)
            {
                if (entry.handle == h)
                {
                    return;
                }
                throw ObjectLevelError("AlreadyBound: RollbackId=" + std::to_string(id) + " is bound to " + to_string(entry.handle) +
                                       ", refusing " + to_string(h));
            }
            if (auto it = m_byHandle.find(h); it != m_byHandle.end())
            {
                throw ObjectLevelError("AlreadyBound: handle " + to_string(h) + " already carries RollbackId=" + std::to_string(it->second));
            }
            entry.handle = h;
            entry.bound = true;
            m_byHandle.emplace(h, id);
        }

        std::optional<EntityHandle> resolve(RollbackId id) const
        {
            auto it = m_entries.find(id);
            if (it == m_entries.end() || !it->second.bound)
            {
                return std::nullopt;
            }
            return it->second.handle;
        }

        void unbind(RollbackId id)
        {
            auto &entry = entry_(id);
            if (!entry.bound)
            {
                return;
            }
            m_byHandle.erase(entry.handle);
            entry.handle = EntityHandle{};
            entry.bound = false;
            ++entry.generation;
        }

        // Despawn notification from the live world. Untracked handles are ignored.
        void on_despawn(EntityHandle h)
        {
            auto it = m_byHandle.find(h);
            if (it == m_byHandle.end())
            {
                return;
            }
            unbind(it->second);
        }

        std::optional<RollbackId> id_of(EntityHandle h) const
        {
            auto it = m_byHandle.find(h);
            if (it == m_byHandle.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::uint32_t generation(RollbackId id) const
        {
            auto it = m_entries.find(id);
            if (it == m_entries.end())
            {
                throw ObjectLevelError("IdentityMap: unknown or retired RollbackId=" + std::to_string(id));
            }
            return it->second.generation;
        }

        bool is_current(RollbackId id, std::uint32_t generation) const
        {
            auto it = m_entries.find(id);
            return it != m_entries.end() && it->second.bound && it->second.generation == generation;
        }

        bool is_allocated(RollbackId id) const noexcept { return id != 0 && id < m_nextId; }

        // Allocated and not retired.
        bool has_entry(RollbackId id) const { return m_entries.count(id) != 0; }
        std::size_t entry_count() const noexcept { return m_entries.size(); }

        // Every id ever allocated, ascending.
        std::vector<RollbackId> all_ids() const
        {
            std::vector<RollbackId> out;
            out.reserve(static_cast<std::size_t>(m_nextId - 1));
            for (RollbackId id = 1; id < m_nextId; ++id)
            {
                out.push_back(id);
            }
            return out;
        }

        // Drops the entry of every unbound id for which `referenced(id)` is false. Returns the
        // number of entries dropped.
        template <class Pred>
        std::size_t retire_unbound(Pred &&referenced)
        {
            std::size_t retired = 0;
            for (auto it = m_entries.begin(); it != m_entries.end();)
            {
                if (!it->second.bound && !referenced(it->first))
                {
                    it = m_entries.erase(it);
                    ++retired;
                }
                else
                {
                    ++it;
                }
            }
            return retired;
        }

        // Ids currently bound to a live handle, ascending.
        std::vector<RollbackId> live_ids() const
        {
            std::vector<RollbackId> out;
            out.reserve(m_byHandle.size());
            for (const auto &[h, id] : m_byHandle)
            {
                (void)h;
                out.push_back(id);
            }
            std::sort(out.begin(), out.end());
            return out;
        }

        std::size_t bound_count() const noexcept { return m_byHandle.size(); }

        void reset()
        {
            m_entries.clear();
            m_byHandle.clear();
            m_nextId = 1;
        }

    private:
        Binding &entry_(RollbackId id)
        {
            auto it = m_entries.find(id);
            if (it == m_entries.end())
            {
                throw ObjectLevelError("IdentityMap: unknown or retired RollbackId=" + std::to_string(id));
            }
            return it->second;
        }

        RollbackId m_nextId = 1;
        std::unordered_map<RollbackId, Binding> m_entries;
        std::unordered_map<EntityHandle, RollbackId, EntityHandleHash> m_byHandle;
    };
}
