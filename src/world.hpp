#pragma once

#include "checksum.hpp"
#include "common.hpp"

#include <concepts>
#include <functional>
#include <memory>
#include <typeinfo>
#include <unordered_map>

namespace framewarp
{
    using EntityMap = std::unordered_map<EntityHandle, EntityHandle, EntityHandleHash>;

    // Rewrites handles stored inside components after a restore recreated entities.
    // Handles with no mapping are returned unchanged.
    class EntityMapper
    {
    public:
        explicit EntityMapper(const EntityMap &map) : m_map(map) {}

        EntityHandle map(EntityHandle h) const
        {
            auto it = m_map.find(h);
            return it == m_map.end() ? h : it->second;
        }

    private:
        const EntityMap &m_map;
    };

    // Immutable boxed deep copy of one component value.
    class FieldValue
    {
    public:
        FieldValue() = default;
        FieldValue(ComponentTypeId type, std::shared_ptr<const void> data) : m_type(type), m_data(std::move(data)) {}

        ComponentTypeId type() const noexcept { return m_type; }
        const void *get() const noexcept { return m_data.get(); }
        bool empty() const noexcept { return m_data == nullptr; }

    private:
        ComponentTypeId m_type = 0;
        std::shared_ptr<const void> m_data;
    };

    struct ComponentTypeOps
    {
        ComponentTypeId type = 0;
        std::string name;
        const std::type_info *cppType = nullptr;

        std::function<void *()> create;
        std::function<void(void *)> destroy;

        // live -> boxed deep copy
        std::function<std::shared_ptr<const void>(const void *)> clone;
        // boxed -> live, full overwrite
        std::function<void(void *, const void *)> assign;

        // Optional.
        std::function<std::uint64_t(const void *)> hash;
        std::function<bool(const void *, const void *)> equals;
        std::function<void(void *, const EntityMapper &)> mapEntities;
    };

    class World;

    class ComponentRegistry
    {
    public:
        void register_type(ComponentTypeOps ops)
        {
            if (m_frozen)
            {
                throw ConfigurationError("register_type: registry is frozen (session already started), type=" + ops.name);
            }
            if (ops.type == 0 || !ops.cppType || !ops.create || !ops.destroy || !ops.clone || !ops.assign)
            {
                throw ConfigurationError("register_type: incomplete ops for type=" + ops.name);
            }
            const ComponentTypeId type = ops.type;
            auto [it, inserted] = m_ops.emplace(type, std::move(ops));
            if (!inserted)
            {
                throw ConfigurationError("DuplicateRegistration: ComponentTypeId=" + std::to_string(type) + " (" + it->second.name + ")");
            }
        }

        // Plain-old-data component: stored and compared byte for byte.
        template <class T>
        void register_copy(ComponentTypeId type, std::string name)
        {
            static_assert(std::is_trivially_copyable_v<T>, "T must be trivially copyable for register_copy");
            ComponentTypeOps ops = basic_ops_<T>(type, std::move(name));
            ops.assign = [](void *dst, const void *src)
            { std::memcpy(dst, src, sizeof(T)); };
            ops.hash = [](const void *p) -> std::uint64_t
            { return detail::fnv1a64_raw(p, sizeof(T)); };
            ops.equals = [](const void *a, const void *b)
            { return std::memcmp(a, b, sizeof(T)) == 0; };
            register_type(std::move(ops));
        }

        // Copy-constructible component. Hashing is opt-in since there is no generic byte view.
        template <class T>
        void register_clone(ComponentTypeId type, std::string name, std::function<std::uint64_t(const T &)> hasher = {})
        {
            static_assert(std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>, "T must be copyable for register_clone");
            ComponentTypeOps ops = basic_ops_<T>(type, std::move(name));
            ops.assign = [](void *dst, const void *src)
            { *static_cast<T *>(dst) = *static_cast<const T *>(src); };
            if (hasher)
            {
                ops.hash = [hasher = std::move(hasher)](const void *p) -> std::uint64_t
                { return hasher(*static_cast<const T *>(p)); };
            }
            if constexpr (std::equality_comparable<T>)
            {
                ops.equals = [](const void *a, const void *b)
                { return *static_cast<const T *>(a) == *static_cast<const T *>(b); };
            }
            register_type(std::move(ops));
        }

        // Attach entity remapping to an already registered component that stores handles.
        template <class T>
        void register_entity_refs(ComponentTypeId type, std::function<void(T &, const EntityMapper &)> fn)
        {
            if (m_frozen)
            {
                throw ConfigurationError("register_entity_refs: registry is frozen");
            }
            if (!fn)
            {
                throw ConfigurationError("register_entity_refs: null mapper");
            }
            auto &ops = mutable_ops_(type);
            if (*ops.cppType != typeid(T))
            {
                throw ConfigurationError("register_entity_refs: C++ type does not match registration of " + ops.name);
            }
            ops.mapEntities = [fn = std::move(fn)](void *p, const EntityMapper &mapper)
            { fn(*static_cast<T *>(p), mapper); };
        }

        const ComponentTypeOps &get(ComponentTypeId type) const
        {
            auto it = m_ops.find(type);
            if (it == m_ops.end())
            {
                throw ConfigurationError("Unregistered ComponentTypeId=" + std::to_string(type));
            }
            return it->second;
        }

        bool contains(ComponentTypeId type) const { return m_ops.count(type) != 0; }
        std::size_t size() const noexcept { return m_ops.size(); }

        // Ascending tag order; capture and restore both walk types in this order.
        std::vector<ComponentTypeId> types() const
        {
            std::vector<ComponentTypeId> out;
            out.reserve(m_ops.size());
            for (const auto &[type, ops] : m_ops)
            {
                (void)ops;
                out.push_back(type);
            }
            return out;
        }

        void freeze() noexcept { m_frozen = true; }
        bool frozen() const noexcept { return m_frozen; }

        // Boxed deep copy of the live field, or nullopt if the entity does not carry it.
        std::optional<FieldValue> extract(ComponentTypeId type, const World &world, EntityHandle h) const;

        // Creates the field if absent, overwrites it if present.
        void apply(ComponentTypeId type, World &world, EntityHandle h, const FieldValue &value) const;

        // Returns true if a field was removed.
        bool remove(ComponentTypeId type, World &world, EntityHandle h) const;

    private:
        template <class T>
        static ComponentTypeOps basic_ops_(ComponentTypeId type, std::string name)
        {
            static_assert(std::is_default_constructible_v<T>, "component types must be default constructible");
            ComponentTypeOps ops;
            ops.type = type;
            ops.name = std::move(name);
            ops.cppType = &typeid(T);
            ops.create = []() -> void *
            { return new T{}; };
            ops.destroy = [](void *p)
            { delete static_cast<T *>(p); };
            ops.clone = [](const void *p) -> std::shared_ptr<const void>
            { return std::make_shared<const T>(*static_cast<const T *>(p)); };
            return ops;
        }

        ComponentTypeOps &mutable_ops_(ComponentTypeId type)
        {
            auto it = m_ops.find(type);
            if (it == m_ops.end())
            {
                throw ConfigurationError("Unregistered ComponentTypeId=" + std::to_string(type));
            }
            return it->second;
        }

        std::map<ComponentTypeId, ComponentTypeOps> m_ops;
        bool m_frozen = false;
    };

    // Live simulation state: a generational entity arena with type-erased components.
    class World
    {
    public:
        explicit World(const ComponentRegistry &registry) : m_registry(registry) {}

        World(const World &) = delete;
        World &operator=(const World &) = delete;

        const ComponentRegistry &registry() const noexcept { return m_registry; }

        // Invoked before a live entity is destroyed.
        void set_despawn_hook(std::function<void(EntityHandle)> hook) { m_despawnHook = std::move(hook); }

        EntityHandle spawn()
        {
            std::uint32_t index = 0;
            if (!m_free.empty())
            {
                index = m_free.back();
                m_free.pop_back();
            }
            else
            {
                index = static_cast<std::uint32_t>(m_slots.size());
                m_slots.emplace_back();
            }
            auto &slot = m_slots[index];
            slot.alive = true;
            slot.enabled = true;
            ++m_alive;
            return EntityHandle{index, slot.generation};
        }

        void despawn(EntityHandle h)
        {
            auto &slot = slot_(h);
            if (m_despawnHook)
            {
                m_despawnHook(h);
            }
            if (!slot.enabled)
            {
                --m_disabled;
            }
            slot.components.clear();
            slot.alive = false;
            slot.enabled = true;
            ++slot.generation;
            if (slot.generation == 0)
            {
                slot.generation = 1;
            }
            --m_alive;
            m_free.push_back(h.index);
        }

        bool alive(EntityHandle h) const noexcept
        {
            if (h.is_null() || h.index >= m_slots.size())
            {
                return false;
            }
            const auto &slot = m_slots[h.index];
            return slot.alive && slot.generation == h.generation;
        }

        // A disabled entity keeps its handle and components but is skipped by entities() and
        // for_each. Rollback despawn uses it to hide entities until their frame is confirmed.
        void set_enabled(EntityHandle h, bool enabled)
        {
            auto &slot = slot_(h);
            if (slot.enabled == enabled)
            {
                return;
            }
            slot.enabled = enabled;
            if (enabled)
            {
                --m_disabled;
            }
            else
            {
                ++m_disabled;
            }
        }

        bool enabled(EntityHandle h) const noexcept
        {
            return alive(h) && m_slots[h.index].enabled;
        }

        // Includes disabled entities.
        std::size_t entity_count() const noexcept { return m_alive; }
        std::size_t disabled_count() const noexcept { return m_disabled; }

        // Enabled live handles in ascending slot order.
        std::vector<EntityHandle> entities() const
        {
            std::vector<EntityHandle> out;
            out.reserve(m_alive - m_disabled);
            for (std::uint32_t i = 0; i < m_slots.size(); ++i)
            {
                if (m_slots[i].alive && m_slots[i].enabled)
                {
                    out.push_back(EntityHandle{i, m_slots[i].generation});
                }
            }
            return out;
        }

        template <class T>
        T &insert(EntityHandle h, ComponentTypeId type, T value = {})
        {
            check_type_<T>(type);
            T *dst = static_cast<T *>(emplace_default(h, type));
            *dst = std::move(value);
            return *dst;
        }

        bool has(EntityHandle h, ComponentTypeId type) const
        {
            return component(h, type) != nullptr;
        }

        template <class T>
        const T &get(EntityHandle h, ComponentTypeId type) const
        {
            const T *p = try_get<T>(h, type);
            if (!p)
            {
                throw ObjectLevelError("World::get: entity " + to_string(h) + " has no component " + m_registry.get(type).name);
            }
            return *p;
        }

        template <class T>
        T &get_mut(EntityHandle h, ComponentTypeId type)
        {
            return const_cast<T &>(static_cast<const World &>(*this).get<T>(h, type));
        }

        template <class T>
        const T *try_get(EntityHandle h, ComponentTypeId type) const
        {
            check_type_<T>(type);
            return static_cast<const T *>(component(h, type));
        }

        bool remove(EntityHandle h, ComponentTypeId type)
        {
            auto &slot = slot_(h);
            return slot.components.erase(type) != 0;
        }

        // Raw access for registry ops. nullptr when the entity does not carry the component.
        const void *component(EntityHandle h, ComponentTypeId type) const
        {
            const auto &slot = slot_(h);
            auto it = slot.components.find(type);
            return it == slot.components.end() ? nullptr : it->second.get();
        }

        void *component(EntityHandle h, ComponentTypeId type)
        {
            return const_cast<void *>(static_cast<const World &>(*this).component(h, type));
        }

        // Existing storage, or a default-constructed component added to the entity.
        void *emplace_default(EntityHandle h, ComponentTypeId type)
        {
            auto &slot = slot_(h);
            auto it = slot.components.find(type);
            if (it != slot.components.end())
            {
                return it->second.get();
            }
            const auto &ops = m_registry.get(type);
            ComponentPtr ptr(ops.create(), ops.destroy);
            void *raw = ptr.get();
            slot.components.emplace(type, std::move(ptr));
            return raw;
        }

        // Types carried by the entity, ascending.
        std::vector<ComponentTypeId> component_types(EntityHandle h) const
        {
            const auto &slot = slot_(h);
            std::vector<ComponentTypeId> out;
            out.reserve(slot.components.size());
            for (const auto &[type, ptr] : slot.components)
            {
                (void)ptr;
                out.push_back(type);
            }
            return out;
        }

        // Visits every enabled entity carrying `type`, in ascending slot order.
        template <class T, class Fn>
        void for_each(ComponentTypeId type, Fn &&fn)
        {
            check_type_<T>(type);
            for (std::uint32_t i = 0; i < m_slots.size(); ++i)
            {
                auto &slot = m_slots[i];
                if (!slot.alive || !slot.enabled)
                {
                    continue;
                }
                auto it = slot.components.find(type);
                if (it == slot.components.end())
                {
                    continue;
                }
                fn(EntityHandle{i, slot.generation}, *static_cast<T *>(it->second.get()));
            }
        }

    private:
        using ComponentPtr = std::unique_ptr<void, std::function<void(void *)>>;

        struct Slot
        {
            std::uint32_t generation = 1;
            bool alive = false;
            bool enabled = true;
            std::map<ComponentTypeId, ComponentPtr> components;
        };

        template <class T>
        void check_type_(ComponentTypeId type) const
        {
            const auto &ops = m_registry.get(type);
            if (*ops.cppType != typeid(T))
            {
                throw ObjectLevelError("World: type mismatch for component " + ops.name);
            }
        }

        const Slot &slot_(EntityHandle h) const
        {
            if (!alive(h))
            {
                throw ObjectLevelError("World: stale or unknown entity " + to_string(h));
            }
            return m_slots[h.index];
        }

        Slot &slot_(EntityHandle h)
        {
            return const_cast<Slot &>(static_cast<const World &>(*this).slot_(h));
        }

        const ComponentRegistry &m_registry;
        std::vector<Slot> m_slots;
        std::vector<std::uint32_t> m_free;
        std::size_t m_alive = 0;
        std::size_t m_disabled = 0;
        std::function<void(EntityHandle)> m_despawnHook;
    };

    inline std::optional<FieldValue> ComponentRegistry::extract(ComponentTypeId type, const World &world, EntityHandle h) const
    {
        const auto &ops = get(type);
        const void *live = world.component(h, type);
        if (!live)
        {
            return std::nullopt;
        }
        return FieldValue(type, ops.clone(live));
    }

    inline void ComponentRegistry::apply(ComponentTypeId type, World &world, EntityHandle h, const FieldValue &value) const
    {
        const auto &ops = get(type);
        if (value.type() != type || value.empty())
        {
            throw ObjectLevelError("apply: value of type " + std::to_string(value.type()) + " does not match " + ops.name);
        }
        void *dst = world.emplace_default(h, type);
        ops.assign(dst, value.get());
    }

    inline bool ComponentRegistry::remove(ComponentTypeId type, World &world, EntityHandle h) const
    {
        (void)get(type);
        return world.remove(h, type);
    }
}
