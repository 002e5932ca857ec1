#pragma once

#include <algorithm>
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace framewarp
{
    using Frame = std::int32_t;
    inline constexpr Frame NullFrame = -1;

    using PlayerHandle = std::uint32_t;

    // Stable logical identity of a rollback-tracked entity. 0 is never assigned.
    using RollbackId = std::uint64_t;

    using ComponentTypeId = std::uint32_t;

    using ByteBuffer = std::vector<std::byte>;

    // Storage slot plus slot generation. A slot reused after despawn gets a new
    // generation, so a handle captured before the despawn no longer resolves.
    struct EntityHandle
    {
        std::uint32_t index = 0;
        std::uint32_t generation = 0;

        bool is_null() const noexcept { return generation == 0; }

        friend constexpr bool operator==(const EntityHandle &lhs, const EntityHandle &rhs)
        {
            return lhs.index == rhs.index && lhs.generation == rhs.generation;
        }
        friend constexpr bool operator<(const EntityHandle &lhs, const EntityHandle &rhs)
        {
            return (lhs.index < rhs.index) || ((lhs.index == rhs.index) && (lhs.generation < rhs.generation));
        }
    };

    struct EntityHandleHash
    {
        std::size_t operator()(const EntityHandle &h) const noexcept
        {
            const std::uint64_t x = (static_cast<std::uint64_t>(h.generation) << 32) ^ static_cast<std::uint64_t>(h.index);
            return static_cast<std::size_t>(x ^ (x >> 33) ^ (x >> 17));
        }
    };

    inline std::string to_string(EntityHandle h)
    {
        return std::to_string(h.index) + "v" + std::to_string(h.generation);
    }

    // Setup-time programming errors: duplicate registration, unregistered type, bad config.
    class ConfigurationError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Unrecoverable session errors. The driver aborts the session on these.
    class ProtocolFatal : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    class SnapshotNotFound : public ProtocolFatal
    {
    public:
        SnapshotNotFound(Frame requested, Frame stored)
            : ProtocolFatal("SnapshotNotFound: requested frame=" + std::to_string(requested) +
                            " slot holds frame=" + std::to_string(stored)),
              m_requested(requested), m_stored(stored)
        {
        }

        Frame requested() const noexcept { return m_requested; }
        Frame stored() const noexcept { return m_stored; }

    private:
        Frame m_requested = NullFrame;
        Frame m_stored = NullFrame;
    };

    // Failure scoped to a single entity (type mismatch, stale handle, AlreadyBound).
    // The reconciliation engine skips the entity and keeps going.
    class ObjectLevelError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    template <class T>
    inline ByteBuffer bytes_from_trivially_copyable(const T &value)
    {
        static_assert(std::is_trivially_copyable_v<T>, "T must be trivially copyable");
        ByteBuffer out(sizeof(T));
        std::memcpy(out.data(), &value, sizeof(T));
        return out;
    }

    template <class T>
    inline T trivially_copyable_from_bytes(std::span<const std::byte> bytes)
    {
        static_assert(std::is_trivially_copyable_v<T>, "T must be trivially copyable");
        if (bytes.size() != sizeof(T))
        {
            throw ObjectLevelError("trivially_copyable_from_bytes: size mismatch (expected=" + std::to_string(sizeof(T)) +
                                   " got=" + std::to_string(bytes.size()) + ")");
        }
        T out{};
        std::memcpy(&out, bytes.data(), sizeof(T));
        return out;
    }
}
