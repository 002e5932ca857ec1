#pragma once

#include "common.hpp"
#include "session.hpp"

namespace framewarp
{
    namespace input
    {
        template <class T>
        inline ByteBuffer pack(const T &value)
        {
            static_assert(std::is_trivially_copyable_v<T>, "input::pack requires trivially copyable T");
            return bytes_from_trivially_copyable(value);
        }

        template <class T>
        inline T unpack(const PlayerInput &in, const char *what = "player input")
        {
            static_assert(std::is_trivially_copyable_v<T>, "input::unpack requires trivially copyable T");
            if (in.bytes.size() != sizeof(T))
            {
                throw ObjectLevelError(std::string("input::unpack: wrong size for ") + what +
                                       " (expected=" + std::to_string(sizeof(T)) +
                                       " got=" + std::to_string(in.bytes.size()) + ")");
            }
            return trivially_copyable_from_bytes<T>(std::span<const std::byte>(in.bytes.data(), in.bytes.size()));
        }

        // Disconnected players contribute `fallback` instead of stale bytes.
        template <class T>
        inline T unpack_or(const PlayerInput &in, T fallback)
        {
            if (in.status == InputStatus::Disconnected || in.bytes.empty())
            {
                return fallback;
            }
            return unpack<T>(in);
        }
    }
}
