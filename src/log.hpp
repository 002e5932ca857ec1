#pragma once

#include "common.hpp"

#include <array>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string_view>

namespace framewarp
{
    enum class LogLevel : std::uint8_t
    {
        Error = 0,
        Warn = 1,
        Info = 2,
        Debug = 3,
        Trace = 4,
        Off = 255,
    };

    inline const char *log_level_name(LogLevel lvl) noexcept
    {
        switch (lvl)
        {
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Trace:
            return "TRACE";
        case LogLevel::Off:
            return "OFF";
        }
        return "UNKNOWN";
    }

    // Accepts the names above in lower case ("warn", "debug", ...).
    inline std::optional<LogLevel> parse_log_level(std::string_view s) noexcept
    {
        if (s == "error")
            return LogLevel::Error;
        if (s == "warn")
            return LogLevel::Warn;
        if (s == "info")
            return LogLevel::Info;
        if (s == "debug")
            return LogLevel::Debug;
        if (s == "trace")
            return LogLevel::Trace;
        if (s == "off")
            return LogLevel::Off;
        return std::nullopt;
    }

    inline bool log_enabled(LogLevel configured, LogLevel msg) noexcept
    {
        if (configured == LogLevel::Off || msg == LogLevel::Off)
        {
            return false;
        }
        return static_cast<std::uint8_t>(msg) <= static_cast<std::uint8_t>(configured);
    }

    // Process-wide logger. Lines look like
    //   [WARN][frame=12][restore] skipping RollbackId=3: ...
    // and go to the FILE* sink and, if set, to a line callback.
    class Logger
    {
    public:
        using LineCallback = std::function<void(LogLevel, Frame, std::string_view scope, std::string_view message)>;

        static Logger &instance()
        {
            static Logger g;
            return g;
        }

        void set_level(LogLevel lvl)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_level = lvl;
        }

        LogLevel level() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_level;
        }

        // nullptr silences the FILE* output (the callback still fires).
        void set_sink(FILE *f)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_sink = f;
        }

        void set_callback(LineCallback cb)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_callback = std::move(cb);
        }

        // Lines emitted at `lvl` since the last reset_counts().
        std::uint64_t count(LogLevel lvl) const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return lvl == LogLevel::Off ? 0 : m_counts[static_cast<std::size_t>(lvl)];
        }

        void reset_counts()
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_counts.fill(0);
        }

        void logf(LogLevel lvl, Frame frame, const char *scope, const char *fmt, ...)
        {
            if (!log_enabled(level(), lvl))
            {
                return;
            }

            char buf[1024];
            va_list args;
            va_start(args, fmt);
            std::vsnprintf(buf, sizeof(buf), fmt, args);
            va_end(args);

            LineCallback cb;
            {
                std::lock_guard<std::mutex> lk(m_mu);
                ++m_counts[static_cast<std::size_t>(lvl)];
                if (m_sink)
                {
                    std::fprintf(m_sink, "[%s][frame=%d][%s] %s\n", log_level_name(lvl), static_cast<int>(frame), scope, buf);
                    std::fflush(m_sink);
                }
                cb = m_callback;
            }
            // Outside the lock so the callback may log or reconfigure.
            if (cb)
            {
                cb(lvl, frame, scope, buf);
            }
        }

    private:
        Logger() = default;

        mutable std::mutex m_mu;
        LogLevel m_level = LogLevel::Off;
        FILE *m_sink = stderr;
        LineCallback m_callback;
        std::array<std::uint64_t, 5> m_counts{};
    };
}
