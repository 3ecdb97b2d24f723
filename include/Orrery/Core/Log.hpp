#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <fmt/format.h>

#include "Base.hpp"
#include "Delegate.hpp"

namespace Orrery
{
    enum class LogLevel : std::uint8_t
    {
        Trace = 0,
        Debug,
        Info,
        Warn,
        Error,
        Off
    };

    ORRERY_NODISCARD constexpr std::string_view ToString(LogLevel level) noexcept
    {
        switch (level)
        {
            case LogLevel::Trace: return "trace";
            case LogLevel::Debug: return "debug";
            case LogLevel::Info: return "info";
            case LogLevel::Warn: return "warn";
            case LogLevel::Error: return "error";
            case LogLevel::Off: return "off";
        }
        return "unknown";
    }

    using LogSink = Delegate<void(LogLevel, std::string_view)>;

    inline void StderrSink(LogLevel level, std::string_view message)
    {
        fmt::print(stderr, "[orrery] [{}] {}\n", ToString(level), message);
    }

    /**
     * Level-filtered front end over fmt. Messages below the minimum level are
     * never formatted. A logger without a sink discards everything.
     */
    class Logger
    {
    public:
        Logger() : m_sink(&StderrSink) {}

        explicit Logger(LogSink sink, LogLevel minLevel = LogLevel::Warn)
            : m_sink(std::move(sink)), m_minLevel(minLevel)
        {}

        void SetSink(LogSink sink) { m_sink = std::move(sink); }
        void SetLevel(LogLevel level) noexcept { m_minLevel = level; }

        ORRERY_NODISCARD LogLevel GetLevel() const noexcept { return m_minLevel; }

        ORRERY_NODISCARD bool ShouldLog(LogLevel level) const noexcept
        {
            return m_sink && level != LogLevel::Off && level >= m_minLevel;
        }

        template<typename... Ts>
        void Log(LogLevel level, fmt::format_string<Ts...> format, Ts&&... args) const
        {
            if (!ShouldLog(level))
                return;
            std::string message = fmt::format(format, std::forward<Ts>(args)...);
            m_sink(level, message);
        }

        template<typename... Ts>
        void Trace(fmt::format_string<Ts...> format, Ts&&... args) const
        {
            Log(LogLevel::Trace, format, std::forward<Ts>(args)...);
        }

        template<typename... Ts>
        void Debug(fmt::format_string<Ts...> format, Ts&&... args) const
        {
            Log(LogLevel::Debug, format, std::forward<Ts>(args)...);
        }

        template<typename... Ts>
        void Info(fmt::format_string<Ts...> format, Ts&&... args) const
        {
            Log(LogLevel::Info, format, std::forward<Ts>(args)...);
        }

        template<typename... Ts>
        void Warn(fmt::format_string<Ts...> format, Ts&&... args) const
        {
            Log(LogLevel::Warn, format, std::forward<Ts>(args)...);
        }

        template<typename... Ts>
        void Error(fmt::format_string<Ts...> format, Ts&&... args) const
        {
            Log(LogLevel::Error, format, std::forward<Ts>(args)...);
        }

    private:
        LogSink m_sink;
        LogLevel m_minLevel = LogLevel::Warn;
    };

    // Process-wide logger for code that has no World at hand (aspect construction, component registration)
    inline Logger& GlobalLogger()
    {
        static Logger s_logger;
        return s_logger;
    }
}

template<>
struct fmt::formatter<Orrery::LogLevel> : fmt::formatter<std::string_view>
{
    template<typename FormatContext>
    auto format(Orrery::LogLevel level, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(Orrery::ToString(level), ctx);
    }
};
