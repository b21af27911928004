#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <mutex>

#include "Base.hpp"

#if defined(STRATA_COMPILER_GCC) || defined(STRATA_COMPILER_CLANG)
    #define STRATA_PRINTF_FORMAT(fmtIndex, argIndex) __attribute__((format(printf, fmtIndex, argIndex)))
#else
    #define STRATA_PRINTF_FORMAT(fmtIndex, argIndex)
#endif

namespace Strata
{
    // A message is emitted when level <= the configured minimum
    enum class LogLevel : std::uint8_t
    {
        Disabled = 0,
        Fatal = 1,
        Error = 2,
        Warn = 3,
        Info = 4,
        Debug = 5
    };

    /**
     * @brief Process-wide printf-style logger
     *
     * Emission is serialized by a single mutex. Warn and above go to stderr,
     * the rest to stdout, unless a sink is installed. Fatal aborts after
     * flushing.
     */
    class Logger
    {
    public:
        using SinkFn = void(*)(LogLevel level, const char* category, const char* message, void* user);

        static constexpr std::size_t MAX_MESSAGE_LENGTH = 1024;

        static void SetMinLevel(LogLevel level) noexcept { s_minLevel.store(level, std::memory_order_relaxed); }
        STRATA_NODISCARD static LogLevel GetMinLevel() noexcept { return s_minLevel.load(std::memory_order_relaxed); }

        // Silences everything but Fatal, used by tests
        static void SetQuiet(bool quiet) noexcept { s_quiet.store(quiet, std::memory_order_relaxed); }
        STRATA_NODISCARD static bool IsQuiet() noexcept { return s_quiet.load(std::memory_order_relaxed); }

        // Pass nullptr to restore console output
        static void SetSink(SinkFn sink, void* user = nullptr) noexcept
        {
            std::lock_guard<std::mutex> lock(s_mutex);
            s_sink = sink;
            s_sinkUser = user;
        }

        STRATA_NODISCARD static bool IsEnabled(LogLevel level) noexcept
        {
            if (level == LogLevel::Disabled) return false;
            if (level != LogLevel::Fatal && s_quiet.load(std::memory_order_relaxed)) return false;
            return level <= s_minLevel.load(std::memory_order_relaxed);
        }

        STRATA_PRINTF_FORMAT(3, 4)
        static void Log(LogLevel level, const char* category, const char* fmt, ...) noexcept
        {
            if (!IsEnabled(level))
            {
                if (level == LogLevel::Fatal) std::abort();
                return;
            }

            char buffer[MAX_MESSAGE_LENGTH];
            va_list args;
            va_start(args, fmt);
            std::vsnprintf(buffer, sizeof(buffer), fmt, args);
            va_end(args);

            Emit(level, category, buffer);

            if (level == LogLevel::Fatal)
            {
                std::fflush(stderr);
                std::abort();
            }
        }

        STRATA_NODISCARD static const char* LevelName(LogLevel level) noexcept
        {
            switch (level)
            {
                case LogLevel::Fatal: return "FATAL";
                case LogLevel::Error: return "ERROR";
                case LogLevel::Warn: return "WARN";
                case LogLevel::Info: return "INFO";
                case LogLevel::Debug: return "DEBUG";
                default: return "UNKNOWN";
            }
        }

    private:
        static void Emit(LogLevel level, const char* category, const char* message) noexcept
        {
            std::lock_guard<std::mutex> lock(s_mutex);
            if (s_sink)
            {
                s_sink(level, category, message, s_sinkUser);
                return;
            }

            std::FILE* stream = level <= LogLevel::Warn ? stderr : stdout;
            std::fprintf(stream, "Strata - [%s] %s: %s\n", category ? category : "-", LevelName(level), message);
            std::fflush(stream);
        }

        inline static std::atomic<LogLevel> s_minLevel{
#ifdef STRATA_BUILD_DEBUG
            LogLevel::Debug
#else
            LogLevel::Info
#endif
        };
        inline static std::atomic<bool> s_quiet{false};
        inline static std::mutex s_mutex{};
        inline static SinkFn s_sink = nullptr;
        inline static void* s_sinkUser = nullptr;
    };
}

#define STRATA_LOG(level, category, ...) ::Strata::Logger::Log(level, category, __VA_ARGS__)

#define STRATA_LOG_FATAL(category, ...) STRATA_LOG(::Strata::LogLevel::Fatal, category, __VA_ARGS__)
#define STRATA_LOG_ERROR(category, ...) STRATA_LOG(::Strata::LogLevel::Error, category, __VA_ARGS__)
#define STRATA_LOG_WARN(category, ...) STRATA_LOG(::Strata::LogLevel::Warn, category, __VA_ARGS__)
#define STRATA_LOG_INFO(category, ...) STRATA_LOG(::Strata::LogLevel::Info, category, __VA_ARGS__)

#ifdef STRATA_BUILD_DEBUG
    #define STRATA_LOG_DEBUG(category, ...) STRATA_LOG(::Strata::LogLevel::Debug, category, __VA_ARGS__)
#else
    #define STRATA_LOG_DEBUG(category, ...) ((void)0)
#endif
