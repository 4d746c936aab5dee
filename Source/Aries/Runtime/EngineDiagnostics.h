#pragma once

#include <juce_core/juce_core.h>
#include <cstdint>
#include <deque>
#include <functional>

namespace Aries::Runtime
{
    enum class LogLevel
    {
        trace,
        info,
        warning,
        error,
        fatal
    };

    struct LogEntry
    {
        LogLevel level = LogLevel::info;
        juce::String category;
        juce::String message;
        juce::Time time;
    };

    // Bounded in-memory log that doubles as the engine's notification channel for status surfaces.
    class EngineDiagnostics
    {
    public:
        struct Settings
        {
            LogLevel minimumLevel = LogLevel::info;
            int maxEntries = 500;
            int liveValueLogStride = 50;
        };

        class Sink
        {
        public:
            virtual ~Sink() = default;
            virtual void logEntryAdded(const LogEntry& entry) = 0;
        };

        using Clock = std::function<juce::Time()>;

        EngineDiagnostics();

        void setSettings(Settings nextSettings) noexcept;
        [[nodiscard]] const Settings& settings() const noexcept;
        void setClock(Clock newClock);

        void log(LogLevel level, const juce::String& category, const juce::String& message);
        void trace(const juce::String& category, const juce::String& message) { log(LogLevel::trace, category, message); }
        void info(const juce::String& category, const juce::String& message) { log(LogLevel::info, category, message); }
        void warning(const juce::String& category, const juce::String& message) { log(LogLevel::warning, category, message); }
        void error(const juce::String& category, const juce::String& message) { log(LogLevel::error, category, message); }
        void fatal(const juce::String& category, const juce::String& message) { log(LogLevel::fatal, category, message); }

        [[nodiscard]] const std::deque<LogEntry>& entries() const noexcept;
        [[nodiscard]] int countAtLevel(LogLevel level) const noexcept;
        [[nodiscard]] const LogEntry* lastEntry() const noexcept;
        void clear() noexcept;

        // Live values arrive at stream rate; only every Nth one is logged.
        [[nodiscard]] bool shouldLogLiveValue() noexcept;

        void addSink(Sink* sink);
        void removeSink(Sink* sink);

        static juce::String levelName(LogLevel level);
        static juce::String formatEntry(const LogEntry& entry);

    private:
        Settings diagnosticsSettings {};
        Clock clock;
        std::deque<LogEntry> logEntries;
        std::uint64_t liveValueCounter = 0;
        juce::ListenerList<Sink> sinks;
    };
}
