#include "Aries/Runtime/EngineDiagnostics.h"

#include <algorithm>

namespace Aries::Runtime
{
    EngineDiagnostics::EngineDiagnostics()
        : clock([] { return juce::Time::getCurrentTime(); })
    {
    }

    void EngineDiagnostics::setSettings(Settings nextSettings) noexcept
    {
        nextSettings.maxEntries = std::max(1, nextSettings.maxEntries);
        nextSettings.liveValueLogStride = std::max(1, nextSettings.liveValueLogStride);
        diagnosticsSettings = nextSettings;

        while (static_cast<int>(logEntries.size()) > diagnosticsSettings.maxEntries)
            logEntries.pop_front();
    }

    const EngineDiagnostics::Settings& EngineDiagnostics::settings() const noexcept
    {
        return diagnosticsSettings;
    }

    void EngineDiagnostics::setClock(Clock newClock)
    {
        if (newClock != nullptr)
            clock = std::move(newClock);
    }

    void EngineDiagnostics::log(LogLevel level, const juce::String& category, const juce::String& message)
    {
        // Errors and fatals always reach the status surface.
        if (level < diagnosticsSettings.minimumLevel && level < LogLevel::error)
            return;

        LogEntry entry { level, category, message, clock() };
        DBG(formatEntry(entry));

        logEntries.push_back(entry);
        while (static_cast<int>(logEntries.size()) > diagnosticsSettings.maxEntries)
            logEntries.pop_front();

        sinks.call([&entry](Sink& sink)
                   {
                       sink.logEntryAdded(entry);
                   });
    }

    const std::deque<LogEntry>& EngineDiagnostics::entries() const noexcept
    {
        return logEntries;
    }

    int EngineDiagnostics::countAtLevel(LogLevel level) const noexcept
    {
        return static_cast<int>(std::count_if(logEntries.begin(),
                                              logEntries.end(),
                                              [level](const LogEntry& entry)
                                              {
                                                  return entry.level == level;
                                              }));
    }

    const LogEntry* EngineDiagnostics::lastEntry() const noexcept
    {
        return logEntries.empty() ? nullptr : &logEntries.back();
    }

    void EngineDiagnostics::clear() noexcept
    {
        logEntries.clear();
        liveValueCounter = 0;
    }

    bool EngineDiagnostics::shouldLogLiveValue() noexcept
    {
        if (diagnosticsSettings.minimumLevel > LogLevel::trace)
            return false;

        liveValueCounter += 1;
        return ((liveValueCounter - 1) % static_cast<std::uint64_t>(diagnosticsSettings.liveValueLogStride)) == 0;
    }

    void EngineDiagnostics::addSink(Sink* sink)
    {
        sinks.add(sink);
    }

    void EngineDiagnostics::removeSink(Sink* sink)
    {
        sinks.remove(sink);
    }

    juce::String EngineDiagnostics::levelName(LogLevel level)
    {
        switch (level)
        {
            case LogLevel::trace: return "trace";
            case LogLevel::info: return "info";
            case LogLevel::warning: return "warning";
            case LogLevel::error: return "error";
            case LogLevel::fatal: return "fatal";
        }

        return "unknown";
    }

    juce::String EngineDiagnostics::formatEntry(const LogEntry& entry)
    {
        return "[Aries][" + entry.category + "] " + levelName(entry.level) + ": " + entry.message;
    }
}
