#include "SmokeSupport.h"

#include "Aries/Settings/SettingsStore.h"

#include <limits>

namespace AriesSmoke
{
    namespace
    {
        using Aries::Runtime::LiveValueError;
        using Aries::Runtime::LogLevel;

        class CollectingSink : public Aries::Runtime::EngineDiagnostics::Sink
        {
        public:
            void logEntryAdded(const Aries::Runtime::LogEntry& entry) override
            {
                lines.add(Aries::Runtime::EngineDiagnostics::formatEntry(entry));
            }

            juce::StringArray lines;
        };

        juce::Result testLiveValuesAreTransient()
        {
            Aries::GridHandle handle(nullptr, immediateSettings());
            ManualClock clock;
            clock.attach(handle);

            Aries::NewWidgetOptions options;
            options.type = "sensor";
            options.position = juce::Point<float>(0.0f, 0.0f);
            options.config.set("streamId", "temp-1");

            Aries::ItemId bound;
            if (handle.addWidget(options, &bound).failed())
                return juce::Result::fail("addWidget failed");

            options.config.clear();
            options.position = juce::Point<float>(400.0f, 0.0f);
            if (handle.addWidget(options).failed())
                return juce::Result::fail("unbound addWidget failed");

            if (handle.save().failed())
                return juce::Result::fail("save failed");

            const auto historySize = handle.history().size();
            auto& bridge = handle.liveValues();
            const auto revisionBefore = bridge.revision();

            const auto pushed = bridge.push(" temp-1 ", 21.5);
            if (!pushed.wasOk() || pushed.appliedWidgets != 1)
                return juce::Result::fail("push should reach exactly one bound widget");

            const auto* widget = Aries::Core::GridQueries::findWidget(handle.model(), bound);
            if (widget == nullptr || !nearlyEqual(static_cast<float>(static_cast<double>(widget->config["data"])), 21.5f))
                return juce::Result::fail("bound widget should carry the live value");

            if (handle.history().size() != historySize || handle.history().hasPending())
                return juce::Result::fail("live values must not enter history");
            if (handle.persistence().isDirty())
                return juce::Result::fail("live values must not mark the grid dirty");

            if (bridge.revision() != revisionBefore + 1 || bridge.latest("temp-1") != juce::var(21.5))
                return juce::Result::fail("latest value bookkeeping mismatch");

            const auto unbound = bridge.push("nobody", true);
            if (!unbound.wasOk() || unbound.appliedWidgets != 0)
                return juce::Result::fail("a stream without widgets is still accepted");

            if (bridge.push("   ", 1).error != LiveValueError::invalidKey)
                return juce::Result::fail("blank stream key must be rejected");
            if (bridge.push("temp-1", std::numeric_limits<double>::quiet_NaN()).error != LiveValueError::nonFiniteNumber)
                return juce::Result::fail("NaN must be rejected");
            if (bridge.push("temp-1", juce::var(juce::Array<juce::var> { 1, 2 })).error != LiveValueError::unsupportedType)
                return juce::Result::fail("arrays must be rejected");
            if (handle.diagnostics().countAtLevel(LogLevel::warning) < 2)
                return juce::Result::fail("rejected values should be logged as warnings");

            bridge.clear();
            if (!bridge.values().empty() || bridge.latest("temp-1").has_value())
                return juce::Result::fail("clear should drop cached values");

            return juce::Result::ok();
        }

        juce::Result testDiagnosticsFilterAndBound()
        {
            Aries::Runtime::EngineDiagnostics diagnostics;
            diagnostics.setClock([] { return juce::Time(1700000000000); });

            auto settings = diagnostics.settings();
            settings.minimumLevel = LogLevel::warning;
            settings.maxEntries = 3;
            diagnostics.setSettings(settings);

            CollectingSink sink;
            diagnostics.addSink(&sink);

            diagnostics.info("Grid", "hidden");
            diagnostics.warning("Grid", "first");
            diagnostics.error("Persistence", "second");
            diagnostics.warning("Grid", "third");
            diagnostics.fatal("Persistence", "fourth");
            diagnostics.removeSink(&sink);

            if (diagnostics.entries().size() != 3)
                return juce::Result::fail("log should be bounded to 3 entries");
            if (diagnostics.entries().front().message != "second")
                return juce::Result::fail("the oldest entries should be evicted first");
            if (sink.lines.size() != 4 || sink.lines[0] != "[Aries][Grid] warning: first")
                return juce::Result::fail("sink output mismatch");
            if (diagnostics.lastEntry() == nullptr || diagnostics.lastEntry()->level != LogLevel::fatal)
                return juce::Result::fail("last entry should be the fatal one");

            settings.minimumLevel = LogLevel::fatal;
            diagnostics.setSettings(settings);
            diagnostics.error("Persistence", "always kept");
            if (diagnostics.lastEntry()->message != "always kept")
                return juce::Result::fail("errors must bypass the level filter");
            if (diagnostics.shouldLogLiveValue())
                return juce::Result::fail("live values are only logged at trace level");

            settings.minimumLevel = LogLevel::trace;
            settings.liveValueLogStride = 3;
            diagnostics.setSettings(settings);
            diagnostics.clear();

            int logged = 0;
            for (int i = 0; i < 7; ++i)
                logged += diagnostics.shouldLogLiveValue() ? 1 : 0;
            if (logged != 3)
                return juce::Result::fail("live value stride should log every third value");

            return juce::Result::ok();
        }

        juce::Result testSettingsStoreRoundTrip()
        {
            const auto file = juce::File::getSpecialLocation(juce::File::tempDirectory)
                                  .getNonexistentChildFile("aries-grid-settings", ".settings");

            Aries::EngineSettings settings;
            settings.gridSize = 25.0f;
            settings.interaction.throttleMs = 500;
            settings.interaction.autoGrowNests = false;
            settings.historyCapacity = 10;
            settings.autoSave.intervalMs = 5;
            settings.autoSave.maxRetries = 2;
            settings.culling.minItemsForVirtualization = 12;
            settings.logLevel = LogLevel::warning;

            {
                Aries::SettingsStore store(file);
                const auto saved = store.save(settings);
                if (saved.failed())
                {
                    file.deleteFile();
                    return saved;
                }
            }

            const auto loaded = Aries::SettingsStore(file).load();
            file.deleteFile();

            if (!nearlyEqual(loaded.gridSize, 25.0f) || loaded.historyCapacity != 10 || loaded.autoSave.maxRetries != 2)
                return juce::Result::fail("stored values were not read back");
            if (loaded.interaction.throttleMs != 100 || loaded.autoSave.intervalMs != 100)
                return juce::Result::fail("out-of-range values should be clamped");
            if (loaded.interaction.autoGrowNests || loaded.culling.minItemsForVirtualization != 12)
                return juce::Result::fail("flags and culling settings mismatch");
            if (loaded.logLevel != LogLevel::warning || loaded.historyDebounceMs != 100)
                return juce::Result::fail("log level or untouched defaults mismatch");

            return juce::Result::ok();
        }

        juce::Result testSettingsReachTheEngine()
        {
            auto settings = immediateSettings();
            settings.gridSize = 10.0f;
            settings.historyCapacity = 2;
            settings.autoSave.enabled = false;

            Aries::GridHandle handle(nullptr, settings);
            ManualClock clock;
            clock.attach(handle);

            if (!nearlyEqual(handle.model().gridSize, 10.0f))
                return juce::Result::fail("a new handle should adopt the configured grid size");
            if (handle.history().capacity() != 2)
                return juce::Result::fail("history capacity was not applied");

            Aries::NewWidgetOptions options;
            options.position = juce::Point<float>(0.0f, 0.0f);
            if (handle.addWidget(options).failed())
                return juce::Result::fail("addWidget failed");

            handle.tick(clock.now + 10000);
            if (!handle.persistence().isDirty() || handle.persistence().autoSaveStatus() != Aries::Persistence::AutoSaveStatus::idle)
                return juce::Result::fail("disabled auto-save must not run");

            settings.autoSave.enabled = true;
            settings.gridSize = 40.0f;
            handle.applySettings(settings);
            if (!nearlyEqual(handle.model().gridSize, 10.0f))
                return juce::Result::fail("the grid size belongs to the document once created");

            handle.tick(clock.now + 20000);
            if (handle.persistence().isDirty() || handle.persistence().autoSaveStatus() != Aries::Persistence::AutoSaveStatus::saved)
                return juce::Result::fail("re-enabled auto-save should persist the dirty grid");

            return juce::Result::ok();
        }
    }

    std::vector<SmokeTest> runtimeTests()
    {
        return {
            { "Live values are transient", testLiveValuesAreTransient },
            { "Diagnostics filter and bound", testDiagnosticsFilterAndBound },
            { "Settings store round trip", testSettingsStoreRoundTrip },
            { "Settings reach the engine", testSettingsReachTheEngine }
        };
    }
}
