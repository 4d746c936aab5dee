#include "Aries/Settings/SettingsStore.h"

#include <algorithm>
#include <cmath>

namespace Aries
{
    namespace
    {
        Runtime::LogLevel logLevelFromName(const juce::String& name, Runtime::LogLevel fallback)
        {
            for (const auto level : { Runtime::LogLevel::trace, Runtime::LogLevel::info, Runtime::LogLevel::warning,
                                      Runtime::LogLevel::error, Runtime::LogLevel::fatal })
            {
                if (Runtime::EngineDiagnostics::levelName(level) == name.trim().toLowerCase())
                    return level;
            }

            return fallback;
        }

        float finiteOr(double value, float fallback) noexcept
        {
            return std::isfinite(value) ? static_cast<float>(value) : fallback;
        }
    }

    EngineSettings sanitizeSettings(EngineSettings settings)
    {
        settings.gridSize = std::isfinite(settings.gridSize) ? juce::jlimit(1.0f, 500.0f, settings.gridSize) : kDefaultGridSize;
        settings.interaction.throttleMs = juce::jlimit(0, 100, settings.interaction.throttleMs);
        settings.historyCapacity = juce::jlimit(1, 1000, settings.historyCapacity);
        settings.historyDebounceMs = juce::jlimit(0, 5000, settings.historyDebounceMs);
        settings.autoSave.intervalMs = juce::jlimit(100, 3600000, settings.autoSave.intervalMs);
        settings.autoSave.maxRetries = juce::jlimit(0, 10, settings.autoSave.maxRetries);
        settings.autoSave.baseBackoffMs = juce::jlimit(1, 60000, settings.autoSave.baseBackoffMs);
        settings.culling.bufferPx = std::isfinite(settings.culling.bufferPx) ? std::max(0.0f, settings.culling.bufferPx) : 300.0f;
        settings.culling.minItemsForVirtualization = std::max(0, settings.culling.minItemsForVirtualization);
        settings.culling.maxRenderCount = std::max(1, settings.culling.maxRenderCount);
        settings.maxLogEntries = std::max(1, settings.maxLogEntries);
        return settings;
    }

    SettingsStore::SettingsStore()
        : settingsFile(std::make_unique<juce::PropertiesFile>(defaultOptions()))
    {
    }

    SettingsStore::SettingsStore(const juce::File& file)
        : settingsFile(std::make_unique<juce::PropertiesFile>(file, defaultOptions()))
    {
    }

    EngineSettings SettingsStore::load() const
    {
        EngineSettings settings;
        auto& file = *settingsFile;

        settings.gridSize = finiteOr(file.getDoubleValue("grid.size", settings.gridSize), settings.gridSize);
        settings.interaction.throttleMs = file.getIntValue("interaction.throttleMs", settings.interaction.throttleMs);
        settings.interaction.autoGrowNests = file.getBoolValue("interaction.autoGrowNests", settings.interaction.autoGrowNests);
        settings.historyCapacity = file.getIntValue("history.capacity", settings.historyCapacity);
        settings.historyDebounceMs = file.getIntValue("history.debounceMs", settings.historyDebounceMs);
        settings.autoSave.enabled = file.getBoolValue("autoSave.enabled", settings.autoSave.enabled);
        settings.autoSave.intervalMs = file.getIntValue("autoSave.intervalMs", settings.autoSave.intervalMs);
        settings.autoSave.maxRetries = file.getIntValue("autoSave.maxRetries", settings.autoSave.maxRetries);
        settings.autoSave.baseBackoffMs = file.getIntValue("autoSave.baseBackoffMs", settings.autoSave.baseBackoffMs);
        settings.culling.bufferPx = finiteOr(file.getDoubleValue("culling.bufferPx", settings.culling.bufferPx), settings.culling.bufferPx);
        settings.culling.minItemsForVirtualization = file.getIntValue("culling.minItems", settings.culling.minItemsForVirtualization);
        settings.culling.maxRenderCount = file.getIntValue("culling.maxRenderCount", settings.culling.maxRenderCount);
        settings.logLevel = logLevelFromName(file.getValue("diagnostics.level"), settings.logLevel);
        settings.maxLogEntries = file.getIntValue("diagnostics.maxEntries", settings.maxLogEntries);

        return sanitizeSettings(settings);
    }

    juce::Result SettingsStore::save(const EngineSettings& input)
    {
        const auto settings = sanitizeSettings(input);
        auto& file = *settingsFile;

        file.setValue("grid.size", settings.gridSize);
        file.setValue("interaction.throttleMs", settings.interaction.throttleMs);
        file.setValue("interaction.autoGrowNests", settings.interaction.autoGrowNests);
        file.setValue("history.capacity", settings.historyCapacity);
        file.setValue("history.debounceMs", settings.historyDebounceMs);
        file.setValue("autoSave.enabled", settings.autoSave.enabled);
        file.setValue("autoSave.intervalMs", settings.autoSave.intervalMs);
        file.setValue("autoSave.maxRetries", settings.autoSave.maxRetries);
        file.setValue("autoSave.baseBackoffMs", settings.autoSave.baseBackoffMs);
        file.setValue("culling.bufferPx", settings.culling.bufferPx);
        file.setValue("culling.minItems", settings.culling.minItemsForVirtualization);
        file.setValue("culling.maxRenderCount", settings.culling.maxRenderCount);
        file.setValue("diagnostics.level", Runtime::EngineDiagnostics::levelName(settings.logLevel));
        file.setValue("diagnostics.maxEntries", settings.maxLogEntries);

        if (!file.saveIfNeeded())
            return juce::Result::fail("Failed to write settings: " + file.getFile().getFullPathName());

        return juce::Result::ok();
    }

    juce::File SettingsStore::getFile() const
    {
        return settingsFile->getFile();
    }

    juce::PropertiesFile::Options SettingsStore::defaultOptions()
    {
        juce::PropertiesFile::Options options;
        options.applicationName = "AriesGrid";
        options.folderName = "AriesGrid";
        options.filenameSuffix = "settings";
        options.osxLibrarySubFolder = "Application Support";
        options.millisecondsBeforeSaving = -1;
        return options;
    }
}
