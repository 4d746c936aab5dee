#pragma once

#include "Aries/Settings/EngineSettings.h"
#include <juce_data_structures/juce_data_structures.h>
#include <memory>

namespace Aries
{
    // EngineSettings backed by a juce::PropertiesFile. Missing keys keep their defaults.
    class SettingsStore
    {
    public:
        SettingsStore();
        explicit SettingsStore(const juce::File& file);

        EngineSettings load() const;
        juce::Result save(const EngineSettings& settings);

        juce::File getFile() const;

        static juce::PropertiesFile::Options defaultOptions();

    private:
        std::unique_ptr<juce::PropertiesFile> settingsFile;
    };
}
