#pragma once

#include "Aries/Public/GridResult.h"
#include "Aries/Public/Types.h"

namespace Aries::Serialization
{
    enum class TimestampField
    {
        lastSaved,
        exportedAt
    };

    struct GridDocument
    {
        GridModel model;
        Viewport viewport;
        std::optional<juce::Time> timestamp;
    };

    inline constexpr const char* kDocumentFormatVersion = "1.0";

    juce::String timeToIsoString(juce::Time time);
    std::optional<juce::Time> timeFromIsoString(const juce::String& text);

    juce::var serializeGrid(const GridModel& model,
                            const Viewport& viewport,
                            TimestampField field,
                            juce::Time timestamp);

    juce::Result serializeGridToJsonString(const GridModel& model,
                                           const Viewport& viewport,
                                           TimestampField field,
                                           juce::Time timestamp,
                                           juce::String& jsonOut,
                                           bool allOnOneLine = true);

    GridResult parseGrid(const juce::var& root, GridDocument& documentOut);
    GridResult parseGridFromJsonString(const juce::String& json, GridDocument& documentOut);

    juce::Result saveGridToFile(const juce::File& file,
                                const GridModel& model,
                                const Viewport& viewport,
                                juce::Time exportedAt);
    GridResult loadGridFromFile(const juce::File& file, GridDocument& documentOut);
}
