#pragma once

#include "Aries/Core/GridStore.h"
#include "Aries/Runtime/EngineDiagnostics.h"
#include <cstdint>
#include <map>

namespace Aries::Runtime
{
    enum class LiveValueError
    {
        none,
        invalidKey,
        unsupportedType,
        nonFiniteNumber
    };

    struct LiveValueResult
    {
        LiveValueError error = LiveValueError::none;
        juce::String message;
        juce::var value;
        int appliedWidgets = 0;

        [[nodiscard]] bool wasOk() const noexcept
        {
            return error == LiveValueError::none;
        }
    };

    // Feeds external data streams into widgets bound by config.streamId. Values land in the widget's
    // config "data" entry as transient mutations, so they never enter history or mark the grid dirty.
    class LiveValueBridge
    {
    public:
        LiveValueBridge(Core::GridStore& storeIn, EngineDiagnostics& diagnosticsIn);

        LiveValueResult push(const juce::String& streamKey, const juce::var& value);

        void clear();
        [[nodiscard]] const std::map<juce::String, juce::var>& values() const noexcept;
        [[nodiscard]] std::optional<juce::var> latest(const juce::String& streamKey) const;
        [[nodiscard]] std::uint64_t revision() const noexcept;

    private:
        static LiveValueResult normalizeAndValidateValue(const juce::var& input);

        Core::GridStore& store;
        EngineDiagnostics& diagnostics;
        std::map<juce::String, juce::var> latestValues;
        std::uint64_t valueRevision = 1;
    };
}
