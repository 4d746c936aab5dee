#include "Aries/Runtime/LiveValueBridge.h"

#include <cmath>

namespace Aries::Runtime
{
    namespace
    {
        LiveValueResult makeError(LiveValueError error, const juce::String& message)
        {
            LiveValueResult result;
            result.error = error;
            result.message = message;
            return result;
        }
    }

    LiveValueBridge::LiveValueBridge(Core::GridStore& storeIn, EngineDiagnostics& diagnosticsIn)
        : store(storeIn),
          diagnostics(diagnosticsIn)
    {
    }

    LiveValueResult LiveValueBridge::normalizeAndValidateValue(const juce::var& input)
    {
        if (input.isVoid() || input.isUndefined())
            return makeError(LiveValueError::unsupportedType, "live value is empty");

        LiveValueResult result;

        if (input.isBool() || input.isInt() || input.isInt64() || input.isString())
        {
            result.value = input;
            return result;
        }

        if (input.isDouble())
        {
            const auto value = static_cast<double>(input);
            if (!std::isfinite(value))
                return makeError(LiveValueError::nonFiniteNumber, "live value must be finite");

            result.value = value;
            return result;
        }

        return makeError(LiveValueError::unsupportedType, "live value must be bool/int/int64/double/string");
    }

    LiveValueResult LiveValueBridge::push(const juce::String& streamKey, const juce::var& value)
    {
        const auto normalizedKey = streamKey.trim();
        if (normalizedKey.isEmpty())
            return makeError(LiveValueError::invalidKey, "stream key is empty");

        auto result = normalizeAndValidateValue(value);
        if (!result.wasOk())
        {
            diagnostics.warning("LiveValue", "Rejected value for stream '" + normalizedKey + "': " + result.message);
            return result;
        }

        const auto existingIt = latestValues.find(normalizedKey);
        if (existingIt == latestValues.end() || existingIt->second != result.value)
        {
            latestValues[normalizedKey] = result.value;
            ++valueRevision;
        }

        const auto before = store.snapshot();
        const auto applied = store.dispatch(ApplyLiveValueAction { normalizedKey, result.value }, MutationPhase::transient);
        if (applied.failed())
            return makeError(LiveValueError::unsupportedType, applied.getErrorMessage());

        if (store.snapshot() != before)
        {
            for (const auto* list : { &store.model().mainItems, &store.model().nestedItems })
            {
                for (const auto& widget : *list)
                {
                    const auto* streamId = widget.config.getVarPointer("streamId");
                    if (streamId != nullptr && streamId->toString() == normalizedKey)
                        ++result.appliedWidgets;
                }
            }
        }

        if (diagnostics.shouldLogLiveValue())
        {
            diagnostics.trace("LiveValue",
                              "stream '" + normalizedKey + "' = " + result.value.toString()
                                  + " -> " + juce::String(result.appliedWidgets) + " widgets");
        }

        return result;
    }

    void LiveValueBridge::clear()
    {
        if (latestValues.empty())
            return;

        latestValues.clear();
        ++valueRevision;
    }

    const std::map<juce::String, juce::var>& LiveValueBridge::values() const noexcept
    {
        return latestValues;
    }

    std::optional<juce::var> LiveValueBridge::latest(const juce::String& streamKey) const
    {
        const auto it = latestValues.find(streamKey.trim());
        if (it == latestValues.end())
            return std::nullopt;
        return it->second;
    }

    std::uint64_t LiveValueBridge::revision() const noexcept
    {
        return valueRevision;
    }
}
