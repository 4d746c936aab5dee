#pragma once

#include <juce_core/juce_core.h>

namespace Aries
{
    enum class GridError
    {
        none,
        geometry,
        cycle,
        notFound,
        invalidArgument,
        persistenceQuota,
        persistenceVerification,
        persistenceIo,
        parse,
        gestureAbort
    };

    struct GridResult
    {
        GridError error = GridError::none;
        juce::String message;

        [[nodiscard]] bool wasOk() const noexcept { return error == GridError::none; }
        [[nodiscard]] bool failed() const noexcept { return error != GridError::none; }
        const juce::String& getErrorMessage() const noexcept { return message; }

        static GridResult ok() { return {}; }

        static GridResult fail(GridError kind, const juce::String& text)
        {
            GridResult result;
            result.error = kind;
            result.message = text;
            return result;
        }

        static GridResult fromResult(const juce::Result& result, GridError kindOnFailure)
        {
            if (result.wasOk())
                return ok();
            return fail(kindOnFailure, result.getErrorMessage());
        }

        const char* errorName() const noexcept
        {
            switch (error)
            {
                case GridError::none: return "None";
                case GridError::geometry: return "GeometryError";
                case GridError::cycle: return "CycleError";
                case GridError::notFound: return "NotFoundError";
                case GridError::invalidArgument: return "InvalidArgumentError";
                case GridError::persistenceQuota: return "PersistenceQuotaError";
                case GridError::persistenceVerification: return "PersistenceVerificationError";
                case GridError::persistenceIo: return "PersistenceIoError";
                case GridError::parse: return "ParseError";
                case GridError::gestureAbort: return "GestureAbort";
            }

            return "UnknownError";
        }

        juce::Result toResult() const
        {
            if (wasOk())
                return juce::Result::ok();
            return juce::Result::fail(juce::String(errorName()) + ": " + message);
        }
    };
}
