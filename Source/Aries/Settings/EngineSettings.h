#pragma once

#include "Aries/Editor/Interaction/InteractionController.h"
#include "Aries/Editor/Perf/CullingEngine.h"
#include "Aries/Persistence/PersistenceManager.h"
#include "Aries/Runtime/EngineDiagnostics.h"

namespace Aries
{
    struct EngineSettings
    {
        float gridSize = kDefaultGridSize;
        Editor::Interaction::InteractionSettings interaction;
        int historyCapacity = 50;
        int historyDebounceMs = 100;
        Persistence::AutoSaveSettings autoSave;
        Editor::Perf::CullingSettings culling;
        Runtime::LogLevel logLevel = Runtime::LogLevel::info;
        int maxLogEntries = 500;
    };

    // Clamps every field into its supported range.
    EngineSettings sanitizeSettings(EngineSettings settings);
}
