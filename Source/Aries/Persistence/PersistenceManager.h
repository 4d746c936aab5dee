#pragma once

#include "Aries/Core/GridStore.h"
#include "Aries/Persistence/StorageBackend.h"
#include "Aries/Runtime/EngineDiagnostics.h"
#include "Aries/Serialization/GridJson.h"
#include <optional>

namespace Aries::Persistence
{
    struct AutoSaveSettings
    {
        bool enabled = true;
        int intervalMs = 1000;
        int maxRetries = 3;
        int baseBackoffMs = 1000;
    };

    enum class AutoSaveStatus
    {
        idle,
        saving,
        saved,
        retrying,
        disabled
    };

    juce::String autoSaveStatusName(AutoSaveStatus status);

    class PersistenceManager
    {
    public:
        PersistenceManager(Core::GridStore& storeIn,
                           StorageBackend& storageIn,
                           Runtime::EngineDiagnostics& diagnosticsIn);

        GridResult save();
        GridResult loadSaved();

        void markDirty(juce::int64 nowMs);
        void markClean() noexcept;
        [[nodiscard]] bool isDirty() const noexcept;

        // Scheduler entry. Returns true when an auto-save attempt ran.
        bool tick(juce::int64 nowMs);

        void setAutoSaveSettings(const AutoSaveSettings& nextSettings);
        [[nodiscard]] const AutoSaveSettings& autoSaveSettings() const noexcept;
        void reenableAutoSave();
        [[nodiscard]] AutoSaveStatus autoSaveStatus() const noexcept;
        [[nodiscard]] int consecutiveFailures() const noexcept;
        [[nodiscard]] std::optional<juce::int64> nextAttemptMs() const noexcept;
        [[nodiscard]] const juce::String& lastError() const noexcept;

        GridResult exportDocument(juce::String& jsonOut) const;
        GridResult importDocument(const juce::String& json);

        GridResult saveProfile(const juce::String& name);
        GridResult loadProfile(const juce::String& name);
        GridResult deleteProfile(const juce::String& name);
        juce::StringArray profileNames() const;
        GridResult setActiveProfile(const juce::String& name);
        juce::String activeProfile() const;

    private:
        GridResult writeVerified(const juce::String& key, const juce::String& value);
        GridResult persistCurrentState(bool isAutoSave);
        juce::var readProfiles() const;
        GridResult writeProfiles(const juce::var& profiles);

        Core::GridStore& store;
        StorageBackend& storage;
        Runtime::EngineDiagnostics& diagnostics;

        AutoSaveSettings settings;
        AutoSaveStatus status = AutoSaveStatus::idle;
        bool dirty = false;
        int failures = 0;
        std::optional<juce::int64> scheduledAttemptMs;
        juce::int64 lastTickMs = 0;
        juce::String lastErrorMessage;
    };
}
