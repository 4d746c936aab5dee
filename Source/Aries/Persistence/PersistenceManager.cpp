#include "Aries/Persistence/PersistenceManager.h"

#include <algorithm>

namespace Aries::Persistence
{
    namespace
    {
        constexpr auto kLogCategory = "Persistence";

        juce::String describe(const GridResult& result)
        {
            return juce::String(result.errorName()) + ": " + result.getErrorMessage();
        }
    }

    juce::String autoSaveStatusName(AutoSaveStatus status)
    {
        switch (status)
        {
            case AutoSaveStatus::idle: return "idle";
            case AutoSaveStatus::saving: return "saving";
            case AutoSaveStatus::saved: return "saved";
            case AutoSaveStatus::retrying: return "retrying";
            case AutoSaveStatus::disabled: return "disabled";
        }

        return "unknown";
    }

    PersistenceManager::PersistenceManager(Core::GridStore& storeIn,
                                           StorageBackend& storageIn,
                                           Runtime::EngineDiagnostics& diagnosticsIn)
        : store(storeIn),
          storage(storageIn),
          diagnostics(diagnosticsIn)
    {
    }

    GridResult PersistenceManager::save()
    {
        const auto result = persistCurrentState(false);
        if (result.failed())
        {
            lastErrorMessage = describe(result);
            diagnostics.error(kLogCategory, "Save failed: " + lastErrorMessage);
            return result;
        }

        // A successful explicit save supersedes any pending auto-save retry.
        if (status == AutoSaveStatus::retrying)
        {
            failures = 0;
            status = AutoSaveStatus::saved;
        }
        scheduledAttemptMs.reset();

        const auto profile = activeProfile();
        diagnostics.info(kLogCategory,
                         profile.isNotEmpty() ? "Grid state saved to profile \"" + profile + "\""
                                              : juce::String("Grid state saved"));
        return result;
    }

    GridResult PersistenceManager::loadSaved()
    {
        const auto stored = storage.read(kGridStateKey);
        if (!stored.has_value())
            return GridResult::fail(GridError::notFound, "no saved grid state");

        Serialization::GridDocument document;
        auto result = Serialization::parseGridFromJsonString(*stored, document);
        if (result.wasOk())
            result = store.replaceState(document.model, ReplaceOrigin::load, document.viewport);

        if (result.failed())
        {
            diagnostics.error(kLogCategory, "Loading saved grid failed: " + describe(result));
            return result;
        }

        markClean();
        diagnostics.info(kLogCategory, "Loaded saved grid (" + juce::String(store.widgetCount()) + " widgets)");
        return result;
    }

    void PersistenceManager::markDirty(juce::int64 nowMs)
    {
        lastTickMs = std::max(lastTickMs, nowMs);
        dirty = true;

        if (!settings.enabled || status == AutoSaveStatus::disabled || status == AutoSaveStatus::retrying)
            return;

        if (!scheduledAttemptMs.has_value())
            scheduledAttemptMs = nowMs + settings.intervalMs;
    }

    void PersistenceManager::markClean() noexcept
    {
        dirty = false;
        if (status != AutoSaveStatus::retrying)
            scheduledAttemptMs.reset();
    }

    bool PersistenceManager::isDirty() const noexcept
    {
        return dirty;
    }

    bool PersistenceManager::tick(juce::int64 nowMs)
    {
        lastTickMs = std::max(lastTickMs, nowMs);

        if (!settings.enabled || status == AutoSaveStatus::disabled)
            return false;
        if (!scheduledAttemptMs.has_value() || nowMs < *scheduledAttemptMs)
            return false;

        if (!dirty)
        {
            scheduledAttemptMs.reset();
            return false;
        }

        status = AutoSaveStatus::saving;
        const auto result = persistCurrentState(true);

        if (result.wasOk())
        {
            failures = 0;
            status = AutoSaveStatus::saved;
            scheduledAttemptMs.reset();
            diagnostics.trace(kLogCategory, "Auto-save complete");
            return true;
        }

        ++failures;
        lastErrorMessage = describe(result);

        if (failures > settings.maxRetries)
        {
            status = AutoSaveStatus::disabled;
            scheduledAttemptMs.reset();
            diagnostics.fatal(kLogCategory,
                              "Auto-save disabled after " + juce::String(failures) + " failed attempts: " + lastErrorMessage);
            return true;
        }

        const auto delayMs = static_cast<juce::int64>(settings.baseBackoffMs) << (failures - 1);
        status = AutoSaveStatus::retrying;
        scheduledAttemptMs = nowMs + delayMs;
        diagnostics.warning(kLogCategory,
                            "Auto-save failed (" + lastErrorMessage + "), retry " + juce::String(failures)
                                + " of " + juce::String(settings.maxRetries) + " in " + juce::String(delayMs) + " ms");
        return true;
    }

    void PersistenceManager::setAutoSaveSettings(const AutoSaveSettings& nextSettings)
    {
        settings = nextSettings;
        settings.intervalMs = std::max(1, settings.intervalMs);
        settings.maxRetries = std::max(0, settings.maxRetries);
        settings.baseBackoffMs = std::max(1, settings.baseBackoffMs);

        if (!settings.enabled)
        {
            scheduledAttemptMs.reset();
            return;
        }

        if (dirty && !scheduledAttemptMs.has_value() && status != AutoSaveStatus::disabled)
            scheduledAttemptMs = lastTickMs + settings.intervalMs;
    }

    const AutoSaveSettings& PersistenceManager::autoSaveSettings() const noexcept
    {
        return settings;
    }

    void PersistenceManager::reenableAutoSave()
    {
        settings.enabled = true;
        status = AutoSaveStatus::idle;
        failures = 0;
        lastErrorMessage.clear();
        scheduledAttemptMs.reset();
        if (dirty)
            scheduledAttemptMs = lastTickMs + settings.intervalMs;

        diagnostics.info(kLogCategory, "Auto-save re-enabled");
    }

    AutoSaveStatus PersistenceManager::autoSaveStatus() const noexcept
    {
        return status;
    }

    int PersistenceManager::consecutiveFailures() const noexcept
    {
        return failures;
    }

    std::optional<juce::int64> PersistenceManager::nextAttemptMs() const noexcept
    {
        return scheduledAttemptMs;
    }

    const juce::String& PersistenceManager::lastError() const noexcept
    {
        return lastErrorMessage;
    }

    GridResult PersistenceManager::exportDocument(juce::String& jsonOut) const
    {
        const auto serialized = Serialization::serializeGridToJsonString(store.model(),
                                                                         store.viewport(),
                                                                         Serialization::TimestampField::exportedAt,
                                                                         store.now(),
                                                                         jsonOut,
                                                                         false);
        if (serialized.failed())
        {
            diagnostics.error(kLogCategory, "Export failed: " + serialized.getErrorMessage());
            return GridResult::fromResult(serialized, GridError::invalidArgument);
        }

        diagnostics.info(kLogCategory, "Exported layout (" + juce::String(store.widgetCount()) + " widgets)");
        return GridResult::ok();
    }

    GridResult PersistenceManager::importDocument(const juce::String& json)
    {
        Serialization::GridDocument document;
        auto result = Serialization::parseGridFromJsonString(json, document);
        if (result.wasOk())
            result = store.replaceState(document.model, ReplaceOrigin::import, document.viewport);

        if (result.failed())
        {
            diagnostics.error(kLogCategory, "Import failed: " + describe(result));
            return result;
        }

        diagnostics.info(kLogCategory, "Imported layout (" + juce::String(store.widgetCount()) + " widgets)");
        return result;
    }

    GridResult PersistenceManager::saveProfile(const juce::String& name)
    {
        const auto profileName = name.trim();
        if (profileName.isEmpty())
            return GridResult::fail(GridError::invalidArgument, "profile name must not be empty");

        const auto validation = Core::GridValidator::validateGrid(store.model());
        if (validation.failed())
            return validation;

        auto profiles = readProfiles();
        profiles.getDynamicObject()->setProperty(profileName,
                                                 Serialization::serializeGrid(store.model(),
                                                                              store.viewport(),
                                                                              Serialization::TimestampField::lastSaved,
                                                                              store.now()));
        auto result = writeProfiles(profiles);
        if (result.wasOk())
            result = storage.write(kActiveProfileKey, profileName);

        if (result.failed())
        {
            diagnostics.error(kLogCategory, "Saving profile \"" + profileName + "\" failed: " + describe(result));
            return result;
        }

        diagnostics.info(kLogCategory, "Profile \"" + profileName + "\" saved");
        return result;
    }

    GridResult PersistenceManager::loadProfile(const juce::String& name)
    {
        const auto profileName = name.trim();
        const auto profiles = readProfiles();
        const auto* object = profiles.getDynamicObject();
        if (object == nullptr || !object->hasProperty(profileName))
            return GridResult::fail(GridError::notFound, "profile not found: " + profileName);

        Serialization::GridDocument document;
        auto result = Serialization::parseGrid(object->getProperty(profileName), document);
        if (result.wasOk())
            result = store.replaceState(document.model, ReplaceOrigin::profile, document.viewport);
        if (result.wasOk())
            result = storage.write(kActiveProfileKey, profileName);

        if (result.failed())
        {
            diagnostics.error(kLogCategory, "Loading profile \"" + profileName + "\" failed: " + describe(result));
            return result;
        }

        diagnostics.info(kLogCategory, "Profile \"" + profileName + "\" loaded");
        return result;
    }

    GridResult PersistenceManager::deleteProfile(const juce::String& name)
    {
        const auto profileName = name.trim();
        auto profiles = readProfiles();
        auto* object = profiles.getDynamicObject();
        if (object == nullptr || !object->hasProperty(profileName))
            return GridResult::fail(GridError::notFound, "profile not found: " + profileName);

        object->removeProperty(profileName);
        auto result = writeProfiles(profiles);
        if (result.wasOk() && activeProfile() == profileName)
            result = storage.remove(kActiveProfileKey);

        if (result.failed())
        {
            diagnostics.error(kLogCategory, "Deleting profile \"" + profileName + "\" failed: " + describe(result));
            return result;
        }

        diagnostics.info(kLogCategory, "Profile \"" + profileName + "\" deleted");
        return result;
    }

    juce::StringArray PersistenceManager::profileNames() const
    {
        juce::StringArray names;
        if (const auto* object = readProfiles().getDynamicObject())
        {
            const auto& props = object->getProperties();
            for (int i = 0; i < props.size(); ++i)
                names.add(props.getName(i).toString());
        }

        names.sort(true);
        return names;
    }

    GridResult PersistenceManager::setActiveProfile(const juce::String& name)
    {
        const auto profileName = name.trim();
        if (profileName.isEmpty())
            return storage.remove(kActiveProfileKey);

        if (!profileNames().contains(profileName))
            return GridResult::fail(GridError::notFound, "profile not found: " + profileName);

        return storage.write(kActiveProfileKey, profileName);
    }

    juce::String PersistenceManager::activeProfile() const
    {
        return storage.read(kActiveProfileKey).value_or(juce::String());
    }

    GridResult PersistenceManager::writeVerified(const juce::String& key, const juce::String& value)
    {
        const auto written = storage.write(key, value);
        if (written.failed())
            return written;

        const auto stored = storage.readBack(key);
        if (!stored.has_value() || *stored != value)
            return GridResult::fail(GridError::persistenceVerification, "read-back mismatch for '" + key + "'");

        return GridResult::ok();
    }

    GridResult PersistenceManager::persistCurrentState(bool isAutoSave)
    {
        juce::String json;
        const auto serialized = Serialization::serializeGridToJsonString(store.model(),
                                                                         store.viewport(),
                                                                         Serialization::TimestampField::lastSaved,
                                                                         store.now(),
                                                                         json);
        if (serialized.failed())
            return GridResult::fromResult(serialized, GridError::invalidArgument);

        auto result = writeVerified(kGridStateKey, json);
        if (result.failed())
            return result;

        const auto profile = activeProfile();
        if (profile.isNotEmpty())
        {
            auto profiles = readProfiles();
            if (auto* object = profiles.getDynamicObject(); object != nullptr && object->hasProperty(profile))
            {
                object->setProperty(profile, juce::JSON::parse(json));
                result = writeProfiles(profiles);
                if (result.failed())
                    return result;
            }
        }

        dirty = false;
        if (!isAutoSave)
            lastErrorMessage.clear();

        return GridResult::ok();
    }

    juce::var PersistenceManager::readProfiles() const
    {
        if (const auto stored = storage.read(kProfilesKey))
        {
            const auto parsed = juce::JSON::parse(*stored);
            if (parsed.getDynamicObject() != nullptr)
                return parsed;

            DBG("[Aries][Persistence] ignoring malformed profile store");
        }

        return juce::var(new juce::DynamicObject());
    }

    GridResult PersistenceManager::writeProfiles(const juce::var& profiles)
    {
        return writeVerified(kProfilesKey, juce::JSON::toString(profiles, true));
    }
}
