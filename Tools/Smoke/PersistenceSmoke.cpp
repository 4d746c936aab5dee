#include "SmokeSupport.h"

#include "Aries/Serialization/GridJson.h"

namespace AriesSmoke
{
    namespace
    {
        using Aries::GridError;
        using Aries::Persistence::AutoSaveStatus;

        // Every write fails like a full or read-only disk.
        class FailingStorage : public Aries::Persistence::MemoryStorage
        {
        public:
            Aries::GridResult write(const juce::String& key, const juce::String& value) override
            {
                juce::ignoreUnused(key, value);
                ++attempts;
                return Aries::GridResult::fail(GridError::persistenceIo, "disk unavailable");
            }

            int attempts = 0;
        };

        // Reads back something other than what was written for the grid state key.
        class CorruptingStorage : public Aries::Persistence::MemoryStorage
        {
        public:
            std::optional<juce::String> read(const juce::String& key) const override
            {
                auto value = MemoryStorage::read(key);
                if (value.has_value() && key == Aries::Persistence::kGridStateKey)
                    *value << " ";
                return value;
            }
        };

        // Writes go through, but another process truncates the file right after each grid state save.
        class TruncatedFileStorage : public Aries::Persistence::PropertiesFileStorage
        {
        public:
            using PropertiesFileStorage::PropertiesFileStorage;

            Aries::GridResult write(const juce::String& key, const juce::String& value) override
            {
                const auto result = PropertiesFileStorage::write(key, value);
                if (result.wasOk() && key == Aries::Persistence::kGridStateKey)
                    getFile().replaceWithText({});
                return result;
            }
        };

        juce::Result seedTwoWidgets(Aries::GridHandle& handle)
        {
            Aries::NewWidgetOptions first;
            first.type = "sensor";
            first.position = juce::Point<float>(0.0f, 0.0f);
            first.config.set("streamId", "temp-1");
            first.config.set("unit", "C");

            Aries::NewWidgetOptions second;
            second.type = "gauge";
            second.position = juce::Point<float>(400.0f, 0.0f);

            if (handle.addWidget(first).failed() || handle.addWidget(second).failed())
                return juce::Result::fail("seeding widgets failed");

            Aries::NewNestOptions nest;
            nest.position = juce::Point<float>(0.0f, 400.0f);
            Aries::ItemId nestId;
            if (handle.addNest(nest, &nestId).failed())
                return juce::Result::fail("seeding nest failed");

            auto inner = makeWidget({}, { 20.0f, 20.0f, 120.0f, 80.0f }, nestId);
            if (handle.store().addItem(inner).failed())
                return juce::Result::fail("seeding nested widget failed");

            return juce::Result::ok();
        }

        juce::Result compareModels(const Aries::GridModel& expected, const Aries::GridModel& actual)
        {
            if (expected.mainItems.size() != actual.mainItems.size()
                || expected.nestedItems.size() != actual.nestedItems.size()
                || expected.nestContainers.size() != actual.nestContainers.size())
            {
                return juce::Result::fail("item counts differ");
            }

            if (!nearlyEqual(expected.gridSize, actual.gridSize))
                return juce::Result::fail("grid size differs");

            for (const auto* list : { &expected.mainItems, &expected.nestedItems })
            {
                for (const auto& widget : *list)
                {
                    const auto* other = Aries::Core::GridQueries::findWidget(actual, widget.id);
                    if (other == nullptr)
                        return juce::Result::fail("missing widget " + widget.id);
                    if (other->bounds != widget.bounds || other->nestId != widget.nestId
                        || other->type != widget.type || other->title != widget.title
                        || other->content != widget.content || other->config != widget.config)
                    {
                        return juce::Result::fail("widget differs: " + widget.id);
                    }
                }
            }

            for (const auto& nest : expected.nestContainers)
            {
                const auto* other = Aries::Core::GridQueries::findNest(actual, nest.id);
                if (other == nullptr || other->bounds != nest.bounds || other->parentNestId != nest.parentNestId)
                    return juce::Result::fail("nest differs: " + nest.id);
            }

            return juce::Result::ok();
        }

        juce::Result testSaveAndLoadRoundTrip()
        {
            Aries::GridHandle handle(nullptr, immediateSettings());
            ManualClock clock;
            clock.attach(handle);

            const auto seeded = seedTwoWidgets(handle);
            if (seeded.failed())
                return seeded;

            handle.store().setViewport({ -120.0f, 40.0f, 1.5f });
            const auto saved = handle.save();
            if (saved.failed())
                return failWith("save failed", saved);
            if (handle.persistence().isDirty())
                return juce::Result::fail("save should clear the dirty flag");

            const auto expected = handle.store().snapshot();
            if (handle.removeItem(expected->mainItems.front().id).failed())
                return juce::Result::fail("remove failed");

            const auto loaded = handle.persistence().loadSaved();
            if (loaded.failed())
                return failWith("loadSaved failed", loaded);

            const auto compared = compareModels(*expected, handle.model());
            if (compared.failed())
                return compared;
            if (handle.viewport() != Aries::Viewport { -120.0f, 40.0f, 1.5f })
                return juce::Result::fail("viewport was not restored");
            if (handle.persistence().isDirty() || handle.canUndo())
                return juce::Result::fail("a load should leave a clean state with fresh history");

            return juce::Result::ok();
        }

        juce::Result testExportImportPreservesLayout()
        {
            Aries::GridHandle source(nullptr, immediateSettings());
            ManualClock clock;
            clock.attach(source);

            const auto seeded = seedTwoWidgets(source);
            if (seeded.failed())
                return seeded;

            juce::String json;
            const auto exported = source.exportDocument(json);
            if (exported.failed())
                return failWith("export failed", exported);
            if (!json.contains("\"exportedAt\"") || !json.contains("\"version\""))
                return juce::Result::fail("export is missing envelope fields");

            Aries::GridHandle target(nullptr, immediateSettings());
            clock.attach(target);

            const auto imported = target.importDocument(json);
            if (imported.failed())
                return failWith("import failed", imported);

            const auto compared = compareModels(source.model(), target.model());
            if (compared.failed())
                return compared;
            if (!target.persistence().isDirty())
                return juce::Result::fail("an import should mark the grid dirty");

            const auto before = target.store().snapshot();
            if (target.importDocument("{ not json").error != GridError::parse)
                return juce::Result::fail("malformed import must be a ParseError");
            if (target.store().snapshot() != before)
                return juce::Result::fail("a failed import must not touch the grid");

            return juce::Result::ok();
        }

        juce::Result testAutoSaveBacksOffThenDisables()
        {
            auto storage = std::make_unique<FailingStorage>();
            auto* failing = storage.get();

            Aries::GridHandle handle(std::move(storage), immediateSettings());
            ManualClock clock;
            clock.attach(handle);
            const auto start = clock.now;

            Aries::NewWidgetOptions options;
            options.position = juce::Point<float>(0.0f, 0.0f);
            if (handle.addWidget(options).failed())
                return juce::Result::fail("addWidget failed");

            auto& persistence = handle.persistence();
            if (persistence.nextAttemptMs() != start + 1000)
                return juce::Result::fail("first attempt should be one interval after the change");

            handle.tick(start + 999);
            if (failing->attempts != 0)
                return juce::Result::fail("auto-save ran early");

            const juce::int64 attemptTimes[] = { 1000, 2000, 4000 };
            const juce::int64 nextTimes[] = { 2000, 4000, 8000 };
            for (size_t i = 0; i < 3; ++i)
            {
                clock.now = start + attemptTimes[i];
                handle.tick(clock.now);

                if (failing->attempts != static_cast<int>(i) + 1)
                    return juce::Result::fail("expected an attempt at +" + juce::String(attemptTimes[i]));
                if (persistence.autoSaveStatus() != AutoSaveStatus::retrying
                    || persistence.consecutiveFailures() != static_cast<int>(i) + 1)
                {
                    return juce::Result::fail("status should be retrying with a growing failure count");
                }
                if (persistence.nextAttemptMs() != start + nextTimes[i])
                    return juce::Result::fail("retry should be scheduled at +" + juce::String(nextTimes[i]));
            }

            handle.tick(start + 7999);
            if (failing->attempts != 3)
                return juce::Result::fail("retry ran before its backoff elapsed");

            const auto fatalBefore = handle.diagnostics().countAtLevel(Aries::Runtime::LogLevel::fatal);
            handle.tick(start + 8000);
            if (failing->attempts != 4 || persistence.autoSaveStatus() != AutoSaveStatus::disabled)
                return juce::Result::fail("fourth failure should disable auto-save");
            if (handle.diagnostics().countAtLevel(Aries::Runtime::LogLevel::fatal) != fatalBefore + 1)
                return juce::Result::fail("disabling auto-save must log a fatal entry");
            if (persistence.lastError().isEmpty())
                return juce::Result::fail("last error should be kept for the status surface");

            handle.tick(start + 60000);
            if (failing->attempts != 4)
                return juce::Result::fail("disabled auto-save must not retry");

            persistence.reenableAutoSave();
            if (persistence.autoSaveStatus() != AutoSaveStatus::idle || !persistence.nextAttemptMs().has_value()
                || persistence.consecutiveFailures() != 0)
            {
                return juce::Result::fail("re-enabling should schedule the dirty grid again");
            }

            return juce::Result::ok();
        }

        juce::Result testAutoSaveWaitsForGesture()
        {
            Aries::GridHandle handle(nullptr, immediateSettings());
            ManualClock clock;
            clock.attach(handle);
            const auto start = clock.now;

            if (handle.store().addItem(makeWidget("a", { 0.0f, 0.0f, 200.0f, 150.0f })).failed())
                return juce::Result::fail("seed failed");

            auto& interaction = handle.interaction();
            if (interaction.beginDrag("a", Aries::ItemKind::widget, pointerAt(10.0f, 10.0f, 0)).failed())
                return juce::Result::fail("beginDrag failed");
            interaction.updatePointer(pointerAt(333.0f, 10.0f, 16));

            handle.tick(start + 5000);
            if (handle.storage().read(Aries::Persistence::kGridStateKey).has_value())
                return juce::Result::fail("auto-save must not persist a half-finished drag");
            if (!handle.persistence().isDirty())
                return juce::Result::fail("the grid should stay dirty while the save waits");

            if (interaction.endGesture().failed())
                return juce::Result::fail("endGesture failed");

            handle.tick(start + 5001);
            const auto stored = handle.storage().read(Aries::Persistence::kGridStateKey);
            if (!stored.has_value() || handle.persistence().isDirty())
                return juce::Result::fail("the deferred auto-save should run once the gesture ends");

            Aries::Serialization::GridDocument document;
            const auto parsed = Aries::Serialization::parseGridFromJsonString(*stored, document);
            if (parsed.failed())
                return failWith("stored layout did not parse", parsed);

            const auto saved = boundsOf(document.model, "a");
            if (!saved.has_value() || !sameRect(*saved, { 320.0f, 0.0f, 200.0f, 150.0f }))
                return juce::Result::fail("the committed position should be saved, got "
                                          + (saved.has_value() ? describe(*saved) : juce::String("nothing")));

            return juce::Result::ok();
        }

        juce::Result testVerificationAndQuotaErrors()
        {
            {
                Aries::GridHandle handle(std::make_unique<CorruptingStorage>(), immediateSettings());
                const auto result = handle.save();
                if (result.error != GridError::persistenceVerification)
                    return juce::Result::fail("read-back mismatch must be a PersistenceVerificationError");
            }

            {
                const auto file = juce::File::getSpecialLocation(juce::File::tempDirectory)
                                      .getNonexistentChildFile("aries-grid-truncated", ".layout");

                Aries::GridHandle handle(std::make_unique<TruncatedFileStorage>(file), immediateSettings());
                Aries::NewWidgetOptions options;
                options.position = juce::Point<float>(0.0f, 0.0f);
                const auto added = handle.addWidget(options);
                const auto truncated = handle.save();
                const auto cached = handle.storage().read(Aries::Persistence::kGridStateKey);
                file.deleteFile();

                if (added.failed())
                    return juce::Result::fail("addWidget failed");
                if (truncated.error != GridError::persistenceVerification)
                    return juce::Result::fail("a file that lost the write must fail verification, got "
                                              + juce::String(truncated.errorName()));
                if (!cached.has_value())
                    return juce::Result::fail("the in-memory copy should still hold the value");
                if (!handle.persistence().isDirty())
                    return juce::Result::fail("an unverified save must leave the grid dirty");
            }

            auto storage = std::make_unique<Aries::Persistence::MemoryStorage>();
            storage->setQuotaBytes(64);

            Aries::GridHandle handle(std::move(storage), immediateSettings());
            const auto result = handle.save();
            if (result.error != GridError::persistenceQuota)
                return juce::Result::fail("oversized write must be a PersistenceQuotaError");
            if (handle.storage().read(Aries::Persistence::kGridStateKey).has_value())
                return juce::Result::fail("a rejected write must not leave a value behind");
            if (handle.diagnostics().countAtLevel(Aries::Runtime::LogLevel::error) == 0)
                return juce::Result::fail("save failures should be logged");

            return juce::Result::ok();
        }

        juce::Result testProfiles()
        {
            Aries::GridHandle handle(nullptr, immediateSettings());
            ManualClock clock;
            clock.attach(handle);
            auto& persistence = handle.persistence();

            if (persistence.saveProfile("  ").error != GridError::invalidArgument)
                return juce::Result::fail("blank profile name must be rejected");

            Aries::NewWidgetOptions options;
            options.position = juce::Point<float>(0.0f, 0.0f);
            if (handle.addWidget(options).failed() || persistence.saveProfile("Beta").failed())
                return juce::Result::fail("saving Beta failed");

            const auto betaModel = handle.store().snapshot();

            options.position = juce::Point<float>(400.0f, 0.0f);
            if (handle.addWidget(options).failed() || persistence.saveProfile("Alpha").failed())
                return juce::Result::fail("saving Alpha failed");

            if (persistence.profileNames() != juce::StringArray { "Alpha", "Beta" })
                return juce::Result::fail("profile names should be sorted");
            if (persistence.activeProfile() != "Alpha")
                return juce::Result::fail("saving should activate the profile");

            if (persistence.loadProfile("Beta").failed() || handle.widgetCount() != 1)
                return juce::Result::fail("loading Beta failed");
            const auto compared = compareModels(*betaModel, handle.model());
            if (compared.failed())
                return compared;
            if (persistence.activeProfile() != "Beta" || handle.canUndo())
                return juce::Result::fail("a profile load should switch the active profile and reset history");

            options.position = juce::Point<float>(0.0f, 400.0f);
            if (handle.addWidget(options).failed() || handle.save().failed())
                return juce::Result::fail("saving with an active profile failed");
            if (persistence.loadProfile("Alpha").failed() || persistence.loadProfile("Beta").failed())
                return juce::Result::fail("switching profiles failed");
            if (handle.widgetCount() != 2)
                return juce::Result::fail("an explicit save should also update the active profile");

            if (persistence.loadProfile("Gamma").error != GridError::notFound)
                return juce::Result::fail("unknown profile must be NotFound");

            if (persistence.deleteProfile("Beta").failed() || persistence.activeProfile().isNotEmpty())
                return juce::Result::fail("deleting the active profile should clear it");
            if (persistence.profileNames() != juce::StringArray { "Alpha" })
                return juce::Result::fail("profile was not deleted");

            return juce::Result::ok();
        }

        juce::Result testPropertiesFileStorage()
        {
            const auto file = juce::File::getSpecialLocation(juce::File::tempDirectory)
                                  .getNonexistentChildFile("aries-grid-smoke", ".layout");

            {
                Aries::Persistence::PropertiesFileStorage storage(file);
                if (storage.write("answer", "42").failed())
                    return juce::Result::fail("write failed");
            }

            Aries::Persistence::PropertiesFileStorage reopened(file);
            const auto value = reopened.read("answer");
            const auto removed = reopened.remove("answer");
            const auto keys = reopened.keys();
            file.deleteFile();

            if (!value.has_value() || *value != "42")
                return juce::Result::fail("value did not survive reopening");
            if (removed.failed() || keys.contains("answer"))
                return juce::Result::fail("remove failed");

            return juce::Result::ok();
        }
    }

    std::vector<SmokeTest> persistenceTests()
    {
        return {
            { "Save and load round trip", testSaveAndLoadRoundTrip },
            { "Export/import preserves layout", testExportImportPreservesLayout },
            { "Auto-save backs off then disables", testAutoSaveBacksOffThenDisables },
            { "Auto-save waits for gesture", testAutoSaveWaitsForGesture },
            { "Verification and quota errors", testVerificationAndQuotaErrors },
            { "Profiles", testProfiles },
            { "Properties file storage", testPropertiesFileStorage }
        };
    }
}
