#include "Aries/Public/GridHandle.h"

#include "Aries/Core/Geometry.h"
#include "Aries/Core/GridQueries.h"

namespace Aries
{
    namespace
    {
        constexpr auto kLogCategory = "Grid";

        juce::String joinIds(const std::vector<ItemId>& ids)
        {
            juce::StringArray names;
            for (const auto& id : ids)
                names.add(id);
            return names.joinIntoString(", ");
        }

        std::vector<juce::Rectangle<float>> topLevelBounds(const GridModel& model)
        {
            std::vector<juce::Rectangle<float>> bounds;
            for (const auto& widget : model.mainItems)
                bounds.push_back(widget.bounds);
            for (const auto& nest : model.nestContainers)
            {
                if (!nest.parentNestId.has_value())
                    bounds.push_back(nest.bounds);
            }

            return bounds;
        }
    }

    class GridHandle::Impl : public Core::GridStore::Listener
    {
    public:
        Impl(std::unique_ptr<Persistence::StorageBackend> storageIn, const EngineSettings& settingsIn)
            : store(makeInitialModel(settingsIn)),
              storage(storageIn != nullptr ? std::move(storageIn) : std::make_unique<Persistence::MemoryStorage>()),
              persistence(store, *storage, diagnostics),
              viewportController(store),
              interaction(store, viewportController, diagnostics),
              liveValues(store, diagnostics),
              clock([] { return juce::Time::currentTimeMillis(); })
        {
            applySettings(settingsIn);
            history.reset({ store.snapshot(), store.viewport() });
            store.addListener(this);
        }

        ~Impl() override
        {
            store.removeListener(this);
        }

        static GridModel makeInitialModel(const EngineSettings& settingsIn)
        {
            GridModel model;
            model.gridSize = sanitizeSettings(settingsIn).gridSize;
            return model;
        }

        void applySettings(const EngineSettings& next)
        {
            settings = sanitizeSettings(next);

            history.setCapacity(static_cast<size_t>(settings.historyCapacity));
            history.setDebounceMs(settings.historyDebounceMs);
            persistence.setAutoSaveSettings(settings.autoSave);
            culling.setSettings(settings.culling);
            interaction.setSettings(settings.interaction);

            auto diagnosticsSettings = diagnostics.settings();
            diagnosticsSettings.minimumLevel = settings.logLevel;
            diagnosticsSettings.maxEntries = settings.maxLogEntries;
            diagnostics.setSettings(diagnosticsSettings);
        }

        void setClock(MillisecondClock nextClock)
        {
            if (nextClock == nullptr)
                return;

            clock = std::move(nextClock);
            auto timeClock = [source = clock] { return juce::Time(source()); };
            store.setClock(timeClock);
            diagnostics.setClock(timeClock);
        }

        void gridChanged(const GridEvent& event) override
        {
            if (!event.isSettled())
                return;

            const auto now = clock();

            switch (event.type)
            {
                case GridEventType::stateReplaced:
                {
                    const auto origin = event.replaceOrigin.value_or(ReplaceOrigin::import);
                    if (origin != ReplaceOrigin::history)
                        history.reset({ store.snapshot(), store.viewport() });

                    if (origin == ReplaceOrigin::load)
                        persistence.markClean();
                    else
                        persistence.markDirty(now);
                    return;
                }

                case GridEventType::viewportChanged:
                    persistence.markDirty(now);
                    return;

                case GridEventType::itemCreated:
                    diagnostics.info(kLogCategory, "Item created: " + joinIds(event.ids)
                                                       + " (" + juce::String(event.widgetCount) + " widgets)");
                    break;

                case GridEventType::itemRemoved:
                    diagnostics.info(kLogCategory, "Item removed: " + joinIds(event.ids)
                                                       + " (" + juce::String(event.widgetCount) + " widgets)");
                    break;

                case GridEventType::itemTransferred:
                    diagnostics.info(kLogCategory, "Item transferred: " + joinIds(event.ids));
                    break;

                case GridEventType::itemUpdated:
                case GridEventType::liveValueApplied:
                    break;
            }

            history.noteSettledChange(store.snapshot(), store.viewport(), now);
            persistence.markDirty(now);
        }

        GridResult restore(const std::optional<History::HistoryEntry>& entry, const juce::String& label)
        {
            if (!entry.has_value() || entry->state == nullptr)
                return GridResult::ok();

            const auto result = store.replaceState(*entry->state, ReplaceOrigin::history, entry->viewport);
            if (result.failed())
            {
                diagnostics.error(kLogCategory, label + " failed: " + result.getErrorMessage());
                return result;
            }

            diagnostics.info(kLogCategory, label + " (" + juce::String(history.index() + 1) + "/"
                                               + juce::String(static_cast<int>(history.size())) + ")");
            return result;
        }

        GridResult rejectDuringGesture(const juce::String& label)
        {
            if (interaction.state() == Editor::Interaction::GestureState::idle)
                return GridResult::ok();

            diagnostics.warning(kLogCategory, label + " ignored while a gesture is active");
            return GridResult::fail(GridError::invalidArgument, label + " is unavailable during a gesture");
        }

        Runtime::EngineDiagnostics diagnostics;
        Core::GridStore store;
        std::unique_ptr<Persistence::StorageBackend> storage;
        History::HistoryManager history;
        Persistence::PersistenceManager persistence;
        Editor::Interaction::ViewportController viewportController;
        Editor::Interaction::InteractionController interaction;
        Editor::Interaction::ShortcutMap shortcuts;
        Editor::Perf::CullingEngine culling;
        Runtime::LiveValueBridge liveValues;
        EngineSettings settings;
        MillisecondClock clock;
        juce::Random random;
    };

    GridHandle::GridHandle(std::unique_ptr<Persistence::StorageBackend> storage, const EngineSettings& settings)
        : impl(std::make_unique<Impl>(std::move(storage), settings))
    {
    }

    GridHandle::~GridHandle() = default;
    GridHandle::GridHandle(GridHandle&&) noexcept = default;
    GridHandle& GridHandle::operator=(GridHandle&&) noexcept = default;

    void GridHandle::setClock(MillisecondClock clock)
    {
        impl->setClock(std::move(clock));
    }

    juce::int64 GridHandle::nowMs() const
    {
        return impl->clock();
    }

    void GridHandle::setRandomSeed(juce::int64 seed)
    {
        impl->random.setSeed(seed);
    }

    const EngineSettings& GridHandle::settings() const noexcept
    {
        return impl->settings;
    }

    // The grid size belongs to the document; only a new handle picks it up from settings.
    void GridHandle::applySettings(const EngineSettings& settings)
    {
        impl->applySettings(settings);
    }

    const GridModel& GridHandle::model() const noexcept
    {
        return impl->store.model();
    }

    const Viewport& GridHandle::viewport() const noexcept
    {
        return impl->store.viewport();
    }

    int GridHandle::widgetCount() const noexcept
    {
        return impl->store.widgetCount();
    }

    GridResult GridHandle::addWidget(const NewWidgetOptions& options, ItemId* createdIdOut)
    {
        const auto& model = impl->store.model();
        const auto grid = model.gridSize;

        auto start = options.position.value_or(juce::Point<float>(impl->random.nextFloat() * 400.0f,
                                                                  impl->random.nextFloat() * 300.0f));
        start = Core::Geometry::snapToGrid(start, grid);

        const juce::Rectangle<float> candidate(start.x, start.y, options.width, options.height);

        WidgetModel widget;
        widget.type = options.type.trim().isNotEmpty() ? options.type.trim() : juce::String("basic");
        widget.title = options.title;
        widget.content = options.content.isNotEmpty() ? options.content : Core::Geometry::defaultContentForType(widget.type);
        widget.ariesModType = options.ariesModType;
        widget.config = options.config;
        widget.bounds = candidate.withPosition(Core::Geometry::findNonCollidingPosition(candidate, topLevelBounds(model), grid));

        const auto result = impl->store.addItem(widget, MutationPhase::settled, createdIdOut);
        if (result.failed())
            impl->diagnostics.error(kLogCategory, "Adding widget failed: " + result.getErrorMessage());
        return result;
    }

    GridResult GridHandle::addNest(const NewNestOptions& options, ItemId* createdIdOut)
    {
        const auto& model = impl->store.model();
        const auto grid = model.gridSize;

        auto start = options.position.value_or(juce::Point<float>(impl->random.nextFloat() * 200.0f,
                                                                  impl->random.nextFloat() * 150.0f));
        start = Core::Geometry::snapToGrid(start, grid);

        const juce::Rectangle<float> candidate(start.x, start.y, options.width, options.height);

        NestModel nest;
        nest.title = options.title;
        nest.bounds = candidate.withPosition(Core::Geometry::findNonCollidingPosition(candidate, topLevelBounds(model), grid));

        const auto result = impl->store.addItem(nest, MutationPhase::settled, createdIdOut);
        if (result.failed())
            impl->diagnostics.error(kLogCategory, "Adding nest failed: " + result.getErrorMessage());
        return result;
    }

    GridResult GridHandle::removeItem(const ItemId& id, ChildPolicy policy)
    {
        const auto result = impl->store.removeItem(id, policy);
        if (result.failed())
            impl->diagnostics.error(kLogCategory, "Removing " + id + " failed: " + result.getErrorMessage());
        return result;
    }

    bool GridHandle::canUndo() const noexcept
    {
        return impl->history.canUndo();
    }

    bool GridHandle::canRedo() const noexcept
    {
        return impl->history.canRedo();
    }

    GridResult GridHandle::undo()
    {
        const auto gate = impl->rejectDuringGesture("Undo");
        if (gate.failed())
            return gate;

        return impl->restore(impl->history.undo(), "Undo");
    }

    GridResult GridHandle::redo()
    {
        const auto gate = impl->rejectDuringGesture("Redo");
        if (gate.failed())
            return gate;

        return impl->restore(impl->history.redo(), "Redo");
    }

    GridResult GridHandle::save()
    {
        return impl->persistence.save();
    }

    GridResult GridHandle::exportDocument(juce::String& jsonOut) const
    {
        return impl->persistence.exportDocument(jsonOut);
    }

    GridResult GridHandle::importDocument(const juce::String& json)
    {
        const auto gate = impl->rejectDuringGesture("Import");
        if (gate.failed())
            return gate;

        return impl->persistence.importDocument(json);
    }

    Editor::Perf::CullingResult GridHandle::computeVisibility(Core::Geometry::ItemSize containerSize)
    {
        impl->viewportController.setContainerSize(containerSize);
        return impl->culling.compute(impl->store.model(),
                                     impl->store.viewport(),
                                     containerSize,
                                     impl->interaction.alwaysVisibleIds());
    }

    GridResult GridHandle::performCommand(Editor::Interaction::GridCommand command, juce::String* io)
    {
        using Editor::Interaction::GridCommand;

        switch (command)
        {
            case GridCommand::undo: return undo();
            case GridCommand::redo: return redo();
            case GridCommand::save: return save();
            case GridCommand::addWidget: return addWidget();
            case GridCommand::addNest: return addNest();

            case GridCommand::exportDocument:
            {
                juce::String json;
                const auto result = exportDocument(json);
                if (result.wasOk() && io != nullptr)
                    *io = json;
                return result;
            }

            case GridCommand::importDocument:
                if (io == nullptr)
                    return GridResult::fail(GridError::invalidArgument, "import needs a document");
                return importDocument(*io);

            case GridCommand::resetView:
                impl->viewportController.reset();
                return GridResult::ok();

            case GridCommand::zoomIn:
                impl->viewportController.zoomIn();
                return GridResult::ok();

            case GridCommand::zoomOut:
                impl->viewportController.zoomOut();
                return GridResult::ok();
        }

        return GridResult::fail(GridError::invalidArgument, "unknown command");
    }

    GridResult GridHandle::handleShortcut(const Editor::Interaction::KeyChord& chord, juce::String* io)
    {
        const auto command = impl->shortcuts.commandFor(chord);
        if (!command.has_value())
            return GridResult::fail(GridError::notFound, "no command bound to " + chord.toDescription());

        impl->diagnostics.trace(kLogCategory, chord.toDescription() + " -> " + Editor::Interaction::gridCommandName(*command));
        return performCommand(*command, io);
    }

    void GridHandle::tick(juce::int64 nowMs)
    {
        impl->interaction.tick(nowMs);
        impl->history.tick(nowMs);

        // The store holds uncommitted gesture frames until the gesture ends; a due save waits for it.
        if (impl->interaction.state() == Editor::Interaction::GestureState::idle)
            impl->persistence.tick(nowMs);
    }

    Core::GridStore& GridHandle::store() noexcept { return impl->store; }
    const Core::GridStore& GridHandle::store() const noexcept { return impl->store; }
    History::HistoryManager& GridHandle::history() noexcept { return impl->history; }
    Persistence::PersistenceManager& GridHandle::persistence() noexcept { return impl->persistence; }
    Persistence::StorageBackend& GridHandle::storage() noexcept { return *impl->storage; }
    Editor::Interaction::InteractionController& GridHandle::interaction() noexcept { return impl->interaction; }
    Editor::Interaction::ViewportController& GridHandle::viewportController() noexcept { return impl->viewportController; }
    Editor::Interaction::ShortcutMap& GridHandle::shortcuts() noexcept { return impl->shortcuts; }
    Editor::Perf::CullingEngine& GridHandle::culling() noexcept { return impl->culling; }
    Runtime::EngineDiagnostics& GridHandle::diagnostics() noexcept { return impl->diagnostics; }
    Runtime::LiveValueBridge& GridHandle::liveValues() noexcept { return impl->liveValues; }
}
