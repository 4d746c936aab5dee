#pragma once

#include "Aries/Core/GridStore.h"
#include "Aries/Editor/Interaction/InteractionController.h"
#include "Aries/Editor/Interaction/ShortcutMap.h"
#include "Aries/Editor/Interaction/ViewportController.h"
#include "Aries/Editor/Perf/CullingEngine.h"
#include "Aries/History/HistoryManager.h"
#include "Aries/Persistence/PersistenceManager.h"
#include "Aries/Persistence/StorageBackend.h"
#include "Aries/Runtime/EngineDiagnostics.h"
#include "Aries/Runtime/LiveValueBridge.h"
#include "Aries/Settings/EngineSettings.h"
#include <functional>
#include <memory>

namespace Aries
{
    struct NewWidgetOptions
    {
        juce::String type = "basic";
        juce::String title = "New Widget";
        juce::String content;                 // empty: derived from type
        juce::String ariesModType;
        PropertyBag config;
        float width = 200.0f;
        float height = 150.0f;
        std::optional<juce::Point<float>> position;   // empty: random grid position
    };

    struct NewNestOptions
    {
        juce::String title = "Nest Container";
        float width = 400.0f;
        float height = 300.0f;
        std::optional<juce::Point<float>> position;
    };

    // Owns the whole engine and wires settled store changes into history and persistence.
    // tick() is the only scheduler entry: history debounce, auto-save and held pointer moves.
    class GridHandle
    {
    public:
        using MillisecondClock = std::function<juce::int64()>;

        explicit GridHandle(std::unique_ptr<Persistence::StorageBackend> storage = nullptr,
                            const EngineSettings& settings = {});
        ~GridHandle();
        GridHandle(GridHandle&&) noexcept;
        GridHandle& operator=(GridHandle&&) noexcept;

        GridHandle(const GridHandle&) = delete;
        GridHandle& operator=(const GridHandle&) = delete;

        void setClock(MillisecondClock clock);
        juce::int64 nowMs() const;
        void setRandomSeed(juce::int64 seed);

        const EngineSettings& settings() const noexcept;
        void applySettings(const EngineSettings& settings);

        const GridModel& model() const noexcept;
        const Viewport& viewport() const noexcept;
        int widgetCount() const noexcept;

        GridResult addWidget(const NewWidgetOptions& options = {}, ItemId* createdIdOut = nullptr);
        GridResult addNest(const NewNestOptions& options = {}, ItemId* createdIdOut = nullptr);
        GridResult removeItem(const ItemId& id, ChildPolicy policy = ChildPolicy::promote);

        bool canUndo() const noexcept;
        bool canRedo() const noexcept;
        GridResult undo();
        GridResult redo();

        GridResult save();
        GridResult exportDocument(juce::String& jsonOut) const;
        GridResult importDocument(const juce::String& json);

        Editor::Perf::CullingResult computeVisibility(Core::Geometry::ItemSize containerSize);

        // Export writes into `io`; import reads from it.
        GridResult performCommand(Editor::Interaction::GridCommand command, juce::String* io = nullptr);
        GridResult handleShortcut(const Editor::Interaction::KeyChord& chord, juce::String* io = nullptr);

        void tick(juce::int64 nowMs);

        Core::GridStore& store() noexcept;
        const Core::GridStore& store() const noexcept;
        History::HistoryManager& history() noexcept;
        Persistence::PersistenceManager& persistence() noexcept;
        Persistence::StorageBackend& storage() noexcept;
        Editor::Interaction::InteractionController& interaction() noexcept;
        Editor::Interaction::ViewportController& viewportController() noexcept;
        Editor::Interaction::ShortcutMap& shortcuts() noexcept;
        Editor::Perf::CullingEngine& culling() noexcept;
        Runtime::EngineDiagnostics& diagnostics() noexcept;
        Runtime::LiveValueBridge& liveValues() noexcept;

    private:
        class Impl;
        std::unique_ptr<Impl> impl;
    };
}
