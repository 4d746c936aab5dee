#pragma once

#include <juce_core/juce_core.h>
#include <optional>
#include <vector>

namespace Aries::Editor::Interaction
{
    enum class GridCommand
    {
        undo,
        redo,
        save,
        exportDocument,
        importDocument,
        addWidget,
        addNest,
        resetView,
        zoomIn,
        zoomOut
    };

    juce::String gridCommandName(GridCommand command);

    struct KeyChord
    {
        juce::juce_wchar key = 0;   // letters are stored upper-case
        bool ctrl = false;
        bool shift = false;

        static KeyChord make(juce::juce_wchar key, bool ctrl, bool shift = false) noexcept;

        // "ctrl+shift+z", "Ctrl+0". Returns nullopt for an empty or unknown key.
        static std::optional<KeyChord> fromDescription(const juce::String& description);
        juce::String toDescription() const;

        bool operator==(const KeyChord& other) const noexcept
        {
            return key == other.key && ctrl == other.ctrl && shift == other.shift;
        }
    };

    // Key capture stays with the host; this only resolves chords to grid commands.
    class ShortcutMap
    {
    public:
        ShortcutMap();

        void resetToDefaults();
        void clear();

        void bind(const KeyChord& chord, GridCommand command);
        bool unbind(const KeyChord& chord);

        std::optional<GridCommand> commandFor(const KeyChord& chord) const;
        std::vector<KeyChord> chordsFor(GridCommand command) const;
        size_t size() const noexcept { return bindings.size(); }

    private:
        struct Binding
        {
            KeyChord chord;
            GridCommand command = GridCommand::undo;
        };

        std::vector<Binding> bindings;
    };
}
