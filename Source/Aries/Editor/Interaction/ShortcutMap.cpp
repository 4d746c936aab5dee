#include "Aries/Editor/Interaction/ShortcutMap.h"

#include <algorithm>

namespace Aries::Editor::Interaction
{
    namespace
    {
        juce::juce_wchar normalizeKey(juce::juce_wchar key) noexcept
        {
            // '+' shares the '=' key and '_' shares '-'.
            if (key == '+')
                return '=';
            if (key == '_')
                return '-';
            return juce::CharacterFunctions::toUpperCase(key);
        }
    }

    juce::String gridCommandName(GridCommand command)
    {
        switch (command)
        {
            case GridCommand::undo: return "undo";
            case GridCommand::redo: return "redo";
            case GridCommand::save: return "save";
            case GridCommand::exportDocument: return "export";
            case GridCommand::importDocument: return "import";
            case GridCommand::addWidget: return "addWidget";
            case GridCommand::addNest: return "addNest";
            case GridCommand::resetView: return "resetView";
            case GridCommand::zoomIn: return "zoomIn";
            case GridCommand::zoomOut: return "zoomOut";
        }

        return "unknown";
    }

    KeyChord KeyChord::make(juce::juce_wchar key, bool ctrl, bool shift) noexcept
    {
        KeyChord chord;
        chord.key = normalizeKey(key);
        chord.ctrl = ctrl;
        chord.shift = shift;
        return chord;
    }

    std::optional<KeyChord> KeyChord::fromDescription(const juce::String& description)
    {
        auto text = description.trim();

        // "ctrl++" names the '+' key, which shares '='.
        if (text == "+" || text.endsWith("++"))
            text = text.dropLastCharacters(1) + "=";

        auto tokens = juce::StringArray::fromTokens(text, "+", {});
        tokens.trim();
        tokens.removeEmptyStrings();

        if (tokens.isEmpty())
            return std::nullopt;

        KeyChord chord;
        for (int i = 0; i < tokens.size() - 1; ++i)
        {
            const auto modifier = tokens[i].toLowerCase();
            if (modifier == "ctrl" || modifier == "control" || modifier == "cmd" || modifier == "command")
                chord.ctrl = true;
            else if (modifier == "shift")
                chord.shift = true;
            else
                return std::nullopt;
        }

        const auto keyToken = tokens[tokens.size() - 1];
        if (keyToken.length() != 1)
            return std::nullopt;

        chord.key = normalizeKey(keyToken[0]);
        return chord;
    }

    juce::String KeyChord::toDescription() const
    {
        juce::String text;
        if (ctrl)
            text << "Ctrl+";
        if (shift)
            text << "Shift+";
        text << juce::String::charToString(key);
        return text;
    }

    ShortcutMap::ShortcutMap()
    {
        resetToDefaults();
    }

    void ShortcutMap::resetToDefaults()
    {
        bindings.clear();
        bind(KeyChord::make('z', true), GridCommand::undo);
        bind(KeyChord::make('y', true), GridCommand::redo);
        bind(KeyChord::make('z', true, true), GridCommand::redo);
        bind(KeyChord::make('s', true), GridCommand::save);
        bind(KeyChord::make('e', true), GridCommand::exportDocument);
        bind(KeyChord::make('i', true), GridCommand::importDocument);
        bind(KeyChord::make('w', true, true), GridCommand::addWidget);
        bind(KeyChord::make('n', true, true), GridCommand::addNest);
        bind(KeyChord::make('0', true), GridCommand::resetView);
        bind(KeyChord::make('=', true), GridCommand::zoomIn);
        bind(KeyChord::make('=', true, true), GridCommand::zoomIn);
        bind(KeyChord::make('-', true), GridCommand::zoomOut);
    }

    void ShortcutMap::clear()
    {
        bindings.clear();
    }

    void ShortcutMap::bind(const KeyChord& chord, GridCommand command)
    {
        const auto normalized = KeyChord::make(chord.key, chord.ctrl, chord.shift);
        for (auto& binding : bindings)
        {
            if (binding.chord == normalized)
            {
                binding.command = command;
                return;
            }
        }

        bindings.push_back({ normalized, command });
    }

    bool ShortcutMap::unbind(const KeyChord& chord)
    {
        const auto normalized = KeyChord::make(chord.key, chord.ctrl, chord.shift);
        const auto it = std::remove_if(bindings.begin(),
                                       bindings.end(),
                                       [&normalized](const Binding& binding)
                                       {
                                           return binding.chord == normalized;
                                       });
        if (it == bindings.end())
            return false;

        bindings.erase(it, bindings.end());
        return true;
    }

    std::optional<GridCommand> ShortcutMap::commandFor(const KeyChord& chord) const
    {
        const auto normalized = KeyChord::make(chord.key, chord.ctrl, chord.shift);
        for (const auto& binding : bindings)
        {
            if (binding.chord == normalized)
                return binding.command;
        }

        return std::nullopt;
    }

    std::vector<KeyChord> ShortcutMap::chordsFor(GridCommand command) const
    {
        std::vector<KeyChord> chords;
        for (const auto& binding : bindings)
        {
            if (binding.command == command)
                chords.push_back(binding.chord);
        }

        return chords;
    }
}
