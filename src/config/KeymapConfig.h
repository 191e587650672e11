#pragma once

#include "input/KeyMapping.h"

namespace YAML { class Node; }

namespace ll
{

/** Loads the user's keymap.yaml.

    editing_mode: vim
    pane_modifier: shift
    bindings:
      global:
        "Ctrl+q": quit
      vim_normal:
        "x": none        # removes the default binding

    Bad entries (unknown scope or action, unparsable chord, a chord that
    duplicates an earlier one in the same scope) are skipped and listed in
    getProblems(); the rest of the file still applies.
*/
class KeymapConfig
{
public:
    KeymapConfig() = default;

    // Returns false if the file exists but couldn't be parsed
    bool loadFromFile (const juce::File& file);
    bool loadFromString (const juce::String& yaml);

    /** Writes the built-in defaults as YAML, via a .tmp sibling. */
    static bool writeDefaults (const juce::File& file);
    static juce::String createDefaultYaml();

    static juce::File getConfigDirectory();
    static juce::File getDefaultFile();

    const KeyMapping& getUserBindings() const  { return userBindings; }
    EditingMode getEditingMode() const         { return editingMode; }
    PaneModifier getPaneModifier() const       { return paneModifier; }
    const juce::StringArray& getProblems() const { return problems; }

    /** Defaults overlaid with the user's bindings. Pane-modifier collisions
        are appended to getProblems().
    */
    KeyMapping buildMapping();

private:
    KeyMapping userBindings;
    EditingMode editingMode = EditingMode::Vim;
    PaneModifier paneModifier = PaneModifier::Shift;
    juce::StringArray problems;

    void reset();
    void readRoot (const YAML::Node& root);
    void readScope (KeyMapping::Scope scope, const YAML::Node& bindings);
    void addProblem (const juce::String& message);
};

} // namespace ll
