#pragma once

#include "input/KeyEvent.h"
#include "input/KeyMapping.h"

namespace ll
{

struct KeyResolution
{
    enum Kind { Unmapped, CountDigit, Action };

    Kind kind = Unmapped;
    NavigationAction action = NavigationAction::None;
    juce::juce_wchar character = 0;   // literal for InsertChar
    int digit = 0;                    // for CountDigit
    bool paneDirectional = false;     // directional move whose chord carries the pane modifier
    juce::String chord;

    bool isAction (NavigationAction a) const { return kind == Action && action == a; }
};

// What the resolver needs to know about the current focus.
struct ResolverContext
{
    PaneKind pane = PaneKind::Connections;
    bool hasBox = false;
    BoxKind box = BoxKind::TextInput;
    EditingMode editingMode = EditingMode::Vim;
    bool hasVimMode = false;          // focused box has an editor in Vim editing mode
    VimMode vimMode = VimMode::Normal;
    bool cursorEditing = false;       // Cursor editing mode, edit state
    bool countPending = false;
    bool awaitingLiteral = false;     // editor waits for the character of a replace
};

class KeyResolver
{
public:
    explicit KeyResolver (const KeyMapping& mapping);

    KeyResolution resolve (const KeyEvent& event, const ResolverContext& context) const;

    const KeyMapping& getMapping() const { return mapping; }
    void setMapping (const KeyMapping& newMapping) { mapping = newMapping; }

    /** True if printable keys are text in this context (Insert, Command,
        Cursor edit state, or the command line pane).
    */
    static bool isTextEntry (const ResolverContext& context);

private:
    KeyMapping mapping;

    KeyResolution makeAction (NavigationAction action, const juce::String& chord) const;
};

} // namespace ll
