#pragma once

#include "input/KeyResolver.h"
#include "model/Pane.h"
#include "navigation/Effect.h"
#include <functional>

namespace ll
{

/** Routes resolved keys into the focused box and owns box activation.

    dispatch() returns true when the box claims the action. Unclaimed actions
    go on to the NavigationManager, which is how horizontal moves in a tree or
    list become focus moves.
*/
class BoxManager
{
public:
    explicit BoxManager (Registers& registers);

    bool dispatch (const KeyResolution& resolution, Box& box, PaneKind pane, Effect& out);

    void accumulateCount (Box& box, int digit);

    bool cycleBox (Pane& pane, int delta);
    bool focusBox (Pane& pane, BoxKind kind);

    // True while the box's content is being edited as text
    static bool isEditingText (const Box& box);

    // Runs a line confirmed in an editor's command mode
    std::function<Effect (const juce::String&)> onCommand;

private:
    Registers& registers;

    bool dispatchText (const KeyResolution& r, Box& box, PaneKind pane, Effect& out);
    bool dispatchTable (const KeyResolution& r, Box& box, PaneKind pane, Effect& out);
    bool dispatchRows (const KeyResolution& r, Box& box, PaneKind pane, Effect& out);

    bool applyOutcome (VimEditor::Outcome outcome, VimEditor& editor, PaneKind pane, Effect& out);
    void commitCell (Box& box);

    static bool isEditingAction (NavigationAction action);

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (BoxManager)
};

} // namespace ll
