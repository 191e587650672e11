#pragma once

#include "model/FocusTypes.h"

namespace ll
{

// The complete vocabulary produced by KeyResolver and consumed by the managers.
enum class NavigationAction
{
    None,

    // Pane focus
    FocusConnections, FocusQueryInput, FocusResults, FocusSchemaExplorer, FocusCommandLine,

    // Box focus
    FocusTextInput, FocusDataTable, FocusTreeView, FocusListView, FocusModal,

    // Directional moves and motions
    MoveLeft, MoveRight, MoveUp, MoveDown,
    MoveToStart, MoveToEnd, MoveToNextWord, MoveToPreviousWord,

    // Cycling
    NextPane, PreviousPane, NextBox, PreviousBox,

    // Modes
    EnterInsertMode, EnterAppendMode, EnterVisualMode, EnterCommandMode, EnterNormalMode,
    ToggleViewEditMode,

    // Text edits
    InsertChar, InsertNewline, OpenLineBelow, OpenLineAbove,
    DeleteCharBefore, DeleteChar, ReplaceChar,
    Undo, Redo,

    // Clipboard
    Copy, CopyRow, Cut, CutRow, Paste,

    // Results
    FirstPage, LastPage, NextPage, PreviousPage,
    SortByColumn, FollowForeignKey,

    Search, Confirm, Cancel, Quit
};

juce::String getActionName (NavigationAction action);

/** Looks up an action by its snake_case name ("move_left", "focus_results").
    Returns false if the name is unknown.
*/
bool actionFromName (const juce::String& name, NavigationAction& result);

bool isDirectionalMove (NavigationAction action);
Direction getDirection (NavigationAction action);

bool isPaneFocus (NavigationAction action);
PaneKind getFocusedPaneKind (NavigationAction action);

bool isBoxFocus (NavigationAction action);
BoxKind getFocusedBoxKind (NavigationAction action);

// Actions whose repeat count comes from a pending numeric prefix.
bool isCountable (NavigationAction action);

} // namespace ll
