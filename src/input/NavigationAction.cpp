#include "NavigationAction.h"

namespace ll
{

namespace
{

struct ActionName
{
    NavigationAction action;
    const char* name;
};

const ActionName actionNames[] =
{
    { NavigationAction::None,                "none" },

    { NavigationAction::FocusConnections,    "focus_connections" },
    { NavigationAction::FocusQueryInput,     "focus_query_input" },
    { NavigationAction::FocusResults,        "focus_results" },
    { NavigationAction::FocusSchemaExplorer, "focus_schema_explorer" },
    { NavigationAction::FocusCommandLine,    "focus_command_line" },

    { NavigationAction::FocusTextInput,      "focus_text_input" },
    { NavigationAction::FocusDataTable,      "focus_data_table" },
    { NavigationAction::FocusTreeView,       "focus_tree_view" },
    { NavigationAction::FocusListView,       "focus_list_view" },
    { NavigationAction::FocusModal,          "focus_modal" },

    { NavigationAction::MoveLeft,            "move_left" },
    { NavigationAction::MoveRight,           "move_right" },
    { NavigationAction::MoveUp,              "move_up" },
    { NavigationAction::MoveDown,            "move_down" },
    { NavigationAction::MoveToStart,         "move_to_start" },
    { NavigationAction::MoveToEnd,           "move_to_end" },
    { NavigationAction::MoveToNextWord,      "move_to_next_word" },
    { NavigationAction::MoveToPreviousWord,  "move_to_previous_word" },

    { NavigationAction::NextPane,            "next_pane" },
    { NavigationAction::PreviousPane,        "previous_pane" },
    { NavigationAction::NextBox,             "next_box" },
    { NavigationAction::PreviousBox,         "previous_box" },

    { NavigationAction::EnterInsertMode,     "enter_insert_mode" },
    { NavigationAction::EnterAppendMode,     "enter_append_mode" },
    { NavigationAction::EnterVisualMode,     "enter_visual_mode" },
    { NavigationAction::EnterCommandMode,    "enter_command_mode" },
    { NavigationAction::EnterNormalMode,     "enter_normal_mode" },
    { NavigationAction::ToggleViewEditMode,  "toggle_view_edit_mode" },

    { NavigationAction::InsertChar,          "insert_char" },
    { NavigationAction::InsertNewline,       "insert_newline" },
    { NavigationAction::OpenLineBelow,       "open_line_below" },
    { NavigationAction::OpenLineAbove,       "open_line_above" },
    { NavigationAction::DeleteCharBefore,    "delete_char_before" },
    { NavigationAction::DeleteChar,          "delete_char" },
    { NavigationAction::ReplaceChar,         "replace_char" },
    { NavigationAction::Undo,                "undo" },
    { NavigationAction::Redo,                "redo" },

    { NavigationAction::Copy,                "copy" },
    { NavigationAction::CopyRow,             "copy_row" },
    { NavigationAction::Cut,                 "cut" },
    { NavigationAction::CutRow,              "cut_row" },
    { NavigationAction::Paste,               "paste" },

    { NavigationAction::FirstPage,           "first_page" },
    { NavigationAction::LastPage,            "last_page" },
    { NavigationAction::NextPage,            "next_page" },
    { NavigationAction::PreviousPage,        "previous_page" },
    { NavigationAction::SortByColumn,        "sort_by_column" },
    { NavigationAction::FollowForeignKey,    "follow_foreign_key" },

    { NavigationAction::Search,              "search" },
    { NavigationAction::Confirm,             "confirm" },
    { NavigationAction::Cancel,              "cancel" },
    { NavigationAction::Quit,                "quit" },
};

} // namespace

juce::String getActionName (NavigationAction action)
{
    for (auto& an : actionNames)
        if (an.action == action)
            return an.name;

    return {};
}

bool actionFromName (const juce::String& name, NavigationAction& result)
{
    auto n = name.trim().toLowerCase();

    for (auto& an : actionNames)
    {
        if (n == an.name)
        {
            result = an.action;
            return true;
        }
    }

    return false;
}

bool isDirectionalMove (NavigationAction action)
{
    return action == NavigationAction::MoveLeft || action == NavigationAction::MoveRight
        || action == NavigationAction::MoveUp   || action == NavigationAction::MoveDown;
}

Direction getDirection (NavigationAction action)
{
    switch (action)
    {
        case NavigationAction::MoveRight: return Direction::Right;
        case NavigationAction::MoveUp:    return Direction::Up;
        case NavigationAction::MoveDown:  return Direction::Down;
        default:                          return Direction::Left;
    }
}

bool isPaneFocus (NavigationAction action)
{
    return action >= NavigationAction::FocusConnections
        && action <= NavigationAction::FocusCommandLine;
}

PaneKind getFocusedPaneKind (NavigationAction action)
{
    switch (action)
    {
        case NavigationAction::FocusQueryInput:     return PaneKind::QueryInput;
        case NavigationAction::FocusResults:        return PaneKind::Results;
        case NavigationAction::FocusSchemaExplorer: return PaneKind::SchemaExplorer;
        case NavigationAction::FocusCommandLine:    return PaneKind::CommandLine;
        default:                                    return PaneKind::Connections;
    }
}

bool isBoxFocus (NavigationAction action)
{
    return action >= NavigationAction::FocusTextInput
        && action <= NavigationAction::FocusModal;
}

BoxKind getFocusedBoxKind (NavigationAction action)
{
    switch (action)
    {
        case NavigationAction::FocusDataTable: return BoxKind::DataTable;
        case NavigationAction::FocusTreeView:  return BoxKind::TreeView;
        case NavigationAction::FocusListView:  return BoxKind::ListView;
        case NavigationAction::FocusModal:     return BoxKind::Modal;
        default:                               return BoxKind::TextInput;
    }
}

bool isCountable (NavigationAction action)
{
    return (action >= NavigationAction::MoveLeft && action <= NavigationAction::MoveToPreviousWord)
        || action == NavigationAction::DeleteChar
        || action == NavigationAction::Paste;
}

} // namespace ll
