#pragma once

#include <juce_core/juce_core.h>

namespace ll
{

// Declaration order of PaneKind is the pane-cycling order.
enum class PaneKind { Connections, QueryInput, Results, SchemaExplorer, CommandLine };

enum class BoxKind { TextInput, DataTable, TreeView, ListView, Modal };

enum class EditingMode { Vim, Cursor };

enum class VimMode { Normal, Insert, Visual, Command };

enum class Direction { Left, Right, Up, Down };

enum class PaneModifier { Shift, Ctrl, Alt };

inline juce::String getPaneName (PaneKind kind)
{
    switch (kind)
    {
        case PaneKind::Connections:    return "Connections";
        case PaneKind::QueryInput:     return "Query";
        case PaneKind::Results:        return "Results";
        case PaneKind::SchemaExplorer: return "Schema";
        case PaneKind::CommandLine:    return "Command";
    }

    return {};
}

inline juce::String getBoxName (BoxKind kind)
{
    switch (kind)
    {
        case BoxKind::TextInput: return "Input";
        case BoxKind::DataTable: return "Table";
        case BoxKind::TreeView:  return "Tree";
        case BoxKind::ListView:  return "List";
        case BoxKind::Modal:     return "Modal";
    }

    return {};
}

inline juce::String getVimModeName (VimMode mode)
{
    switch (mode)
    {
        case VimMode::Normal:  return "NORMAL";
        case VimMode::Insert:  return "INSERT";
        case VimMode::Visual:  return "VISUAL";
        case VimMode::Command: return "COMMAND";
    }

    return {};
}

inline juce::String getPaneModifierName (PaneModifier mod)
{
    switch (mod)
    {
        case PaneModifier::Shift: return "shift";
        case PaneModifier::Ctrl:  return "ctrl";
        case PaneModifier::Alt:   return "alt";
    }

    return {};
}

inline bool paneModifierFromName (const juce::String& name, PaneModifier& result)
{
    auto n = name.trim().toLowerCase();

    if (n == "shift")                      { result = PaneModifier::Shift; return true; }
    if (n == "ctrl" || n == "control")     { result = PaneModifier::Ctrl;  return true; }
    if (n == "alt" || n == "meta")         { result = PaneModifier::Alt;   return true; }

    return false;
}

} // namespace ll
