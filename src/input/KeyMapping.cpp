#include "KeyMapping.h"
#include "input/KeyChord.h"

namespace ll
{

namespace
{

const char* const scopeNames[KeyMapping::NumScopes] =
{
    "global",
    "connections", "query_input", "results", "schema_explorer", "command_line",
    "vim_normal", "vim_insert", "vim_visual", "vim_command",
    "cursor_edit"
};

} // namespace

// ─── Defaults ───────────────────────────────────────────────────────────────

KeyMapping KeyMapping::createDefaults()
{
    using A = NavigationAction;
    KeyMapping m;

    // Pane and box focus
    m.bind (Global, "c",      A::FocusConnections);
    m.bind (Global, "q",      A::FocusQueryInput);
    m.bind (Global, "d",      A::FocusResults);
    m.bind (Global, "t",      A::FocusSchemaExplorer);
    m.bind (Global, ":",      A::FocusCommandLine);
    m.bind (Global, "Alt+t",  A::FocusTextInput);
    m.bind (Global, "Alt+d",  A::FocusDataTable);
    m.bind (Global, "Alt+v",  A::FocusTreeView);
    m.bind (Global, "Alt+i",  A::FocusListView);
    m.bind (Global, "Alt+m",  A::FocusModal);

    // Directional
    m.bind (Global, "h",      A::MoveLeft);
    m.bind (Global, "j",      A::MoveDown);
    m.bind (Global, "k",      A::MoveUp);
    m.bind (Global, "l",      A::MoveRight);
    m.bind (Global, "Left",   A::MoveLeft);
    m.bind (Global, "Down",   A::MoveDown);
    m.bind (Global, "Up",     A::MoveUp);
    m.bind (Global, "Right",  A::MoveRight);
    m.bind (Global, "Home",   A::MoveToStart);
    m.bind (Global, "End",    A::MoveToEnd);

    m.bind (Global, "Tab",     A::NextPane);
    m.bind (Global, "BackTab", A::PreviousPane);
    m.bind (Global, "n",       A::NextBox);
    m.bind (Global, "p",       A::PreviousBox);

    m.bind (Global, "e",      A::ToggleViewEditMode);
    m.bind (Global, "/",      A::Search);
    m.bind (Global, "Enter",  A::Confirm);
    m.bind (Global, "Esc",    A::Cancel);
    m.bind (Global, "Ctrl+q", A::Quit);
    m.bind (Global, "Ctrl+c", A::Copy);
    m.bind (Global, "Ctrl+v", A::Paste);
    m.bind (Global, "Ctrl+x", A::Cut);

    // Results
    m.bind (ResultsPane, "g",       A::FirstPage);
    m.bind (ResultsPane, "Shift+g", A::LastPage);
    m.bind (ResultsPane, ",",       A::NextPage);
    m.bind (ResultsPane, ".",       A::PreviousPage);
    m.bind (ResultsPane, "s",       A::SortByColumn);
    m.bind (ResultsPane, "f",       A::FollowForeignKey);
    m.bind (ResultsPane, "y",       A::Copy);
    m.bind (ResultsPane, "Shift+y", A::CopyRow);

    // Command line pane
    m.bind (CommandLinePane, "Esc",       A::Cancel);
    m.bind (CommandLinePane, "Enter",     A::Confirm);
    m.bind (CommandLinePane, "Backspace", A::DeleteCharBefore);

    // Vim normal
    m.bind (VimNormal, "i",       A::EnterInsertMode);
    m.bind (VimNormal, "a",       A::EnterAppendMode);
    m.bind (VimNormal, "o",       A::OpenLineBelow);
    m.bind (VimNormal, "Shift+o", A::OpenLineAbove);
    m.bind (VimNormal, "v",       A::EnterVisualMode);
    m.bind (VimNormal, ":",       A::EnterCommandMode);
    m.bind (VimNormal, "x",       A::DeleteChar);
    m.bind (VimNormal, "Delete",  A::DeleteChar);
    m.bind (VimNormal, "r",       A::ReplaceChar);
    m.bind (VimNormal, "y",       A::Copy);
    m.bind (VimNormal, "Shift+y", A::CopyRow);
    m.bind (VimNormal, "Shift+s", A::Cut);
    m.bind (VimNormal, "Shift+d", A::CutRow);
    m.bind (VimNormal, "p",       A::Paste);
    m.bind (VimNormal, "u",       A::Undo);
    m.bind (VimNormal, "Ctrl+r",  A::Redo);
    m.bind (VimNormal, "0",       A::MoveToStart);
    m.bind (VimNormal, "$",       A::MoveToEnd);
    m.bind (VimNormal, "w",       A::MoveToNextWord);
    m.bind (VimNormal, "b",       A::MoveToPreviousWord);

    // Vim insert
    m.bind (VimInsert, "Esc",       A::EnterNormalMode);
    m.bind (VimInsert, "Backspace", A::DeleteCharBefore);
    m.bind (VimInsert, "Delete",    A::DeleteChar);
    m.bind (VimInsert, "Enter",     A::InsertNewline);
    m.bind (VimInsert, "Left",      A::MoveLeft);
    m.bind (VimInsert, "Right",     A::MoveRight);
    m.bind (VimInsert, "Up",        A::MoveUp);
    m.bind (VimInsert, "Down",      A::MoveDown);
    m.bind (VimInsert, "Home",      A::MoveToStart);
    m.bind (VimInsert, "End",       A::MoveToEnd);

    // Vim visual
    m.bind (VimVisual, "Esc",     A::EnterNormalMode);
    m.bind (VimVisual, "v",       A::EnterNormalMode);
    m.bind (VimVisual, "y",       A::Copy);
    m.bind (VimVisual, "Shift+y", A::CopyRow);
    m.bind (VimVisual, "d",       A::Cut);
    m.bind (VimVisual, "x",       A::Cut);
    m.bind (VimVisual, "Shift+d", A::CutRow);
    m.bind (VimVisual, "p",       A::Paste);
    m.bind (VimVisual, "0",       A::MoveToStart);
    m.bind (VimVisual, "$",       A::MoveToEnd);
    m.bind (VimVisual, "w",       A::MoveToNextWord);
    m.bind (VimVisual, "b",       A::MoveToPreviousWord);

    // Vim command
    m.bind (VimCommand, "Esc",       A::EnterNormalMode);
    m.bind (VimCommand, "Enter",     A::Confirm);
    m.bind (VimCommand, "Backspace", A::DeleteCharBefore);

    // Cursor mode, edit state
    m.bind (CursorEdit, "Esc",       A::ToggleViewEditMode);
    m.bind (CursorEdit, "Backspace", A::DeleteCharBefore);
    m.bind (CursorEdit, "Delete",    A::DeleteChar);
    m.bind (CursorEdit, "Enter",     A::InsertNewline);
    m.bind (CursorEdit, "Left",      A::MoveLeft);
    m.bind (CursorEdit, "Right",     A::MoveRight);
    m.bind (CursorEdit, "Up",        A::MoveUp);
    m.bind (CursorEdit, "Down",      A::MoveDown);
    m.bind (CursorEdit, "Home",      A::MoveToStart);
    m.bind (CursorEdit, "End",       A::MoveToEnd);
    m.bind (CursorEdit, "Ctrl+z",    A::Undo);
    m.bind (CursorEdit, "Ctrl+y",    A::Redo);

    return m;
}

// ─── Merge ──────────────────────────────────────────────────────────────────

KeyMapping KeyMapping::merge (const KeyMapping& defaults, const KeyMapping& user,
                              PaneModifier paneModifier, juce::StringArray* collisions)
{
    KeyMapping result (defaults);
    result.paneModifier = paneModifier;

    for (int s = 0; s < NumScopes; ++s)
    {
        for (auto& entry : user.tables[s])
        {
            if (entry.second == NavigationAction::None)
                result.tables[s].erase (entry.first);
            else
                result.tables[s][entry.first] = entry.second;
        }
    }

    auto& global = result.tables[Global];
    std::vector<Entry> composed;

    for (auto& entry : global)
    {
        if (! isDirectionalMove (entry.second) || KeyChord::hasAnyModifier (entry.first))
            continue;

        auto chord = KeyChord::withModifier (entry.first, paneModifier);

        if (chord.isNotEmpty())
            composed.push_back ({ chord, entry.second });
    }

    for (auto& c : composed)
    {
        auto existing = global.find (c.first);

        if (existing == global.end())
        {
            global[c.first] = c.second;
        }
        else if (existing->second != c.second)
        {
            auto message = "pane modifier chord " + c.first + " (" + getActionName (c.second)
                           + ") is already bound to " + getActionName (existing->second);

            if (collisions != nullptr)
                collisions->addIfNotAlreadyThere (message);
        }
    }

    return result;
}

// ─── Tables ─────────────────────────────────────────────────────────────────

void KeyMapping::bind (Scope scope, const juce::String& canonicalChord, NavigationAction action)
{
    tables[scope][canonicalChord] = action;
}

void KeyMapping::unbind (Scope scope, const juce::String& canonicalChord)
{
    tables[scope].erase (canonicalChord);
}

NavigationAction KeyMapping::lookup (Scope scope, const juce::String& canonicalChord) const
{
    auto it = tables[scope].find (canonicalChord);
    return it != tables[scope].end() ? it->second : NavigationAction::None;
}

bool KeyMapping::contains (Scope scope, const juce::String& canonicalChord) const
{
    return tables[scope].count (canonicalChord) > 0;
}

int KeyMapping::getNumBindings (Scope scope) const
{
    return static_cast<int> (tables[scope].size());
}

std::vector<KeyMapping::Entry> KeyMapping::getEntries (Scope scope) const
{
    return { tables[scope].begin(), tables[scope].end() };
}

bool KeyMapping::operator== (const KeyMapping& other) const
{
    if (paneModifier != other.paneModifier)
        return false;

    for (int s = 0; s < NumScopes; ++s)
        if (tables[s] != other.tables[s])
            return false;

    return true;
}

// ─── Scopes ─────────────────────────────────────────────────────────────────

KeyMapping::Scope KeyMapping::getScopeForPane (PaneKind pane)
{
    switch (pane)
    {
        case PaneKind::Connections:    return ConnectionsPane;
        case PaneKind::QueryInput:     return QueryInputPane;
        case PaneKind::Results:        return ResultsPane;
        case PaneKind::SchemaExplorer: return SchemaExplorerPane;
        case PaneKind::CommandLine:    return CommandLinePane;
    }

    return Global;
}

KeyMapping::Scope KeyMapping::getScopeForVimMode (VimMode mode)
{
    switch (mode)
    {
        case VimMode::Normal:  return VimNormal;
        case VimMode::Insert:  return VimInsert;
        case VimMode::Visual:  return VimVisual;
        case VimMode::Command: return VimCommand;
    }

    return VimNormal;
}

juce::String KeyMapping::getScopeName (Scope scope)
{
    if (scope < 0 || scope >= NumScopes)
        return {};

    return scopeNames[scope];
}

bool KeyMapping::scopeFromName (const juce::String& name, Scope& result)
{
    auto n = name.trim().toLowerCase();

    for (int s = 0; s < NumScopes; ++s)
    {
        if (n == scopeNames[s])
        {
            result = static_cast<Scope> (s);
            return true;
        }
    }

    return false;
}

} // namespace ll
