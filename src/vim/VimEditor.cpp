#include "VimEditor.h"

namespace ll
{

VimEditor::VimEditor (Registers& r)
    : registers (r),
      history ([this] (const EditHistory::Snapshot& s) { restore (s); })
{
}

VimEditor::Outcome VimEditor::handleAction (NavigationAction action, juce::juce_wchar character)
{
    switch (mode)
    {
        case VimMode::Normal:  return handleNormalAction (action, character);
        case VimMode::Insert:  return handleInsertAction (action, character);
        case VimMode::Visual:  return handleVisualAction (action);
        case VimMode::Command: return handleCommandAction (action, character);
    }

    return Ignored;
}

// ─── Modes ──────────────────────────────────────────────────────────────────

void VimEditor::setMode (VimMode newMode)
{
    if (mode == newMode)
        return;

    mode = newMode;
    awaitingReplacement = false;
    resetCounts();

    listeners.call (&Listener::vimModeChanged, mode);
}

void VimEditor::enterNormalMode()
{
    commandLine.clear();
    setMode (VimMode::Normal);
}

void VimEditor::enterInsertMode()
{
    history.beginTransaction ("Insert");
    setMode (VimMode::Insert);
}

// ─── Normal mode ────────────────────────────────────────────────────────────

VimEditor::Outcome VimEditor::handleNormalAction (NavigationAction action, juce::juce_wchar character)
{
    using A = NavigationAction;

    if (awaitingReplacement)
    {
        awaitingReplacement = false;
        int n = takeCount();

        if (action != A::InsertChar || character == 0)
            return StateChanged;

        // Like vim, a count that runs past the end of the line replaces nothing
        if (cursor + n > getLineEnd (cursor))
            return StateChanged;

        auto replacement = juce::String::repeatedString (juce::String::charToString (character), n);
        replaceRange (cursor, cursor + n, replacement, cursor + n - 1);
        return BufferChanged;
    }

    switch (action)
    {
        case A::MoveLeft:
        case A::MoveRight:
        case A::MoveUp:
        case A::MoveDown:
        case A::MoveToStart:
        case A::MoveToEnd:
        case A::MoveToNextWord:
        case A::MoveToPreviousWord:
        {
            int n = takeCount();

            for (int i = 0; i < n; ++i)
                if (! applyMotion (action))
                    break;

            return CursorMoved;
        }

        case A::EnterInsertMode:
            enterInsertMode();
            return ModeChanged;

        case A::EnterAppendMode:
            cursor = std::min (cursor + 1, getLineEnd (cursor));
            enterInsertMode();
            return ModeChanged;

        case A::OpenLineBelow:
        {
            const int end = getLineEnd (cursor);
            enterInsertMode();
            replaceRange (end, end, "\n", end + 1);
            return ModeChanged;
        }

        case A::OpenLineAbove:
        {
            const int start = getLineStart (cursor);
            enterInsertMode();
            replaceRange (start, start, "\n", start);
            return ModeChanged;
        }

        case A::EnterVisualMode:
            anchor = cursor;
            setMode (VimMode::Visual);
            return ModeChanged;

        case A::EnterCommandMode:
            commandLine.clear();
            setMode (VimMode::Command);
            return ModeChanged;

        case A::ToggleViewEditMode:
            enterInsertMode();
            return ModeChanged;

        case A::Cancel:
            if (hasPendingCount())
            {
                resetCounts();
                return StateChanged;
            }
            return Ignored;

        case A::DeleteChar:
        {
            int n = takeCount();
            int end = getLineEnd (cursor);
            int last = std::min (end, cursor + n);

            if (last <= cursor)
                return Ignored;

            registers.store (text.substring (cursor, last), false, Registers::SmallDelete);
            replaceRange (cursor, last, {}, cursor);
            return BufferChanged;
        }

        case A::ReplaceChar:
            awaitingReplacement = true;
            return StateChanged;

        case A::Copy:
            resetCounts();
            registers.store (getCurrentLine(), false, Registers::Yank);
            return StateChanged;

        case A::CopyRow:
            resetCounts();
            yankLines (cursor, cursor, false);
            return StateChanged;

        case A::Cut:
        {
            resetCounts();
            int start = getLineStart (cursor);
            int end = getLineEnd (cursor);

            if (end == start)
                return Ignored;

            registers.store (text.substring (start, end), false, Registers::Delete);
            replaceRange (start, end, {}, start);
            return BufferChanged;
        }

        case A::CutRow:
            resetCounts();

            if (text.isEmpty())
                return Ignored;

            yankLines (cursor, cursor, true);
            return BufferChanged;

        case A::Paste:
            return paste (takeCount()) ? BufferChanged : Ignored;

        case A::Undo:
            resetCounts();
            return history.undo() ? BufferChanged : Ignored;

        case A::Redo:
            resetCounts();
            return history.redo() ? BufferChanged : Ignored;

        default:
            break;
    }

    return Ignored;
}

// ─── Insert mode ────────────────────────────────────────────────────────────

VimEditor::Outcome VimEditor::handleInsertAction (NavigationAction action, juce::juce_wchar character)
{
    using A = NavigationAction;

    switch (action)
    {
        case A::InsertChar:
            if (character == 0)
                return Ignored;
            insertText (juce::String::charToString (character));
            return BufferChanged;

        case A::InsertNewline:
            insertText ("\n");
            return BufferChanged;

        case A::DeleteCharBefore:
            return deleteBefore() ? BufferChanged : Ignored;

        case A::DeleteChar:
            return deleteAt() ? BufferChanged : Ignored;

        case A::Paste:
            return paste (1) ? BufferChanged : Ignored;

        case A::MoveLeft:
        case A::MoveRight:
        case A::MoveUp:
        case A::MoveDown:
        case A::MoveToStart:
        case A::MoveToEnd:
        case A::MoveToNextWord:
        case A::MoveToPreviousWord:
            applyMotion (action);
            return CursorMoved;

        case A::EnterNormalMode:
        case A::Cancel:
        case A::ToggleViewEditMode:
            setMode (VimMode::Normal);
            return ModeChanged;

        default:
            break;
    }

    return Ignored;
}

// ─── Visual mode ────────────────────────────────────────────────────────────

VimEditor::Outcome VimEditor::handleVisualAction (NavigationAction action)
{
    using A = NavigationAction;

    switch (action)
    {
        case A::MoveLeft:
        case A::MoveRight:
        case A::MoveUp:
        case A::MoveDown:
        case A::MoveToStart:
        case A::MoveToEnd:
        case A::MoveToNextWord:
        case A::MoveToPreviousWord:
            applyMotion (action);
            return CursorMoved;

        case A::EnterNormalMode:
        case A::EnterVisualMode:
        case A::Cancel:
            setMode (VimMode::Normal);
            return ModeChanged;

        case A::Copy:
            yankSelection (false);
            return ModeChanged;

        case A::Cut:
        case A::DeleteChar:
            if (text.isEmpty())
            {
                setMode (VimMode::Normal);
                return ModeChanged;
            }
            yankSelection (true);
            return BufferChanged;

        case A::CopyRow:
        case A::CutRow:
        {
            auto sel = getSelection();
            bool cut = action == A::CutRow;

            yankLines (sel.getStart(), std::max (sel.getStart(), sel.getEnd() - 1), cut);

            if (! cut)
                cursor = getLineStart (sel.getStart());

            setMode (VimMode::Normal);
            return cut ? BufferChanged : ModeChanged;
        }

        case A::Paste:
        {
            auto entry = registers.get();

            if (entry.isEmpty())
                return Ignored;

            auto sel = getSelection();
            replaceRange (sel.getStart(), sel.getEnd(), entry.text,
                          sel.getStart() + entry.text.length());
            setMode (VimMode::Normal);
            return BufferChanged;
        }

        default:
            break;
    }

    return Ignored;
}

juce::Range<int> VimEditor::getSelection() const
{
    int len = text.length();

    if (len == 0)
        return {};

    int lo = std::min (anchor, cursor);
    int hi = std::min (std::max (anchor, cursor), len - 1);
    lo = std::min (lo, hi);

    return { lo, hi + 1 };
}

void VimEditor::yankSelection (bool cut)
{
    auto sel = getSelection();
    auto selected = text.substring (sel.getStart(), sel.getEnd());

    if (cut)
    {
        registers.store (selected, false, Registers::Delete);
        replaceRange (sel.getStart(), sel.getEnd(), {}, sel.getStart());
    }
    else
    {
        registers.store (selected, false, Registers::Yank);
        cursor = sel.getStart();
    }

    setMode (VimMode::Normal);
}

// ─── Command mode ───────────────────────────────────────────────────────────

VimEditor::Outcome VimEditor::handleCommandAction (NavigationAction action, juce::juce_wchar character)
{
    using A = NavigationAction;

    switch (action)
    {
        case A::InsertChar:
            if (character == 0)
                return Ignored;
            commandLine += character;
            return StateChanged;

        case A::DeleteCharBefore:
            if (commandLine.isEmpty())
            {
                setMode (VimMode::Normal);
                return ModeChanged;
            }
            commandLine = commandLine.dropLastCharacters (1);
            return StateChanged;

        case A::Confirm:
            enteredCommand = commandLine.trim();
            commandLine.clear();
            setMode (VimMode::Normal);
            return CommandEntered;

        case A::EnterNormalMode:
        case A::Cancel:
            commandLine.clear();
            setMode (VimMode::Normal);
            return ModeChanged;

        default:
            break;
    }

    return Ignored;
}

juce::String VimEditor::takeEnteredCommand()
{
    auto command = enteredCommand;
    enteredCommand.clear();
    return command;
}

// ─── Cursor editing mode ────────────────────────────────────────────────────

VimEditor::Outcome VimEditor::handleCursorAction (NavigationAction action, juce::juce_wchar character)
{
    using A = NavigationAction;

    switch (action)
    {
        case A::Undo:
        {
            bool undone = history.undo();
            history.beginTransaction ("Insert");
            return undone ? BufferChanged : Ignored;
        }

        case A::Redo:
        {
            bool redone = history.redo();
            history.beginTransaction ("Insert");
            return redone ? BufferChanged : Ignored;
        }

        case A::Copy:
            registers.store (getCurrentLine(), false, Registers::Yank);
            return StateChanged;

        case A::Cut:
        {
            int start = getLineStart (cursor);
            int end = getLineEnd (cursor);

            if (end == start)
                return Ignored;

            registers.store (text.substring (start, end), false, Registers::Delete);
            replaceRange (start, end, {}, start);
            return BufferChanged;
        }

        case A::EnterNormalMode:
        case A::Cancel:
        case A::ToggleViewEditMode:
            return Ignored;

        default:
            break;
    }

    return handleInsertAction (action, character);
}

// ─── Count helpers ──────────────────────────────────────────────────────────

bool VimEditor::isDigitForCount (juce::juce_wchar c, bool countPending)
{
    if (c >= '1' && c <= '9')
        return true;

    return c == '0' && countPending;
}

void VimEditor::accumulateDigit (int digit)
{
    count = std::min (count * 10 + digit, 99999);
}

int VimEditor::takeCount()
{
    int n = getEffectiveCount();
    resetCounts();
    return n;
}

// ─── Motions ────────────────────────────────────────────────────────────────

int VimEditor::getLineStart (int pos) const
{
    for (int i = std::min (pos, text.length()) - 1; i >= 0; --i)
        if (text[i] == '\n')
            return i + 1;

    return 0;
}

int VimEditor::getLineEnd (int pos) const
{
    int idx = text.indexOfChar (std::max (0, pos), '\n');
    return idx >= 0 ? idx : text.length();
}

bool VimEditor::applyMotion (NavigationAction action)
{
    using A = NavigationAction;

    const int old = cursor;
    const int start = getLineStart (cursor);
    const int end = getLineEnd (cursor);
    const int column = cursor - start;

    switch (action)
    {
        case A::MoveLeft:
            if (cursor > start)
                --cursor;
            break;

        case A::MoveRight:
            if (cursor < end)
                ++cursor;
            break;

        case A::MoveUp:
            if (start > 0)
            {
                int prevEnd = start - 1;
                int prevStart = getLineStart (prevEnd);
                cursor = prevStart + std::min (column, prevEnd - prevStart);
            }
            break;

        case A::MoveDown:
            if (end < text.length())
            {
                int nextStart = end + 1;
                int nextEnd = getLineEnd (nextStart);
                cursor = nextStart + std::min (column, nextEnd - nextStart);
            }
            break;

        case A::MoveToStart:
            cursor = start;
            break;

        case A::MoveToEnd:
            cursor = end;
            break;

        case A::MoveToNextWord:
        {
            int space = -1;

            for (int i = cursor; i < end; ++i)
            {
                if (text[i] == ' ')
                {
                    space = i;
                    break;
                }
            }

            cursor = space >= 0 ? std::min (space + 1, end) : end;
            break;
        }

        case A::MoveToPreviousWord:
        {
            int target = start;

            for (int i = cursor - 2; i >= start; --i)
            {
                if (text[i] == ' ')
                {
                    target = i + 1;
                    break;
                }
            }

            cursor = target;
            break;
        }

        default:
            break;
    }

    return cursor != old;
}

void VimEditor::setCursor (int newCursor)
{
    cursor = juce::jlimit (0, text.length(), newCursor);
}

int VimEditor::getLineIndex() const
{
    int line = 0;

    for (int i = 0; i < cursor; ++i)
        if (text[i] == '\n')
            ++line;

    return line;
}

int VimEditor::getColumn() const
{
    return cursor - getLineStart (cursor);
}

juce::String VimEditor::getCurrentLine() const
{
    return text.substring (getLineStart (cursor), getLineEnd (cursor));
}

// ─── Edits ──────────────────────────────────────────────────────────────────

void VimEditor::setText (const juce::String& newText)
{
    text = newText;
    cursor = 0;
    anchor = 0;
    awaitingReplacement = false;
    resetCounts();
    history.clear();
}

void VimEditor::restore (const EditHistory::Snapshot& snapshot)
{
    text = snapshot.text;
    cursor = juce::jlimit (0, text.length(), snapshot.cursor);
}

void VimEditor::replaceRange (int start, int end, const juce::String& replacement, int newCursor)
{
    // Outside Insert each edit is its own undo step; an Insert session is one step.
    if (mode != VimMode::Insert)
        history.beginTransaction();

    EditHistory::Snapshot before { text, cursor };
    EditHistory::Snapshot after { text.replaceSection (start, end - start, replacement), newCursor };
    history.perform (before, after);
}

bool VimEditor::insertText (const juce::String& s)
{
    if (s.isEmpty())
        return false;

    replaceRange (cursor, cursor, s, cursor + s.length());
    return true;
}

bool VimEditor::deleteBefore()
{
    if (cursor == 0)
        return false;

    replaceRange (cursor - 1, cursor, {}, cursor - 1);
    return true;
}

bool VimEditor::deleteAt()
{
    if (cursor >= text.length())
        return false;

    replaceRange (cursor, cursor + 1, {}, cursor);
    return true;
}

bool VimEditor::paste (int times)
{
    auto entry = registers.get();

    if (entry.isEmpty())
        return false;

    // A counted paste never grows the buffer by more than maxPasteLength
    const int unit = entry.text.length() + (entry.linewise ? 1 : 0);
    times = juce::jlimit (1, std::max (1, maxPasteLength / std::max (1, unit)), times);

    if (entry.linewise)
    {
        int end = getLineEnd (cursor);
        juce::String block;

        for (int i = 0; i < times; ++i)
            block << "\n" << entry.text;

        replaceRange (end, end, block, end + 1);
        return true;
    }

    auto block = juce::String::repeatedString (entry.text, times);
    replaceRange (cursor, cursor, block, cursor + block.length());
    return true;
}

void VimEditor::yankLines (int fromPos, int toPos, bool cut)
{
    int start = getLineStart (std::min (fromPos, toPos));
    int end = getLineEnd (std::max (fromPos, toPos));

    registers.store (text.substring (start, end), true, cut ? Registers::Delete : Registers::Yank);

    if (! cut)
        return;

    if (end < text.length())
        replaceRange (start, end + 1, {}, start);
    else if (start > 0)
        replaceRange (start - 1, end, {}, getLineStart (start - 1));
    else
        replaceRange (start, end, {}, 0);
}

} // namespace ll
