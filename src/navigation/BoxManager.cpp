#include "BoxManager.h"

namespace ll
{

BoxManager::BoxManager (Registers& r)
    : registers (r)
{
}

bool BoxManager::isEditingAction (NavigationAction action)
{
    using A = NavigationAction;

    return (action >= A::EnterInsertMode && action <= A::ToggleViewEditMode)
        || (action >= A::InsertChar && action <= A::Redo)
        || action == A::Cut || action == A::CutRow || action == A::Paste;
}

bool BoxManager::isEditingText (const Box& box)
{
    auto* editor = box.getEditor();

    if (editor == nullptr)
        return false;

    if (box.getEditingMode() == EditingMode::Cursor)
        return box.isEditing();

    return editor->getMode() == VimMode::Insert;
}

bool BoxManager::dispatch (const KeyResolution& r, Box& box, PaneKind pane, Effect& out)
{
    out = Effect::make (Effect::None, pane);

    if (r.kind != KeyResolution::Action || r.paneDirectional)
        return false;

    if (box.getEditor() == nullptr)
        return dispatchRows (r, box, pane, out);

    if (box.getKind() == BoxKind::DataTable)
        return dispatchTable (r, box, pane, out);

    return dispatchText (r, box, pane, out);
}

void BoxManager::accumulateCount (Box& box, int digit)
{
    if (auto* editor = box.getEditor())
        editor->accumulateDigit (digit);
}

bool BoxManager::applyOutcome (VimEditor::Outcome outcome, VimEditor& editor, PaneKind pane, Effect& out)
{
    switch (outcome)
    {
        case VimEditor::Ignored:
            return false;

        case VimEditor::StateChanged:
        case VimEditor::CursorMoved:
            out = Effect::make (Effect::None, pane);
            return true;

        case VimEditor::BufferChanged:
            out = Effect::make (Effect::BufferChanged, pane);
            return true;

        case VimEditor::ModeChanged:
            out = Effect::make (Effect::ModeChanged, pane);
            return true;

        case VimEditor::CommandEntered:
        {
            auto command = editor.takeEnteredCommand();
            out = onCommand != nullptr ? onCommand (command) : Effect::make (Effect::ModeChanged, pane);
            return true;
        }
    }

    return false;
}

// ─── Text boxes ─────────────────────────────────────────────────────────────

bool BoxManager::dispatchText (const KeyResolution& r, Box& box, PaneKind pane, Effect& out)
{
    auto& editor = *box.getEditor();

    if (box.getEditingMode() == EditingMode::Vim)
        return applyOutcome (editor.handleAction (r.action, r.character), editor, pane, out);

    // Cursor editing mode
    if (r.action == NavigationAction::ToggleViewEditMode)
    {
        box.setEditing (! box.isEditing());

        if (box.isEditing())
            editor.enterInsertMode();
        else
            editor.enterNormalMode();

        out = Effect::make (Effect::ModeChanged, pane);
        return true;
    }

    if (! box.isEditing())
    {
        if (r.action == NavigationAction::Copy)
        {
            registers.store (editor.getText(), false, Registers::Yank);
            return true;
        }

        return false;
    }

    return applyOutcome (editor.handleCursorAction (r.action, r.character), editor, pane, out);
}

// ─── Data tables ────────────────────────────────────────────────────────────

void BoxManager::commitCell (Box& box)
{
    auto& editor = *box.getEditor();

    box.setCell (box.getRow(), box.getColumn(), editor.getText());
    box.setEditing (false);
    editor.enterNormalMode();
}

bool BoxManager::dispatchTable (const KeyResolution& r, Box& box, PaneKind pane, Effect& out)
{
    using A = NavigationAction;

    auto& editor = *box.getEditor();
    const bool vim = box.getEditingMode() == EditingMode::Vim;
    const auto action = r.action;

    if (isEditingText (box))
    {
        bool leaving = action == A::ToggleViewEditMode
                       || (vim && (action == A::EnterNormalMode || action == A::Cancel));

        if (leaving)
        {
            commitCell (box);
            out = Effect::make (Effect::BufferChanged, pane);
            return true;
        }

        auto outcome = vim ? editor.handleAction (action, r.character)
                           : editor.handleCursorAction (action, r.character);
        return applyOutcome (outcome, editor, pane, out);
    }

    if (vim && editor.getMode() != VimMode::Normal)
    {
        if (editor.getMode() == VimMode::Visual)
            editor.enterNormalMode();
        else
            return applyOutcome (editor.handleAction (action, r.character), editor, pane, out);
    }

    const bool entering = action == A::ToggleViewEditMode
                          || (vim && (action == A::EnterInsertMode || action == A::EnterAppendMode));

    if (entering)
    {
        editor.setText (box.getCurrentCell());

        if (action == A::EnterAppendMode)
            editor.setCursor (editor.getText().length());

        box.setEditing (true);
        editor.enterInsertMode();
        out = Effect::make (Effect::ModeChanged, pane);
        return true;
    }

    if (vim && action == A::EnterCommandMode)
        return applyOutcome (editor.handleAction (action), editor, pane, out);

    const int n = vim && isCountable (action) ? editor.takeCount() : 1;

    switch (action)
    {
        case A::MoveUp:    box.moveCursorBy (-n, 0); return true;
        case A::MoveDown:  box.moveCursorBy (n, 0);  return true;
        case A::MoveLeft:  box.moveCursorBy (0, -n); return true;
        case A::MoveRight: box.moveCursorBy (0, n);  return true;

        case A::MoveToStart:
            box.setCursorCell (box.getRow(), 0);
            return true;

        case A::MoveToEnd:
            box.setCursorCell (box.getRow(), box.getNumColumns() - 1);
            return true;

        case A::MoveToNextWord:
        case A::MoveToPreviousWord:
            return true;

        case A::Copy:
            if (box.getNumRows() > 0)
                registers.store (box.getCurrentCell(), false, Registers::Yank);
            return true;

        case A::CopyRow:
            if (box.getNumRows() > 0)
                registers.store (box.getRowText (box.getRow()), true, Registers::Yank);
            return true;

        case A::Cut:
            if (box.getNumRows() == 0)
                return true;

            registers.store (box.getCurrentCell(), false, Registers::Delete);
            box.setCell (box.getRow(), box.getColumn(), {});
            out = Effect::make (Effect::BufferChanged, pane);
            return true;

        case A::CutRow:
        {
            if (box.getNumRows() == 0)
                return true;

            registers.store (box.getRowText (box.getRow()), true, Registers::Delete);

            for (int c = 0; c < box.getNumColumns(); ++c)
                box.setCell (box.getRow(), c, {});

            out = Effect::make (Effect::BufferChanged, pane);
            return true;
        }

        case A::Paste:
        {
            auto entry = registers.get();

            if (entry.isEmpty() || box.getNumRows() == 0)
                return true;

            // A pasted row fills the cells from the cursor onwards
            if (entry.linewise)
            {
                juce::StringArray cells;
                cells.addTokens (entry.text, "\t", "");

                for (int i = 0; i < cells.size(); ++i)
                    box.setCell (box.getRow(), box.getColumn() + i, cells[i]);
            }
            else
            {
                box.setCell (box.getRow(), box.getColumn(), entry.text);
            }

            out = Effect::make (Effect::BufferChanged, pane);
            return true;
        }

        case A::Cancel:
            if (vim && editor.hasPendingCount())
            {
                editor.resetCounts();
                return true;
            }
            return false;

        default:
            break;
    }

    return isEditingAction (action);
}

// ─── Trees, lists, modals ───────────────────────────────────────────────────

bool BoxManager::dispatchRows (const KeyResolution& r, Box& box, PaneKind, Effect&)
{
    using A = NavigationAction;

    switch (r.action)
    {
        case A::MoveUp:      box.moveCursorBy (-1, 0); return true;
        case A::MoveDown:    box.moveCursorBy (1, 0);  return true;
        case A::MoveToStart: box.setCursorCell (0, box.getColumn()); return true;
        case A::MoveToEnd:   box.setCursorCell (box.getNumRows() - 1, box.getColumn()); return true;

        case A::Copy:
        case A::CopyRow:
            if (box.getNumRows() > 0)
                registers.store (box.getCurrentItemText(), false, Registers::Yank);
            return true;

        default:
            break;
    }

    // Editing is meaningless here; claim it so it stays a no-op
    return isEditingAction (r.action);
}

// ─── Box activation ─────────────────────────────────────────────────────────

bool BoxManager::cycleBox (Pane& pane, int delta)
{
    const int n = pane.getNumBoxes();

    if (n < 2)
        return false;

    int index = ((pane.getActiveBoxIndex() + delta) % n + n) % n;
    return pane.setActiveBoxIndex (index);
}

bool BoxManager::focusBox (Pane& pane, BoxKind kind)
{
    return pane.setActiveBoxIndex (pane.indexOfBox (kind));
}

} // namespace ll
