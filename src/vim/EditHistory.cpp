#include "EditHistory.h"

namespace ll
{

namespace
{

class SnapshotAction : public juce::UndoableAction
{
public:
    SnapshotAction (const EditHistory::ApplyFunction& applyFn,
                    const EditHistory::Snapshot& beforeState,
                    const EditHistory::Snapshot& afterState)
        : apply (applyFn), before (beforeState), after (afterState)
    {
    }

    bool perform() override
    {
        apply (after);
        return true;
    }

    bool undo() override
    {
        apply (before);
        return true;
    }

    int getSizeInUnits() override
    {
        return before.text.length() + after.text.length() + 1;
    }

private:
    const EditHistory::ApplyFunction& apply;
    EditHistory::Snapshot before, after;
};

} // namespace

EditHistory::EditHistory (ApplyFunction applyFunction)
    : apply (std::move (applyFunction))
{
}

void EditHistory::beginTransaction (const juce::String& name)
{
    undoManager.beginNewTransaction (name);
}

void EditHistory::perform (const Snapshot& before, const Snapshot& after)
{
    undoManager.perform (new SnapshotAction (apply, before, after));
}

bool EditHistory::undo()
{
    return undoManager.undo();
}

bool EditHistory::redo()
{
    return undoManager.redo();
}

bool EditHistory::canUndo() const
{
    return undoManager.canUndo();
}

bool EditHistory::canRedo() const
{
    return undoManager.canRedo();
}

void EditHistory::clear()
{
    undoManager.clearUndoHistory();
}

juce::String EditHistory::getUndoDescription() const
{
    return undoManager.getUndoDescription();
}

} // namespace ll
