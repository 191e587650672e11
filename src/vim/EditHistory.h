#pragma once

#include <juce_data_structures/juce_data_structures.h>
#include <functional>

namespace ll
{

/** Undo/redo for a text buffer, kept as before/after snapshots on a
    juce::UndoManager. Every snapshot recorded between two calls to
    beginTransaction() undoes as one step.
*/
class EditHistory
{
public:
    struct Snapshot
    {
        juce::String text;
        int cursor = 0;
    };

    // Called with the snapshot to restore when a step is undone or redone.
    using ApplyFunction = std::function<void (const Snapshot&)>;

    explicit EditHistory (ApplyFunction applyFunction);

    void beginTransaction (const juce::String& name = {});

    /** Applies after through the apply function and records the step. */
    void perform (const Snapshot& before, const Snapshot& after);

    bool undo();
    bool redo();
    bool canUndo() const;
    bool canRedo() const;

    void clear();

    juce::String getUndoDescription() const;

private:
    juce::UndoManager undoManager;
    ApplyFunction apply;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (EditHistory)
};

} // namespace ll
