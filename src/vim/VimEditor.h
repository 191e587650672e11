#pragma once

#include "input/NavigationAction.h"
#include "vim/EditHistory.h"
#include "vim/Registers.h"

namespace ll
{

/** Modal text editor owned by an editable box.

    The buffer is a single string with '\n' line breaks and the cursor is an
    offset in [0, length]. Normal-mode motions and counted edits repeat
    getEffectiveCount() times; motions clamp at line and buffer bounds and
    never wrap.
*/
class VimEditor
{
public:
    enum Outcome
    {
        Ignored,         // action has no meaning in the current state
        StateChanged,    // pending state (replace, command line) changed
        CursorMoved,
        BufferChanged,
        ModeChanged,
        CommandEntered   // the command line was confirmed, see takeEnteredCommand()
    };

    class Listener
    {
    public:
        virtual ~Listener() = default;
        virtual void vimModeChanged (VimMode newMode) = 0;
    };

    static constexpr int maxPasteLength = 1 << 20;

    explicit VimEditor (Registers& registers);

    /** Modal dispatch for Vim editing mode. */
    Outcome handleAction (NavigationAction action, juce::juce_wchar character = 0);

    /** Non-modal dispatch for Cursor editing mode while the box is in its
        edit state: every key edits or moves, there are no sub-modes.
    */
    Outcome handleCursorAction (NavigationAction action, juce::juce_wchar character = 0);

    VimMode getMode() const { return mode; }
    void enterNormalMode();
    void enterInsertMode();

    // ── Buffer ───────────────────────────────────────────────────
    const juce::String& getText() const { return text; }

    /** Replaces the buffer, moves the cursor to the start, drops any
        selection or pending state and clears the undo history.
    */
    void setText (const juce::String& newText);

    int getCursor() const { return cursor; }
    void setCursor (int newCursor);

    int getLineIndex() const;
    int getColumn() const;
    juce::String getCurrentLine() const;

    // ── Visual selection ─────────────────────────────────────────
    bool hasSelection() const { return mode == VimMode::Visual; }
    int getAnchor() const { return anchor; }

    /** Inclusive selection as a half-open range, clamped to the buffer. */
    juce::Range<int> getSelection() const;

    // ── Counts ───────────────────────────────────────────────────
    static bool isDigitForCount (juce::juce_wchar c, bool countPending);
    void accumulateDigit (int digit);
    bool hasPendingCount() const { return count > 0; }
    int getPendingCount() const { return count; }
    int getEffectiveCount() const { return std::max (1, count); }
    void resetCounts() { count = 0; }

    /** Returns the effective count and resets it. */
    int takeCount();

    bool isAwaitingReplacement() const { return awaitingReplacement; }

    // ── Command line ─────────────────────────────────────────────
    const juce::String& getCommandLine() const { return commandLine; }
    juce::String takeEnteredCommand();

    // ── Undo ─────────────────────────────────────────────────────
    bool canUndo() const { return history.canUndo(); }
    bool canRedo() const { return history.canRedo(); }

    void addListener (Listener* l)    { listeners.add (l); }
    void removeListener (Listener* l) { listeners.remove (l); }

private:
    Registers& registers;
    EditHistory history;

    juce::String text;
    int cursor = 0;
    int anchor = 0;
    VimMode mode = VimMode::Normal;

    int count = 0;
    bool awaitingReplacement = false;

    juce::String commandLine;
    juce::String enteredCommand;

    juce::ListenerList<Listener> listeners;

    void setMode (VimMode newMode);

    Outcome handleNormalAction (NavigationAction action, juce::juce_wchar character);
    Outcome handleInsertAction (NavigationAction action, juce::juce_wchar character);
    Outcome handleVisualAction (NavigationAction action);
    Outcome handleCommandAction (NavigationAction action, juce::juce_wchar character);

    // ── Motions ──────────────────────────────────────────────────
    bool applyMotion (NavigationAction action);
    int getLineStart (int pos) const;
    int getLineEnd (int pos) const;

    // ── Edits (all recorded in the history) ──────────────────────
    void replaceRange (int start, int end, const juce::String& replacement, int newCursor);
    bool insertText (const juce::String& s);
    bool deleteBefore();
    bool deleteAt();
    bool paste (int times);
    void yankSelection (bool cut);
    void yankLines (int firstLine, int lastLine, bool cut);
    void restore (const EditHistory::Snapshot& snapshot);

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (VimEditor)
};

} // namespace ll
