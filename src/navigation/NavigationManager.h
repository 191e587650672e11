#pragma once

#include "navigation/BoxManager.h"

namespace ll
{

struct FocusSnapshot
{
    PaneKind pane = PaneKind::Connections;
    bool hasBox = false;
    BoxKind box = BoxKind::TextInput;
    EditingMode editingMode = EditingMode::Vim;
    bool hasVimMode = false;
    VimMode vimMode = VimMode::Normal;
    bool cursorEditing = false;
    int pendingCount = 0;
    juce::String commandLine;     // editor command mode or the command line pane
    bool commandActive = false;
    bool modalOpen = false;

    bool operator== (const FocusSnapshot& o) const
    {
        return pane == o.pane && hasBox == o.hasBox && box == o.box
            && editingMode == o.editingMode && hasVimMode == o.hasVimMode
            && vimMode == o.vimMode && cursorEditing == o.cursorEditing
            && pendingCount == o.pendingCount && commandLine == o.commandLine
            && commandActive == o.commandActive && modalOpen == o.modalOpen;
    }

    bool operator!= (const FocusSnapshot& o) const { return ! (*this == o); }
};

/** Owns the panes and the focus.

    Directional moves, with or without the pane modifier, pick the nearest
    box in the current pane first, then the nearest pane, among candidates
    lying entirely on the requested side.
    Candidates overlapping on the perpendicular axis win, then the smallest
    gap, then the closest centre, then declaration order. A move with no
    candidate does nothing; it never wraps.
*/
class NavigationManager
{
public:
    class Listener
    {
    public:
        virtual ~Listener() = default;
        virtual void focusChanged (PaneKind pane) = 0;
    };

    NavigationManager (BoxManager& boxManager, std::vector<std::unique_ptr<Pane>> panes);

    Effect dispatch (const KeyResolution& resolution);

    // ── Focus ────────────────────────────────────────────────────
    bool focusPane (PaneKind kind);
    bool focusBox (BoxKind kind);
    bool moveFocus (Direction direction);
    bool cyclePane (int delta);
    bool cycleBox (int delta);
    bool focusLocation (const TargetLocation& target);

    Pane& getFocusedPane() const;
    Pane* getPane (PaneKind kind) const;
    int getNumPanes() const { return static_cast<int> (panes.size()); }

    // The modal on top of the stack if one is open, else the pane's active box
    Box* getFocusedBox() const;

    FocusSnapshot getSnapshot() const;
    juce::String getNavigationInfo() const;

    // ── Modals ───────────────────────────────────────────────────
    void pushModal (std::unique_ptr<Box> modal);
    bool popModal();
    bool hasModal() const { return ! modals.empty(); }
    int getNumModals() const { return static_cast<int> (modals.size()); }

    // ── Command line pane ────────────────────────────────────────
    const juce::String& getCommandLine() const { return commandLine; }

    /** Interprets a ':' command; used by the command line pane and by
        editors in command mode.
    */
    Effect runCommand (const juce::String& command);

    void addListener (Listener* l)    { listeners.add (l); }
    void removeListener (Listener* l) { listeners.remove (l); }

private:
    BoxManager& boxManager;
    std::vector<std::unique_ptr<Pane>> panes;
    int focusedPane = 0;
    int paneBeforeCommandLine = 0;

    std::vector<std::unique_ptr<Box>> modals;
    juce::String commandLine;

    juce::ListenerList<Listener> listeners;

    int indexOfPane (PaneKind kind) const;
    bool setFocusedPane (int index);
    void notifyFocusChanged();

    Effect confirm();
    Effect cancel();
    Effect focusEffect (bool changed) const;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (NavigationManager)
};

} // namespace ll
