#include "NavigationManager.h"

namespace ll
{

namespace
{

struct Candidate
{
    int index = -1;
    bool overlaps = false;
    int gap = 0;
    juce::int64 centreDistance = 0;

    bool isBetterThan (const Candidate& other) const
    {
        if (other.index < 0)          return true;
        if (overlaps != other.overlaps) return overlaps;
        if (gap != other.gap)         return gap < other.gap;
        if (centreDistance != other.centreDistance)
            return centreDistance < other.centreDistance;
        return index < other.index;
    }
};

bool liesInDirection (const Rect& origin, const Rect& r, Direction dir, int& gap)
{
    switch (dir)
    {
        case Direction::Right: gap = r.x - origin.right();   return r.x >= origin.right();
        case Direction::Left:  gap = origin.x - r.right();   return r.right() <= origin.x;
        case Direction::Down:  gap = r.y - origin.bottom();  return r.y >= origin.bottom();
        case Direction::Up:    gap = origin.y - r.bottom();  return r.bottom() <= origin.y;
    }

    return false;
}

// Index of the best rect in the given direction, or -1.
int findNearest (const Rect& origin, const std::vector<Rect>& rects,
                 const std::vector<bool>& eligible, Direction dir)
{
    Candidate best;

    for (size_t i = 0; i < rects.size(); ++i)
    {
        if (! eligible[i])
            continue;

        auto& r = rects[i];
        Candidate c;
        c.index = static_cast<int> (i);

        if (! liesInDirection (origin, r, dir, c.gap))
            continue;

        c.overlaps = (dir == Direction::Left || dir == Direction::Right)
                         ? origin.overlapsVertically (r)
                         : origin.overlapsHorizontally (r);

        juce::int64 dx = r.centreX2() - origin.centreX2();
        juce::int64 dy = r.centreY2() - origin.centreY2();
        c.centreDistance = dx * dx + dy * dy;

        if (c.isBetterThan (best))
            best = c;
    }

    return best.index;
}

} // namespace

NavigationManager::NavigationManager (BoxManager& bm, std::vector<std::unique_ptr<Pane>> p)
    : boxManager (bm), panes (std::move (p))
{
    boxManager.onCommand = [this] (const juce::String& command) { return runCommand (command); };
}

// ─── Dispatch ───────────────────────────────────────────────────────────────

Effect NavigationManager::dispatch (const KeyResolution& r)
{
    using A = NavigationAction;

    const auto paneKind = getFocusedPane().getKind();

    if (r.kind != KeyResolution::Action)
        return Effect::make (Effect::None, paneKind);

    const auto action = r.action;

    // A modal captures everything except confirm, cancel and quit
    if (hasModal() && action != A::Confirm && action != A::Cancel && action != A::Quit)
        return Effect::make (Effect::None, paneKind);

    if (isPaneFocus (action))
        return focusEffect (focusPane (getFocusedPaneKind (action)));

    if (isBoxFocus (action))
        return focusEffect (focusBox (getFocusedBoxKind (action)));

    if (isDirectionalMove (action))
        return focusEffect (moveFocus (getDirection (action)));

    switch (action)
    {
        case A::NextPane:     return focusEffect (cyclePane (1));
        case A::PreviousPane: return focusEffect (cyclePane (-1));
        case A::NextBox:      return focusEffect (cycleBox (1));
        case A::PreviousBox:  return focusEffect (cycleBox (-1));

        case A::Confirm: return confirm();
        case A::Cancel:  return cancel();

        case A::Quit:    return Effect::make (Effect::RequestQuit, paneKind);
        case A::Search:  return Effect::make (Effect::RequestSearch, paneKind);

        case A::FirstPage:
        case A::LastPage:
        case A::NextPage:
        case A::PreviousPage:
        {
            auto e = Effect::make (Effect::RequestPageChange, paneKind);
            e.page = action == A::FirstPage ? Effect::FirstPage
                   : action == A::LastPage  ? Effect::LastPage
                   : action == A::NextPage  ? Effect::NextPage
                                            : Effect::PreviousPage;
            return e;
        }

        case A::SortByColumn:
        {
            auto* box = getFocusedBox();

            if (box == nullptr || box->getKind() != BoxKind::DataTable || box->getNumColumns() == 0)
                break;

            auto e = Effect::make (Effect::RequestSort, paneKind);
            e.column = box->getColumn();
            e.columnName = box->getColumnName (e.column);
            return e;
        }

        case A::FollowForeignKey:
        {
            auto* box = getFocusedBox();

            if (box == nullptr || box->getKind() != BoxKind::DataTable || box->getNumRows() == 0)
                break;

            auto e = Effect::make (Effect::RequestForeignKeyFollow, paneKind);
            e.cell.table = box->getTableName();
            e.cell.row = box->getRow();
            e.cell.column = box->getColumn();
            e.cell.columnName = box->getColumnName (box->getColumn());
            e.cell.value = box->getCurrentCell();
            return e;
        }

        case A::InsertChar:
            if (paneKind == PaneKind::CommandLine && r.character != 0)
            {
                commandLine += r.character;
                return Effect::make (Effect::BufferChanged, paneKind);
            }
            break;

        case A::DeleteCharBefore:
            if (paneKind == PaneKind::CommandLine)
            {
                if (commandLine.isEmpty())
                    return cancel();

                commandLine = commandLine.dropLastCharacters (1);
                return Effect::make (Effect::BufferChanged, paneKind);
            }
            break;

        default:
            break;
    }

    return Effect::make (Effect::None, paneKind);
}

Effect NavigationManager::focusEffect (bool changed) const
{
    return Effect::make (changed ? Effect::FocusChanged : Effect::None, getFocusedPane().getKind());
}

Effect NavigationManager::confirm()
{
    const auto paneKind = getFocusedPane().getKind();

    if (hasModal())
    {
        auto e = Effect::make (Effect::RequestConfirm, paneKind);
        e.text = modals.back()->getCurrentItemText();
        e.fromModal = true;
        popModal();
        return e;
    }

    if (paneKind == PaneKind::CommandLine)
    {
        auto command = commandLine;
        setFocusedPane (paneBeforeCommandLine);

        auto e = runCommand (command);

        if (e.isNone())
            e = Effect::make (Effect::FocusChanged, getFocusedPane().getKind());

        return e;
    }

    auto* box = getFocusedBox();

    if (box == nullptr)
        return Effect::make (Effect::None, paneKind);

    if (paneKind == PaneKind::QueryInput)
    {
        auto text = box->getCurrentItemText();

        if (text.trim().isEmpty())
            return Effect::make (Effect::None, paneKind);

        auto e = Effect::make (Effect::RequestQuery, paneKind);
        e.query.text = text;
        return e;
    }

    if (box->isRowBased() && box->getNumRows() == 0)
        return Effect::make (Effect::None, paneKind);

    if (paneKind == PaneKind::SchemaExplorer && box->getKind() == BoxKind::TreeView)
    {
        auto e = Effect::make (Effect::RequestQuery, paneKind);
        e.query.table = box->getCurrentItemText();
        return e;
    }

    auto e = Effect::make (Effect::RequestConfirm, paneKind);
    e.text = box->getCurrentItemText();
    return e;
}

Effect NavigationManager::cancel()
{
    if (popModal())
        return Effect::make (Effect::FocusChanged, getFocusedPane().getKind());

    if (getFocusedPane().getKind() == PaneKind::CommandLine)
    {
        setFocusedPane (paneBeforeCommandLine);
        return Effect::make (Effect::FocusChanged, getFocusedPane().getKind());
    }

    return Effect::make (Effect::None, getFocusedPane().getKind());
}

Effect NavigationManager::runCommand (const juce::String& command)
{
    const auto paneKind = getFocusedPane().getKind();
    auto c = command.trim();

    if (c.isEmpty())
        return Effect::make (Effect::None, paneKind);

    if (c == "q" || c == "q!" || c == "quit" || c == "qa")
        return Effect::make (Effect::RequestQuit, paneKind);

    if (c == "run")
    {
        auto* queryPane = getPane (PaneKind::QueryInput);
        auto* box = queryPane != nullptr ? queryPane->getActiveBox() : nullptr;

        if (box != nullptr && box->getCurrentItemText().trim().isNotEmpty())
        {
            auto e = Effect::make (Effect::RequestQuery, PaneKind::QueryInput);
            e.query.text = box->getCurrentItemText();
            return e;
        }

        auto e = Effect::make (Effect::DisplayError, paneKind);
        e.text = "No query to run";
        return e;
    }

    auto e = Effect::make (Effect::DisplayError, paneKind);
    e.text = "Not an editor command: " + c;
    return e;
}

// ─── Focus ──────────────────────────────────────────────────────────────────

int NavigationManager::indexOfPane (PaneKind kind) const
{
    for (size_t i = 0; i < panes.size(); ++i)
        if (panes[i]->getKind() == kind)
            return static_cast<int> (i);

    return -1;
}

Pane* NavigationManager::getPane (PaneKind kind) const
{
    int index = indexOfPane (kind);
    return index >= 0 ? panes[static_cast<size_t> (index)].get() : nullptr;
}

Pane& NavigationManager::getFocusedPane() const
{
    return *panes[static_cast<size_t> (focusedPane)];
}

Box* NavigationManager::getFocusedBox() const
{
    if (! modals.empty())
        return modals.back().get();

    return getFocusedPane().getActiveBox();
}

bool NavigationManager::setFocusedPane (int index)
{
    if (index == focusedPane || ! juce::isPositiveAndBelow (index, getNumPanes()))
        return false;

    if (getFocusedPane().getKind() == PaneKind::CommandLine)
        commandLine.clear();

    focusedPane = index;
    notifyFocusChanged();
    return true;
}

void NavigationManager::notifyFocusChanged()
{
    listeners.call (&Listener::focusChanged, getFocusedPane().getKind());
}

bool NavigationManager::focusPane (PaneKind kind)
{
    int index = indexOfPane (kind);

    if (index < 0 || index == focusedPane || ! panes[static_cast<size_t> (index)]->isVisible())
        return false;

    if (kind == PaneKind::CommandLine)
    {
        paneBeforeCommandLine = focusedPane;
        commandLine.clear();
    }

    return setFocusedPane (index);
}

bool NavigationManager::focusBox (BoxKind kind)
{
    if (! boxManager.focusBox (getFocusedPane(), kind))
        return false;

    notifyFocusChanged();
    return true;
}

bool NavigationManager::cycleBox (int delta)
{
    if (! boxManager.cycleBox (getFocusedPane(), delta))
        return false;

    notifyFocusChanged();
    return true;
}

bool NavigationManager::cyclePane (int delta)
{
    // The command line is only entered explicitly, never by cycling
    std::vector<int> order;

    for (size_t i = 0; i < panes.size(); ++i)
        if (panes[i]->isVisible() && panes[i]->getKind() != PaneKind::CommandLine)
            order.push_back (static_cast<int> (i));

    if (order.empty())
        return false;

    int current = getFocusedPane().getKind() == PaneKind::CommandLine ? paneBeforeCommandLine
                                                                       : focusedPane;
    int position = 0;

    for (size_t i = 0; i < order.size(); ++i)
        if (order[i] == current)
            position = static_cast<int> (i);

    const int n = static_cast<int> (order.size());
    int next = ((position + delta) % n + n) % n;

    return setFocusedPane (order[static_cast<size_t> (next)]);
}

bool NavigationManager::moveFocus (Direction direction)
{
    auto& pane = getFocusedPane();
    auto* activeBox = pane.getActiveBox();
    const Rect origin = activeBox != nullptr ? activeBox->getBounds() : pane.getBounds();

    if (pane.getNumBoxes() > 1)
    {
        std::vector<Rect> rects;
        std::vector<bool> eligible;

        for (int i = 0; i < pane.getNumBoxes(); ++i)
        {
            rects.push_back (pane.getBox (i)->getBounds());
            eligible.push_back (i != pane.getActiveBoxIndex());
        }

        int best = findNearest (origin, rects, eligible, direction);

        if (best >= 0 && pane.setActiveBoxIndex (best))
        {
            notifyFocusChanged();
            return true;
        }
    }

    std::vector<Rect> rects;
    std::vector<bool> eligible;

    for (size_t i = 0; i < panes.size(); ++i)
    {
        auto& p = *panes[i];
        rects.push_back (p.getBounds());
        eligible.push_back (static_cast<int> (i) != focusedPane && p.isVisible()
                            && p.getKind() != PaneKind::CommandLine);
    }

    int best = findNearest (origin, rects, eligible, direction);

    if (best < 0)
        return false;

    return setFocusedPane (best);
}

bool NavigationManager::focusLocation (const TargetLocation& target)
{
    auto* pane = getPane (target.pane);

    if (pane == nullptr)
        return false;

    bool changed = focusPane (target.pane);
    changed = boxManager.focusBox (*pane, target.box) || changed;

    if (auto* box = pane->getActiveBox())
    {
        if (box->getRow() != target.row)
        {
            box->setCursorCell (target.row, box->getColumn());
            changed = true;
        }
    }

    if (changed)
        notifyFocusChanged();

    return changed;
}

// ─── Modals ─────────────────────────────────────────────────────────────────

void NavigationManager::pushModal (std::unique_ptr<Box> modal)
{
    if (modal == nullptr)
        return;

    modals.push_back (std::move (modal));
    notifyFocusChanged();
}

bool NavigationManager::popModal()
{
    if (modals.empty())
        return false;

    modals.pop_back();
    notifyFocusChanged();
    return true;
}

// ─── Snapshot ───────────────────────────────────────────────────────────────

FocusSnapshot NavigationManager::getSnapshot() const
{
    FocusSnapshot s;
    s.pane = getFocusedPane().getKind();
    s.modalOpen = hasModal();

    if (auto* box = getFocusedBox())
    {
        s.hasBox = true;
        s.box = box->getKind();
        s.editingMode = box->getEditingMode();

        if (auto* editor = box->getEditor())
        {
            if (s.editingMode == EditingMode::Vim)
            {
                s.hasVimMode = true;
                s.vimMode = editor->getMode();
                s.pendingCount = editor->getPendingCount();

                if (s.vimMode == VimMode::Command)
                {
                    s.commandActive = true;
                    s.commandLine = editor->getCommandLine();
                }
            }
            else
            {
                s.cursorEditing = box->isEditing();
            }
        }
    }

    if (s.pane == PaneKind::CommandLine)
    {
        s.commandActive = true;
        s.commandLine = commandLine;
    }

    return s;
}

juce::String NavigationManager::getNavigationInfo() const
{
    auto info = getFocusedPane().getName();

    if (auto* box = getFocusedBox())
        info << " (" << getBoxName (box->getKind()) << ")";

    return info;
}

} // namespace ll
