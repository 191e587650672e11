#include "AppController.h"
#include "model/Layout.h"

namespace ll
{
namespace ui
{

namespace
{

template <typename Fn>
void forEachEditor (NavigationManager& nav, Fn&& fn)
{
    for (int p = 0; p < nav.getNumPanes(); ++p)
    {
        auto* pane = nav.getPane (static_cast<PaneKind> (p));

        if (pane == nullptr)
            continue;

        for (int b = 0; b < pane->getNumBoxes(); ++b)
            if (auto* editor = pane->getBox (b)->getEditor())
                fn (*editor);
    }
}

} // namespace

AppController::AppController (const KeyMapping& mapping, EditingMode defaultMode)
    : resolver (mapping),
      navigation (boxManager, Layout::createDefaultPanes (registers, defaultMode))
{
    navigation.addListener (this);
    forEachEditor (navigation, [this] (VimEditor& e) { e.addListener (this); });
}

AppController::~AppController()
{
    forEachEditor (navigation, [this] (VimEditor& e) { e.removeListener (this); });
    navigation.removeListener (this);
}

void AppController::setConnections (const juce::StringArray& names)
{
    if (auto* pane = navigation.getPane (PaneKind::Connections))
        if (auto* box = pane->getActiveBox())
            box->setItems (names);
}

// ─── Key dispatch ───────────────────────────────────────────────────────────

ResolverContext AppController::makeContext() const
{
    auto snapshot = navigation.getSnapshot();

    ResolverContext c;
    c.pane = snapshot.pane;
    c.hasBox = snapshot.hasBox;
    c.box = snapshot.box;
    c.editingMode = snapshot.editingMode;
    c.hasVimMode = snapshot.hasVimMode;
    c.vimMode = snapshot.vimMode;
    c.cursorEditing = snapshot.cursorEditing;

    if (auto* box = navigation.getFocusedBox())
    {
        if (auto* editor = box->getEditor())
        {
            c.countPending = editor->hasPendingCount();
            c.awaitingLiteral = snapshot.hasVimMode && editor->isAwaitingReplacement();
        }
    }

    return c;
}

Effect AppController::handleKey (const KeyEvent& event)
{
    const auto resolution = resolver.resolve (event, makeContext());
    const auto pane = navigation.getFocusedPane().getKind();

    switch (resolution.kind)
    {
        case KeyResolution::Unmapped:
            return Effect::make (Effect::None, pane);

        case KeyResolution::CountDigit:
            if (auto* box = navigation.getFocusedBox())
                boxManager.accumulateCount (*box, resolution.digit);
            return Effect::make (Effect::None, pane);

        case KeyResolution::Action:
            break;
    }

    DBG ("key " << resolution.chord << " -> " << getActionName (resolution.action)
         << (resolution.paneDirectional ? " (pane)" : ""));

    Effect effect;
    auto* box = navigation.getFocusedBox();

    if (box == nullptr || ! boxManager.dispatch (resolution, *box, pane, effect))
        effect = navigation.dispatch (resolution);

    return routeRequest (effect);
}

// ─── Requests ───────────────────────────────────────────────────────────────

bool AppController::canReachDatabase (const Effect& effect)
{
    if (database == nullptr)
    {
        juce::Logger::writeToLog ("No database client, request not sent: " + effect.describe());
        return false;
    }

    return true;
}

Effect AppController::routeRequest (Effect effect)
{
    switch (effect.type)
    {
        case Effect::RequestQuery:
        {
            if (! canReachDatabase (effect))
                break;

            if (activeConnection.isEmpty())
                return showError ("No connection selected", effect.origin);

            currentQuery = effect.query;
            currentQuery.page = 0;
            totalRows = 0;
            runCurrentQuery();
            break;
        }

        case Effect::RequestPageChange:
        {
            if (currentQuery.isEmpty() || ! canReachDatabase (effect))
                break;

            const int lastPage = std::max (0, (totalRows - 1) / std::max (1, currentQuery.pageSize));
            int page = currentQuery.page;

            switch (effect.page)
            {
                case Effect::FirstPage:    page = 0; break;
                case Effect::PreviousPage: page = std::max (0, page - 1); break;
                case Effect::NextPage:     page = std::min (lastPage, page + 1); break;
                case Effect::LastPage:     page = lastPage; break;
            }

            if (page != currentQuery.page)
            {
                currentQuery.page = page;
                runCurrentQuery();
            }
            break;
        }

        case Effect::RequestSort:
        {
            if (currentQuery.isEmpty() || ! canReachDatabase (effect))
                break;

            if (currentQuery.sortColumn == effect.columnName)
            {
                currentQuery.sortDescending = ! currentQuery.sortDescending;
            }
            else
            {
                currentQuery.sortColumn = effect.columnName;
                currentQuery.sortDescending = false;
            }

            currentQuery.page = 0;
            runCurrentQuery();
            break;
        }

        case Effect::RequestForeignKeyFollow:
        {
            if (! canReachDatabase (effect))
                break;

            if (activeConnection.isEmpty())
                return showError ("No connection selected", effect.origin);

            latestLookup = database->followForeignKey (activeConnection, effect.cell);
            break;
        }

        case Effect::RequestConfirm:
        {
            if (effect.fromModal || effect.origin != PaneKind::Connections)
                break;

            activeConnection = effect.text;
            juce::Logger::writeToLog ("Active connection: " + activeConnection);

            if (database != nullptr)
                latestSchema = database->fetchSchema (activeConnection);
            break;
        }

        default:
            break;
    }

    return effect;
}

void AppController::runCurrentQuery()
{
    latestQuery = database->executeQuery (activeConnection, currentQuery);
    DBG ("query " << latestQuery << " page " << currentQuery.page);
}

Effect AppController::showError (const juce::String& message, PaneKind origin)
{
    juce::Logger::writeToLog ("Error: " + message);

    auto modal = std::make_unique<Box> (BoxKind::Modal, "error", Rect (30, 16, 40, 6));
    modal->setItems (juce::StringArray::fromLines (message));
    navigation.pushModal (std::move (modal));

    auto e = Effect::make (Effect::DisplayError, origin);
    e.text = message;
    return e;
}

// ─── Completions ────────────────────────────────────────────────────────────

void AppController::onQueryComplete (RequestId id, const QueryResult& result, const juce::String& error)
{
    Completion c;
    c.kind = Completion::Query;
    c.id = id;
    c.result = result;
    c.error = error;
    completions.post (std::move (c));
}

void AppController::onLookupComplete (RequestId id, const TargetLocation& target, const juce::String& error)
{
    Completion c;
    c.kind = Completion::Lookup;
    c.id = id;
    c.target = target;
    c.error = error;
    completions.post (std::move (c));
}

void AppController::onSchemaComplete (RequestId id, const juce::StringArray& tables, const juce::String& error)
{
    Completion c;
    c.kind = Completion::Schema;
    c.id = id;
    c.tables = tables;
    c.error = error;
    completions.post (std::move (c));
}

juce::Array<Effect> AppController::processCompletions()
{
    juce::Array<Effect> effects;

    for (auto& c : completions.drain())
    {
        auto e = applyCompletion (c);

        if (! e.isNone())
            effects.add (e);
    }

    return effects;
}

Effect AppController::applyCompletion (const Completion& c)
{
    RequestId& latest = c.kind == Completion::Query  ? latestQuery
                      : c.kind == Completion::Lookup ? latestLookup
                                                     : latestSchema;

    // Only the request in flight is honoured, and only once
    if (latest == 0 || c.id != latest)
    {
        DBG ("dropping stale completion " << c.id << " (latest " << latest << ")");
        return {};
    }

    latest = 0;

    switch (c.kind)
    {
        case Completion::Query:
            if (c.failed())
                return showError (c.error, PaneKind::Results);

            fillResults (c.result);
            return Effect::make (Effect::BufferChanged, PaneKind::Results);

        case Completion::Lookup:
        {
            if (c.failed())
                return showError (c.error, PaneKind::Results);

            if (c.target.hasRows)
                fillResults (c.target.rows);

            bool moved = navigation.focusLocation (c.target);
            return Effect::make (moved ? Effect::FocusChanged : Effect::BufferChanged,
                                 navigation.getFocusedPane().getKind());
        }

        case Completion::Schema:
        {
            if (c.failed())
                return showError (c.error, PaneKind::SchemaExplorer);

            auto* pane = navigation.getPane (PaneKind::SchemaExplorer);
            auto* tree = pane != nullptr ? pane->findBox (BoxKind::TreeView) : nullptr;

            if (tree == nullptr)
                return {};

            tree->setItems (c.tables);
            return Effect::make (Effect::BufferChanged, PaneKind::SchemaExplorer);
        }
    }

    return {};
}

void AppController::fillResults (const QueryResult& result)
{
    auto* pane = navigation.getPane (PaneKind::Results);
    auto* table = pane != nullptr ? pane->findBox (BoxKind::DataTable) : nullptr;

    if (table == nullptr)
        return;

    // An unfinished cell edit belongs to the old rows; drop it
    if (auto* editor = table->getEditor())
    {
        if (BoxManager::isEditingText (*table))
            DBG ("discarding cell edit, results replaced");

        table->setEditing (false);
        editor->enterNormalMode();
    }

    table->setTableName (result.table);
    table->setColumns (result.columns);
    table->setRows (result.rows);
    totalRows = result.totalRows;
}

// ─── Listeners ──────────────────────────────────────────────────────────────

void AppController::focusChanged (PaneKind)
{
    DBG ("focus " << navigation.getNavigationInfo());
}

void AppController::vimModeChanged (VimMode newMode)
{
    DBG ("mode " << getVimModeName (newMode));
    juce::ignoreUnused (newMode);
}

} // namespace ui
} // namespace ll
