#pragma once

#include "db/CompletionQueue.h"
#include "input/KeyResolver.h"
#include "navigation/NavigationManager.h"

namespace ll
{
namespace ui
{

/** The input dispatch loop.

    Every key is resolved against the current focus, offered to the focused
    box, and handed to the NavigationManager if the box doesn't claim it.
    Requests that cross into the database are started here; their results
    come back through the completion callbacks and are applied by
    processCompletions() on the input thread. Only the newest request of each
    kind is honoured; older completions are dropped.
*/
class AppController : private NavigationManager::Listener,
                      private VimEditor::Listener
{
public:
    explicit AppController (const KeyMapping& mapping,
                            EditingMode defaultMode = EditingMode::Vim);
    ~AppController() override;

    void setDatabaseClient (DatabaseClient* client) { database = client; }
    void setConnections (const juce::StringArray& names);

    Effect handleKey (const KeyEvent& event);
    FocusSnapshot currentFocus() const { return navigation.getSnapshot(); }

    juce::Array<Effect> processCompletions();

    // Completion callbacks, safe to call from any thread.
    // A non-empty error marks the request as failed.
    void onQueryComplete (RequestId id, const QueryResult& result, const juce::String& error = {});
    void onLookupComplete (RequestId id, const TargetLocation& target, const juce::String& error = {});
    void onSchemaComplete (RequestId id, const juce::StringArray& tables, const juce::String& error = {});

    NavigationManager& getNavigation()          { return navigation; }
    const NavigationManager& getNavigation() const { return navigation; }
    Registers& getRegisters()                   { return registers; }
    const KeyResolver& getResolver() const      { return resolver; }

    const juce::String& getActiveConnection() const { return activeConnection; }
    const QuerySpec& getCurrentQuery() const        { return currentQuery; }
    int getTotalRows() const                        { return totalRows; }

    // Id of the request of each kind still in flight, 0 when there is none
    RequestId getLatestQueryId() const  { return latestQuery; }
    RequestId getLatestLookupId() const { return latestLookup; }
    RequestId getLatestSchemaId() const { return latestSchema; }

private:
    // ─── Editing state ───────────────────────────────────
    Registers registers;
    KeyResolver resolver;
    BoxManager boxManager { registers };
    NavigationManager navigation;

    // ─── Database ────────────────────────────────────────
    DatabaseClient* database = nullptr;
    CompletionQueue completions;
    juce::String activeConnection;
    QuerySpec currentQuery;
    int totalRows = 0;
    RequestId latestQuery = 0;
    RequestId latestLookup = 0;
    RequestId latestSchema = 0;

    ResolverContext makeContext() const;

    Effect routeRequest (Effect effect);
    bool canReachDatabase (const Effect& effect);
    void runCurrentQuery();
    Effect showError (const juce::String& message, PaneKind origin);
    Effect applyCompletion (const Completion& completion);
    void fillResults (const QueryResult& result);

    // NavigationManager::Listener
    void focusChanged (PaneKind pane) override;

    // VimEditor::Listener
    void vimModeChanged (VimMode newMode) override;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (AppController)
};

} // namespace ui
} // namespace ll
