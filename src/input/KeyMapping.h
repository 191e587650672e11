#pragma once

#include "input/NavigationAction.h"
#include <map>
#include <utility>
#include <vector>

namespace ll
{

/** Scoped chord -> action tables.

    Lookup for a key goes mode scope, then pane scope, then global. Chords are
    stored in canonical form (see KeyChord). A chord bound to
    NavigationAction::None in a user table removes the default binding when
    the tables are merged.
*/
class KeyMapping
{
public:
    enum Scope
    {
        Global,
        ConnectionsPane, QueryInputPane, ResultsPane, SchemaExplorerPane, CommandLinePane,
        VimNormal, VimInsert, VimVisual, VimCommand,
        CursorEdit,
        NumScopes
    };

    using Entry = std::pair<juce::String, NavigationAction>;

    KeyMapping() = default;

    static KeyMapping createDefaults();

    /** Overlays user onto defaults: user entries win, None entries unbind, and
        the pane modifier is composed onto every plain global directional chord
        where that composed chord isn't already bound. A composed chord that is
        already bound to something else is left alone and reported in
        collisions.
    */
    static KeyMapping merge (const KeyMapping& defaults, const KeyMapping& user,
                             PaneModifier paneModifier,
                             juce::StringArray* collisions = nullptr);

    void bind (Scope scope, const juce::String& canonicalChord, NavigationAction action);
    void unbind (Scope scope, const juce::String& canonicalChord);

    // Returns None if the chord isn't bound in this scope.
    NavigationAction lookup (Scope scope, const juce::String& canonicalChord) const;
    bool contains (Scope scope, const juce::String& canonicalChord) const;

    int getNumBindings (Scope scope) const;
    std::vector<Entry> getEntries (Scope scope) const;

    PaneModifier getPaneModifier() const { return paneModifier; }
    void setPaneModifier (PaneModifier m) { paneModifier = m; }

    static Scope getScopeForPane (PaneKind pane);
    static Scope getScopeForVimMode (VimMode mode);
    static juce::String getScopeName (Scope scope);
    static bool scopeFromName (const juce::String& name, Scope& result);

    bool operator== (const KeyMapping& other) const;
    bool operator!= (const KeyMapping& other) const { return ! (*this == other); }

private:
    std::map<juce::String, NavigationAction> tables[NumScopes];
    PaneModifier paneModifier = PaneModifier::Shift;
};

} // namespace ll
