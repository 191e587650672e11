#include "KeyResolver.h"
#include "input/KeyChord.h"
#include "vim/VimEditor.h"

namespace ll
{

KeyResolver::KeyResolver (const KeyMapping& m)
    : mapping (m)
{
}

bool KeyResolver::isTextEntry (const ResolverContext& context)
{
    if (context.hasVimMode)
        return context.vimMode == VimMode::Insert || context.vimMode == VimMode::Command;

    if (context.cursorEditing)
        return true;

    return context.pane == PaneKind::CommandLine && ! context.hasBox;
}

KeyResolution KeyResolver::makeAction (NavigationAction action, const juce::String& chord) const
{
    KeyResolution r;
    r.kind = KeyResolution::Action;
    r.action = action;
    r.chord = chord;
    r.paneDirectional = isDirectionalMove (action)
                        && KeyChord::hasModifier (chord, mapping.getPaneModifier());
    return r;
}

KeyResolution KeyResolver::resolve (const KeyEvent& event, const ResolverContext& context) const
{
    const auto chord = KeyChord::fromEvent (event);
    const bool printable = event.isPrintable();
    const auto ch = event.getTextCharacter();

    KeyResolution literal;
    literal.kind = KeyResolution::Action;
    literal.action = NavigationAction::InsertChar;
    literal.character = ch;
    literal.chord = chord;

    // ── Pending replace takes the next printable key verbatim
    if (context.awaitingLiteral && printable)
        return literal;

    bool haveModeScope = false;
    auto modeScope = KeyMapping::Global;

    if (context.hasVimMode)
    {
        haveModeScope = true;
        modeScope = KeyMapping::getScopeForVimMode (context.vimMode);
    }
    else if (context.cursorEditing)
    {
        haveModeScope = true;
        modeScope = KeyMapping::CursorEdit;
    }

    // ── Counts only exist in Normal mode
    if (haveModeScope && modeScope == KeyMapping::VimNormal && printable
        && VimEditor::isDigitForCount (ch, context.countPending))
    {
        KeyResolution r;
        r.kind = KeyResolution::CountDigit;
        r.digit = static_cast<int> (ch - '0');
        r.chord = chord;
        return r;
    }

    if (haveModeScope)
    {
        auto action = mapping.lookup (modeScope, chord);

        if (action != NavigationAction::None)
            return makeAction (action, chord);
    }

    if (printable && isTextEntry (context))
        return literal;

    // Digits inside an editing mode are never prefixes
    if (printable && haveModeScope && modeScope != KeyMapping::VimNormal
        && juce::CharacterFunctions::isDigit (ch))
        return literal;

    auto action = mapping.lookup (KeyMapping::getScopeForPane (context.pane), chord);

    if (action == NavigationAction::None)
        action = mapping.lookup (KeyMapping::Global, chord);

    if (action == NavigationAction::None)
    {
        KeyResolution r;
        r.chord = chord;
        return r;
    }

    return makeAction (action, chord);
}

} // namespace ll
