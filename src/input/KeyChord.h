#pragma once

#include "input/KeyEvent.h"
#include "model/FocusTypes.h"

namespace ll
{

/** Canonical chord strings.

    A chord is written as modifiers in the fixed order Ctrl, Alt, Shift,
    followed by the key name, joined with '+': "Ctrl+Alt+Shift+x", "Shift+Tab"
    never appears (it is "BackTab"), an upper-case letter is "Shift+<lower>",
    and shift is dropped from other printable symbols ("$" rather than
    "Shift+4" or "Shift+$").
*/
namespace KeyChord
{
    juce::String fromEvent (const KeyEvent& event);

    /** Parses a user-written chord such as "ctrl+R", "G", "Ctrl++" or "PageDown".
        Returns false and fills error when the text isn't a single valid chord.
    */
    bool parse (const juce::String& text, KeyEvent& result, juce::String& error);

    /** Returns the canonical form of a user-written chord, or an empty string
        (with error filled in) if it doesn't parse.
    */
    juce::String canonicalise (const juce::String& text, juce::String& error);

    juce::String withModifier (const juce::String& canonicalChord, PaneModifier modifier);
    bool hasModifier (const juce::String& canonicalChord, PaneModifier modifier);
    bool hasAnyModifier (const juce::String& canonicalChord);
}

} // namespace ll
