#pragma once

#include <juce_core/juce_core.h>

namespace ll
{

struct KeyEvent
{
    enum Key
    {
        Character,
        Escape, Return, Tab, BackTab, Backspace, Delete, Insert,
        Left, Right, Up, Down, Home, End, PageUp, PageDown,
        Function
    };

    Key key = Character;
    juce::juce_wchar character = 0;   // only meaningful for Character keys
    int functionNumber = 0;           // F1..F12 for Function keys
    bool shift = false;
    bool control = false;
    bool alt = false;

    static KeyEvent fromCharacter (juce::juce_wchar c, bool ctrl = false, bool altDown = false)
    {
        KeyEvent e;
        e.key = Character;
        e.character = c;
        e.control = ctrl;
        e.alt = altDown;
        e.shift = juce::CharacterFunctions::isUpperCase (c) && juce::CharacterFunctions::isLetter (c);
        return e;
    }

    static KeyEvent special (Key k, bool shiftDown = false, bool ctrl = false, bool altDown = false)
    {
        KeyEvent e;
        e.key = k;
        e.shift = shiftDown;
        e.control = ctrl;
        e.alt = altDown;
        return e;
    }

    bool isPrintable() const
    {
        return key == Character && character >= 0x20 && character != 0x7f
               && ! control && ! alt;
    }

    // The character a text box should receive, with shift applied to letters.
    juce::juce_wchar getTextCharacter() const
    {
        if (key != Character)
            return 0;

        if (shift && juce::CharacterFunctions::isLetter (character))
            return juce::CharacterFunctions::toUpperCase (character);

        return character;
    }
};

} // namespace ll
