#include "KeyChord.h"

namespace ll
{
namespace KeyChord
{

namespace
{

struct NamedKey
{
    KeyEvent::Key key;
    const char* name;
};

// First entry for each key is the canonical spelling.
const NamedKey namedKeys[] =
{
    { KeyEvent::Escape,    "Esc" },
    { KeyEvent::Escape,    "Escape" },
    { KeyEvent::Return,    "Enter" },
    { KeyEvent::Return,    "Return" },
    { KeyEvent::Tab,       "Tab" },
    { KeyEvent::BackTab,   "BackTab" },
    { KeyEvent::Backspace, "Backspace" },
    { KeyEvent::Delete,    "Delete" },
    { KeyEvent::Delete,    "Del" },
    { KeyEvent::Insert,    "Insert" },
    { KeyEvent::Insert,    "Ins" },
    { KeyEvent::Left,      "Left" },
    { KeyEvent::Right,     "Right" },
    { KeyEvent::Up,        "Up" },
    { KeyEvent::Down,      "Down" },
    { KeyEvent::Home,      "Home" },
    { KeyEvent::End,       "End" },
    { KeyEvent::PageUp,    "PageUp" },
    { KeyEvent::PageUp,    "PgUp" },
    { KeyEvent::PageDown,  "PageDown" },
    { KeyEvent::PageDown,  "PgDn" },
};

juce::String getKeyName (const KeyEvent& e)
{
    if (e.key == KeyEvent::Function)
        return "F" + juce::String (e.functionNumber);

    if (e.key == KeyEvent::Character)
    {
        if (e.character == ' ')
            return "Space";

        return juce::String::charToString (juce::CharacterFunctions::toLowerCase (e.character));
    }

    for (auto& nk : namedKeys)
        if (nk.key == e.key)
            return nk.name;

    return {};
}

bool parseKeyToken (const juce::String& token, KeyEvent& result)
{
    for (auto& nk : namedKeys)
    {
        if (token.equalsIgnoreCase (nk.name))
        {
            result.key = nk.key;
            return true;
        }
    }

    if (token.equalsIgnoreCase ("Space"))
    {
        result.key = KeyEvent::Character;
        result.character = ' ';
        return true;
    }

    if (token.length() >= 2 && (token[0] == 'F' || token[0] == 'f')
        && token.substring (1).containsOnly ("0123456789"))
    {
        auto n = token.substring (1).getIntValue();

        if (n < 1 || n > 24)
            return false;

        result.key = KeyEvent::Function;
        result.functionNumber = n;
        return true;
    }

    if (token.length() == 1 && token[0] > 0x20 && token[0] != 0x7f)
    {
        result.key = KeyEvent::Character;
        result.character = token[0];

        if (juce::CharacterFunctions::isLetter (token[0])
            && juce::CharacterFunctions::isUpperCase (token[0]))
            result.shift = true;

        return true;
    }

    return false;
}

} // namespace

juce::String fromEvent (const KeyEvent& event)
{
    auto e = event;

    if (e.key == KeyEvent::Character)
    {
        bool isLetter = juce::CharacterFunctions::isLetter (e.character);

        if (isLetter && juce::CharacterFunctions::isUpperCase (e.character))
            e.shift = true;
        else if (! isLetter && e.character != ' ')
            e.shift = false;
    }
    else if (e.key == KeyEvent::Tab && e.shift)
    {
        e.key = KeyEvent::BackTab;
        e.shift = false;
    }
    else if (e.key == KeyEvent::BackTab)
    {
        e.shift = false;
    }

    juce::String chord;

    if (e.control) chord << "Ctrl+";
    if (e.alt)     chord << "Alt+";
    if (e.shift)   chord << "Shift+";

    return chord + getKeyName (e);
}

bool parse (const juce::String& text, KeyEvent& result, juce::String& error)
{
    error.clear();
    result = {};

    auto s = text.trim();

    if (s.isEmpty())
    {
        error = "empty chord";
        return false;
    }

    // Split on '+' keeping empty tokens, so "Ctrl++" yields a '+' key token.
    juce::StringArray parts;
    {
        juce::String current;

        for (auto p = s.getCharPointer(); ! p.isEmpty(); ++p)
        {
            if (*p == '+')
            {
                parts.add (current);
                current.clear();
                continue;
            }

            current += *p;
        }

        parts.add (current);
    }

    // "Ctrl++" splits to ["Ctrl", "", ""]; collapse to ["Ctrl", ""].
    for (int i = parts.size() - 1; i > 0; --i)
        if (parts[i].isEmpty() && parts[i - 1].isEmpty())
            parts.remove (i);

    bool haveKey = false;

    for (int i = 0; i < parts.size(); ++i)
    {
        auto token = parts[i].trim();

        if (token.isEmpty())
            token = "+";

        auto lower = token.toLowerCase();

        if (lower == "ctrl" || lower == "control")  { result.control = true; continue; }
        if (lower == "alt" || lower == "meta")      { result.alt = true;     continue; }
        if (lower == "shift")                       { result.shift = true;   continue; }

        if (haveKey)
        {
            error = "multiple keys in chord '" + text + "'";
            return false;
        }

        bool shiftWasSet = result.shift;

        if (! parseKeyToken (token, result))
        {
            error = "unknown key token '" + token + "'";
            return false;
        }

        result.shift = result.shift || shiftWasSet;
        haveKey = true;
    }

    if (! haveKey)
    {
        error = "chord '" + text + "' has no key";
        return false;
    }

    return true;
}

juce::String canonicalise (const juce::String& text, juce::String& error)
{
    KeyEvent e;

    if (! parse (text, e, error))
        return {};

    return fromEvent (e);
}

juce::String withModifier (const juce::String& canonicalChord, PaneModifier modifier)
{
    KeyEvent e;
    juce::String error;

    if (! parse (canonicalChord, e, error))
        return {};

    switch (modifier)
    {
        case PaneModifier::Shift: e.shift = true;   break;
        case PaneModifier::Ctrl:  e.control = true; break;
        case PaneModifier::Alt:   e.alt = true;     break;
    }

    return fromEvent (e);
}

bool hasModifier (const juce::String& canonicalChord, PaneModifier modifier)
{
    switch (modifier)
    {
        case PaneModifier::Shift: return canonicalChord.contains ("Shift+");
        case PaneModifier::Ctrl:  return canonicalChord.startsWith ("Ctrl+");
        case PaneModifier::Alt:   return canonicalChord.startsWith ("Alt+")
                                         || canonicalChord.contains ("+Alt+");
    }

    return false;
}

bool hasAnyModifier (const juce::String& canonicalChord)
{
    return hasModifier (canonicalChord, PaneModifier::Shift)
        || hasModifier (canonicalChord, PaneModifier::Ctrl)
        || hasModifier (canonicalChord, PaneModifier::Alt);
}

} // namespace KeyChord
} // namespace ll
