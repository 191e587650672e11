#include "TerminalInput.h"
#include <unistd.h>

namespace ll
{

namespace
{

constexpr char escapeByte = '\x1b';

// xterm modifier parameter: value - 1 is a bitmask of shift (1), alt (2), ctrl (4)
void applyModifierParameter (KeyEvent& e, int value)
{
    if (value < 2)
        return;

    int bits = value - 1;
    e.shift = (bits & 1) != 0;
    e.alt = (bits & 2) != 0;
    e.control = (bits & 4) != 0;
}

bool keyForTilde (int code, KeyEvent& e)
{
    switch (code)
    {
        case 1: case 7: e.key = KeyEvent::Home;     return true;
        case 2:         e.key = KeyEvent::Insert;   return true;
        case 3:         e.key = KeyEvent::Delete;   return true;
        case 4: case 8: e.key = KeyEvent::End;      return true;
        case 5:         e.key = KeyEvent::PageUp;   return true;
        case 6:         e.key = KeyEvent::PageDown; return true;
        default: break;
    }

    // F1-F12 as 11-15, 17-21, 23-24
    static const int functionCodes[] = { 11, 12, 13, 14, 15, 17, 18, 19, 20, 21, 23, 24 };

    for (int i = 0; i < 12; ++i)
    {
        if (functionCodes[i] == code)
        {
            e.key = KeyEvent::Function;
            e.functionNumber = i + 1;
            return true;
        }
    }

    return false;
}

bool keyForLetter (char c, KeyEvent& e)
{
    switch (c)
    {
        case 'A': e.key = KeyEvent::Up;    return true;
        case 'B': e.key = KeyEvent::Down;  return true;
        case 'C': e.key = KeyEvent::Right; return true;
        case 'D': e.key = KeyEvent::Left;  return true;
        case 'H': e.key = KeyEvent::Home;  return true;
        case 'F': e.key = KeyEvent::End;   return true;
        case 'P': e.key = KeyEvent::Function; e.functionNumber = 1; return true;
        case 'Q': e.key = KeyEvent::Function; e.functionNumber = 2; return true;
        case 'R': e.key = KeyEvent::Function; e.functionNumber = 3; return true;
        case 'S': e.key = KeyEvent::Function; e.functionNumber = 4; return true;
        default:  return false;
    }
}

int utf8SequenceLength (unsigned char lead)
{
    if (lead < 0x80)           return 1;
    if ((lead & 0xe0) == 0xc0) return 2;
    if ((lead & 0xf0) == 0xe0) return 3;
    if ((lead & 0xf8) == 0xf0) return 4;
    return 0;
}

} // namespace

juce::Array<KeyEvent> TerminalInput::decode (const char* data, size_t size)
{
    pending.append (data, size);
    return decodeBuffer (false);
}

juce::Array<KeyEvent> TerminalInput::flushPending()
{
    return decodeBuffer (true);
}

juce::Array<KeyEvent> TerminalInput::decodeBuffer (bool final)
{
    juce::Array<KeyEvent> keys;
    size_t pos = 0;

    while (pos < pending.size())
    {
        size_t start = pos;
        KeyEvent e;
        auto result = decodeOne (pos, e, final);

        if (result == Incomplete)
        {
            pos = start;
            break;
        }

        if (result == Decoded)
            keys.add (e);
    }

    pending.erase (0, pos);
    return keys;
}

TerminalInput::Result TerminalInput::decodeOne (size_t& pos, KeyEvent& out, bool final) const
{
    const auto b = static_cast<unsigned char> (pending[pos]);

    if (b == escapeByte)
        return decodeEscape (pos, out, final);

    ++pos;

    switch (b)
    {
        case '\r':  out = KeyEvent::special (KeyEvent::Return);    return Decoded;
        case '\t':  out = KeyEvent::special (KeyEvent::Tab);       return Decoded;
        case 0x7f:  out = KeyEvent::special (KeyEvent::Backspace); return Decoded;
        default:    break;
    }

    if (b >= 1 && b <= 26)
    {
        out = KeyEvent::fromCharacter (static_cast<juce::juce_wchar> ('a' + b - 1), true);
        return Decoded;
    }

    if (b < 0x20)
        return Skipped;

    --pos;
    return decodeText (pos, out);
}

TerminalInput::Result TerminalInput::decodeEscape (size_t& pos, KeyEvent& out, bool final) const
{
    if (pos + 1 >= pending.size())
    {
        if (! final)
            return Incomplete;

        ++pos;
        out = KeyEvent::special (KeyEvent::Escape);
        return Decoded;
    }

    const char next = pending[pos + 1];

    if (next == '[')
    {
        size_t p = pos + 2;
        auto result = decodeCsi (p, out);

        if (result == Incomplete && final)
        {
            // ESC [ with nothing after it was Alt+[
            pos += 2;
            out = KeyEvent::fromCharacter ('[', false, true);
            return Decoded;
        }

        if (result != Incomplete)
            pos = p;

        return result;
    }

    if (next == 'O')
    {
        if (pos + 2 >= pending.size())
        {
            if (! final)
                return Incomplete;

            pos += 2;
            out = KeyEvent::fromCharacter ('O', false, true);
            return Decoded;
        }

        const char c = pending[pos + 2];
        pos += 3;

        return keyForLetter (c, out) ? Decoded : Skipped;
    }

    if (next == escapeByte)
    {
        ++pos;
        out = KeyEvent::special (KeyEvent::Escape);
        return Decoded;
    }

    // ESC followed by a key is that key with Alt held
    size_t p = pos + 1;
    auto result = decodeOne (p, out, final);

    if (result == Decoded)
    {
        out.alt = true;
        pos = p;
    }
    else if (result == Skipped)
    {
        pos = p;
    }

    return result;
}

TerminalInput::Result TerminalInput::decodeCsi (size_t& pos, KeyEvent& out) const
{
    juce::String params;

    while (pos < pending.size())
    {
        const auto c = static_cast<unsigned char> (pending[pos++]);

        if (c >= 0x40 && c <= 0x7e)
        {
            juce::StringArray fields;
            fields.addTokens (params, ";", "");

            const int first = fields.isEmpty() ? 0 : fields[0].getIntValue();
            const int modifiers = fields.size() > 1 ? fields[1].getIntValue() : 0;

            out = {};

            if (c == 'Z')
            {
                out.key = KeyEvent::BackTab;
                return Decoded;
            }

            bool known = c == '~' ? keyForTilde (first, out)
                                  : keyForLetter (static_cast<char> (c), out);

            if (! known)
                return Skipped;

            applyModifierParameter (out, modifiers);
            return Decoded;
        }

        params << juce::String::charToString (static_cast<juce::juce_wchar> (c));
    }

    return Incomplete;
}

TerminalInput::Result TerminalInput::decodeText (size_t& pos, KeyEvent& out) const
{
    const auto lead = static_cast<unsigned char> (pending[pos]);
    const int length = utf8SequenceLength (lead);

    if (length == 0)
    {
        ++pos;
        return Skipped;
    }

    if (pos + static_cast<size_t> (length) > pending.size())
        return Incomplete;

    auto text = juce::String::fromUTF8 (pending.data() + pos, length);
    pos += static_cast<size_t> (length);

    if (text.isEmpty())
        return Skipped;

    out = KeyEvent::fromCharacter (text[0]);
    return Decoded;
}

// ─── Raw mode ───────────────────────────────────────────────────────────────

RawTerminal::RawTerminal()
{
    if (! isatty (STDIN_FILENO) || tcgetattr (STDIN_FILENO, &original) == -1)
        return;

    auto raw = original;
    raw.c_iflag &= static_cast<tcflag_t> (~(BRKINT | ICRNL | INPCK | ISTRIP | IXON));
    raw.c_oflag &= static_cast<tcflag_t> (~OPOST);
    raw.c_cflag |= CS8;
    raw.c_lflag &= static_cast<tcflag_t> (~(ECHO | ICANON | IEXTEN | ISIG));
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 1;

    active = tcsetattr (STDIN_FILENO, TCSAFLUSH, &raw) == 0;
}

RawTerminal::~RawTerminal()
{
    if (active)
        tcsetattr (STDIN_FILENO, TCSAFLUSH, &original);
}

} // namespace ll
