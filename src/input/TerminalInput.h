#pragma once

#include "input/KeyEvent.h"
#include <string>
#include <termios.h>

namespace ll
{

/** Decodes raw terminal bytes into key events.

    Handles CSI and SS3 sequences (arrows, Home/End, Insert/Delete,
    PageUp/PageDown, F1-F12, BackTab, xterm modifier parameters), control
    codes as Ctrl+letter, ESC-prefixed keys as Alt, and UTF-8 text. An
    incomplete sequence at the end of a chunk is held until the next chunk;
    flushPending() resolves it once the read times out, so a lone ESC
    becomes Escape.
*/
class TerminalInput
{
public:
    TerminalInput() = default;

    juce::Array<KeyEvent> decode (const char* data, size_t size);
    juce::Array<KeyEvent> flushPending();

private:
    enum Result { Decoded, Incomplete, Skipped };

    std::string pending;

    juce::Array<KeyEvent> decodeBuffer (bool final);
    Result decodeOne (size_t& pos, KeyEvent& out, bool final) const;
    Result decodeEscape (size_t& pos, KeyEvent& out, bool final) const;
    Result decodeCsi (size_t& pos, KeyEvent& out) const;
    Result decodeText (size_t& pos, KeyEvent& out) const;

    JUCE_DECLARE_NON_COPYABLE (TerminalInput)
};

/** Puts stdin into raw mode for its lifetime; reads return after 100 ms
    without input so pending escapes can be flushed.
*/
class RawTerminal
{
public:
    RawTerminal();
    ~RawTerminal();

    bool isActive() const { return active; }

private:
    struct termios original {};
    bool active = false;

    JUCE_DECLARE_NON_COPYABLE (RawTerminal)
};

} // namespace ll
