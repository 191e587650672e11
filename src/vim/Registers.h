#pragma once

#include <juce_core/juce_core.h>

namespace ll
{

/** The session-wide yank registers shared by every editor.

    Follows vim's numbered-register behaviour: a yank writes the unnamed
    register and "0, a delete writes the unnamed register and pushes onto the
    "1-"9 history, a small delete (a few characters) only writes the unnamed
    register. Reads return copies so callers on other threads never see a
    half-written entry.
*/
class Registers
{
public:
    struct Entry
    {
        juce::String text;
        bool linewise = false;

        bool isEmpty() const { return text.isEmpty() && ! linewise; }
        bool operator== (const Entry& other) const { return text == other.text && linewise == other.linewise; }
    };

    enum StoreKind { Yank, Delete, SmallDelete };

    Registers() = default;

    void store (const juce::String& text, bool linewise, StoreKind kind);

    // reg = '\0' means the unnamed register; '0'-'9' are the numbered ones.
    Entry get (char reg = '\0') const;

    bool isEmpty() const;
    void clear();

    static bool isNumberedRegister (char c) { return c >= '0' && c <= '9'; }

private:
    mutable juce::CriticalSection lock;
    Entry unnamed;
    Entry numbered[10];   // "0 = last yank, "1-"9 = delete history

    void rotateDeleteHistory();

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (Registers)
};

} // namespace ll
