#include <gtest/gtest.h>
#include "input/KeyChord.h"
#include "input/TerminalInput.h"

using namespace ll;

namespace
{

juce::StringArray chordsFor (TerminalInput& input, const std::string& bytes)
{
    juce::StringArray chords;

    for (auto& e : input.decode (bytes.data(), bytes.size()))
        chords.add (KeyChord::fromEvent (e));

    return chords;
}

juce::StringArray decodeAll (const std::string& bytes)
{
    TerminalInput input;
    auto chords = chordsFor (input, bytes);

    for (auto& e : input.flushPending())
        chords.add (KeyChord::fromEvent (e));

    return chords;
}

} // namespace

TEST (TerminalInput, PlainText)
{
    EXPECT_EQ (decodeAll ("hL$"), juce::StringArray ({ "h", "Shift+l", "$" }));
}

TEST (TerminalInput, ControlCodes)
{
    EXPECT_EQ (decodeAll ("\x11"), juce::StringArray ({ "Ctrl+q" }));
    EXPECT_EQ (decodeAll ("\r\t\x7f"), juce::StringArray ({ "Enter", "Tab", "Backspace" }));
    EXPECT_EQ (decodeAll ("\x08\x0a"), juce::StringArray ({ "Ctrl+h", "Ctrl+j" }));
}

TEST (TerminalInput, CsiSequences)
{
    EXPECT_EQ (decodeAll ("\x1b[A\x1b[B\x1b[C\x1b[D"),
               juce::StringArray ({ "Up", "Down", "Right", "Left" }));
    EXPECT_EQ (decodeAll ("\x1b[H\x1b[F\x1bOH\x1bOF"),
               juce::StringArray ({ "Home", "End", "Home", "End" }));
    EXPECT_EQ (decodeAll ("\x1b[3~\x1b[5~\x1b[6~\x1b[2~"),
               juce::StringArray ({ "Delete", "PageUp", "PageDown", "Insert" }));
    EXPECT_EQ (decodeAll ("\x1b[Z"), juce::StringArray ({ "BackTab" }));
    EXPECT_EQ (decodeAll ("\x1bOP\x1b[15~\x1b[24~"), juce::StringArray ({ "F1", "F5", "F12" }));
}

TEST (TerminalInput, ModifierParameters)
{
    EXPECT_EQ (decodeAll ("\x1b[1;2C"), juce::StringArray ({ "Shift+Right" }));
    EXPECT_EQ (decodeAll ("\x1b[1;5D"), juce::StringArray ({ "Ctrl+Left" }));
    EXPECT_EQ (decodeAll ("\x1b[1;3A"), juce::StringArray ({ "Alt+Up" }));
    EXPECT_EQ (decodeAll ("\x1b[3;5~"), juce::StringArray ({ "Ctrl+Delete" }));
}

TEST (TerminalInput, EscapePrefixIsAlt)
{
    EXPECT_EQ (decodeAll ("\x1bt"), juce::StringArray ({ "Alt+t" }));
    EXPECT_EQ (decodeAll ("\x1bJ"), juce::StringArray ({ "Alt+Shift+j" }));
}

TEST (TerminalInput, LoneEscapeWaitsForTimeout)
{
    TerminalInput input;

    EXPECT_TRUE (chordsFor (input, "\x1b").isEmpty());

    auto flushed = input.flushPending();
    ASSERT_EQ (flushed.size(), 1);
    EXPECT_EQ (KeyChord::fromEvent (flushed[0]), "Esc");
}

TEST (TerminalInput, SequenceSplitAcrossReads)
{
    TerminalInput input;

    EXPECT_TRUE (chordsFor (input, "\x1b[1;").isEmpty());
    EXPECT_EQ (chordsFor (input, "2Bj"), juce::StringArray ({ "Shift+Down", "j" }));
}

TEST (TerminalInput, Utf8)
{
    TerminalInput input;

    // "é" split between reads
    EXPECT_TRUE (chordsFor (input, "\xc3").isEmpty());
    auto keys = input.decode ("\xa9", 1);

    ASSERT_EQ (keys.size(), 1);
    EXPECT_EQ (keys[0].character, static_cast<juce::juce_wchar> (0xe9));
}

TEST (TerminalInput, UnknownSequencesAreSkipped)
{
    EXPECT_EQ (decodeAll ("\x1b[99~x"), juce::StringArray ({ "x" }));
}
