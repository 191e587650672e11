#include <gtest/gtest.h>
#include "vim/VimEditor.h"

using namespace ll;
using A = NavigationAction;

namespace
{

class VimEditorTest : public ::testing::Test
{
protected:
    Registers registers;
    VimEditor editor { registers };

    void type (const juce::String& s)
    {
        for (auto p = s.getCharPointer(); ! p.isEmpty(); ++p)
            editor.handleAction (A::InsertChar, *p);
    }

    void count (int n)
    {
        auto digits = juce::String (n);

        for (int i = 0; i < digits.length(); ++i)
            editor.accumulateDigit (static_cast<int> (digits[i] - '0'));
    }
};

const A motions[] =
{
    A::MoveLeft, A::MoveRight, A::MoveUp, A::MoveDown,
    A::MoveToStart, A::MoveToEnd, A::MoveToNextWord, A::MoveToPreviousWord
};

} // namespace

TEST_F (VimEditorTest, StartsInNormalMode)
{
    EXPECT_EQ (editor.getMode(), VimMode::Normal);
    EXPECT_EQ (editor.getCursor(), 0);
    EXPECT_TRUE (editor.getText().isEmpty());
}

TEST_F (VimEditorTest, YankPasteRoundTrip)
{
    EXPECT_EQ (editor.handleAction (A::EnterInsertMode), VimEditor::ModeChanged);
    type ("abc");
    EXPECT_EQ (editor.handleAction (A::EnterNormalMode), VimEditor::ModeChanged);

    EXPECT_EQ (editor.handleAction (A::EnterVisualMode), VimEditor::ModeChanged);
    editor.handleAction (A::MoveToStart);
    EXPECT_EQ (editor.getSelection(), juce::Range<int> (0, 3));

    editor.handleAction (A::Copy);
    EXPECT_EQ (editor.getMode(), VimMode::Normal);
    EXPECT_EQ (registers.get().text, "abc");

    editor.handleAction (A::MoveToEnd);
    EXPECT_EQ (editor.handleAction (A::Paste), VimEditor::BufferChanged);
    EXPECT_EQ (editor.getText(), "abcabc");
}

TEST_F (VimEditorTest, InsertAndAppend)
{
    editor.setText ("ac");
    editor.handleAction (A::EnterAppendMode);
    type ("b");
    EXPECT_EQ (editor.getText(), "abc");
    EXPECT_EQ (editor.getCursor(), 2);
}

TEST_F (VimEditorTest, MotionsStayInsideTheLine)
{
    editor.setText ("one\ntwo three");

    editor.handleAction (A::MoveLeft);
    EXPECT_EQ (editor.getCursor(), 0);

    editor.handleAction (A::MoveToEnd);
    EXPECT_EQ (editor.getCursor(), 3);

    editor.handleAction (A::MoveRight);
    EXPECT_EQ (editor.getCursor(), 3);

    editor.handleAction (A::MoveDown);
    EXPECT_EQ (editor.getLineIndex(), 1);
    EXPECT_EQ (editor.getColumn(), 3);

    editor.handleAction (A::MoveDown);
    EXPECT_EQ (editor.getLineIndex(), 1);

    editor.handleAction (A::MoveToNextWord);
    EXPECT_EQ (editor.getColumn(), 4);

    editor.handleAction (A::MoveToPreviousWord);
    EXPECT_EQ (editor.getColumn(), 0);

    editor.handleAction (A::MoveUp);
    EXPECT_EQ (editor.getLineIndex(), 0);
}

TEST_F (VimEditorTest, CursorAlwaysWithinBuffer)
{
    juce::Random random (1234);
    const juce::String samples[] = { "", "x", "hello world", "a\n\nb c d\nlonger line here\n" };

    for (auto& sample : samples)
    {
        editor.setText (sample);

        for (int i = 0; i < 500; ++i)
        {
            auto action = motions[random.nextInt (juce::numElementsInArray (motions))];

            if (random.nextInt (4) == 0)
                count (1 + random.nextInt (20));

            editor.handleAction (action);

            ASSERT_GE (editor.getCursor(), 0);
            ASSERT_LE (editor.getCursor(), editor.getText().length());
        }

        editor.handleAction (A::EnterVisualMode);

        for (int i = 0; i < 100; ++i)
        {
            editor.handleAction (motions[random.nextInt (juce::numElementsInArray (motions))]);
            auto sel = editor.getSelection();

            ASSERT_GE (sel.getStart(), 0);
            ASSERT_LE (sel.getEnd(), editor.getText().length());
        }

        editor.handleAction (A::EnterNormalMode);
    }
}

TEST_F (VimEditorTest, CountedMotionMatchesRepeatedMotion)
{
    const juce::String text = "the quick brown fox jumps over the lazy dog\n"
                              "pack my box with five dozen liquor jugs\n"
                              "short\n"
                              "sphinx of black quartz judge my vow";

    Registers otherRegisters;
    VimEditor reference (otherRegisters);

    for (auto motion : motions)
    {
        for (int n = 1; n <= 50; ++n)
        {
            editor.setText (text);
            editor.setCursor (10);
            reference.setText (text);
            reference.setCursor (10);

            count (n);
            editor.handleAction (motion);

            for (int i = 0; i < n; ++i)
                reference.handleAction (motion);

            ASSERT_EQ (editor.getCursor(), reference.getCursor())
                << getActionName (motion) << " x" << n;
            EXPECT_FALSE (editor.hasPendingCount());
        }
    }
}

TEST_F (VimEditorTest, CountIsCappedAndCancelled)
{
    count (123456);
    EXPECT_EQ (editor.getPendingCount(), 99999);

    EXPECT_EQ (editor.handleAction (A::Cancel), VimEditor::StateChanged);
    EXPECT_FALSE (editor.hasPendingCount());
    EXPECT_EQ (editor.handleAction (A::Cancel), VimEditor::Ignored);
}

TEST_F (VimEditorTest, DeleteCharWithCount)
{
    editor.setText ("abcdef\nxyz");
    editor.setCursor (1);

    count (3);
    EXPECT_EQ (editor.handleAction (A::DeleteChar), VimEditor::BufferChanged);
    EXPECT_EQ (editor.getText(), "aef\nxyz");
    EXPECT_EQ (registers.get().text, "bcd");

    // Never deletes across the line break
    count (9);
    editor.handleAction (A::DeleteChar);
    EXPECT_EQ (editor.getText(), "a\nxyz");
}

TEST_F (VimEditorTest, ReplaceChar)
{
    editor.setText ("abcd");
    editor.setCursor (1);

    EXPECT_EQ (editor.handleAction (A::ReplaceChar), VimEditor::StateChanged);
    EXPECT_TRUE (editor.isAwaitingReplacement());

    count (2);
    EXPECT_EQ (editor.handleAction (A::InsertChar, 'z'), VimEditor::BufferChanged);
    EXPECT_EQ (editor.getText(), "azzd");
    EXPECT_EQ (editor.getCursor(), 2);
    EXPECT_FALSE (editor.isAwaitingReplacement());

    // Too few characters left: nothing is replaced
    editor.handleAction (A::ReplaceChar);
    count (5);
    EXPECT_EQ (editor.handleAction (A::InsertChar, 'q'), VimEditor::StateChanged);
    EXPECT_EQ (editor.getText(), "azzd");
}

TEST_F (VimEditorTest, UndoRedo)
{
    editor.handleAction (A::EnterInsertMode);
    type ("hello");
    editor.handleAction (A::EnterNormalMode);

    editor.handleAction (A::MoveToStart);
    editor.handleAction (A::DeleteChar);
    EXPECT_EQ (editor.getText(), "ello");

    EXPECT_EQ (editor.handleAction (A::Undo), VimEditor::BufferChanged);
    EXPECT_EQ (editor.getText(), "hello");

    // The whole insert session undoes as one step
    editor.handleAction (A::Undo);
    EXPECT_EQ (editor.getText(), "");
    EXPECT_EQ (editor.handleAction (A::Undo), VimEditor::Ignored);

    editor.handleAction (A::Redo);
    EXPECT_EQ (editor.getText(), "hello");
    EXPECT_TRUE (editor.canRedo());
}

TEST_F (VimEditorTest, SetTextClearsHistory)
{
    editor.handleAction (A::EnterInsertMode);
    type ("abc");
    editor.handleAction (A::EnterNormalMode);
    ASSERT_TRUE (editor.canUndo());

    editor.setText ("new");
    EXPECT_FALSE (editor.canUndo());
    EXPECT_EQ (editor.getCursor(), 0);
}

TEST_F (VimEditorTest, LinewiseYankAndPaste)
{
    editor.setText ("first\nsecond");

    editor.handleAction (A::CopyRow);
    EXPECT_TRUE (registers.get().linewise);
    EXPECT_EQ (registers.get().text, "first");
    EXPECT_EQ (registers.get ('0').text, "first");

    editor.handleAction (A::Paste);
    EXPECT_EQ (editor.getText(), "first\nfirst\nsecond");
    EXPECT_EQ (editor.getLineIndex(), 1);
}

TEST_F (VimEditorTest, CutRowRemovesTheLine)
{
    editor.setText ("a\nb\nc");
    editor.handleAction (A::MoveDown);

    EXPECT_EQ (editor.handleAction (A::CutRow), VimEditor::BufferChanged);
    EXPECT_EQ (editor.getText(), "a\nc");
    EXPECT_EQ (registers.get ('1').text, "b");

    editor.setText ("");
    EXPECT_EQ (editor.handleAction (A::CutRow), VimEditor::Ignored);
}

TEST_F (VimEditorTest, VisualCut)
{
    editor.setText ("hello world");
    editor.setCursor (6);
    editor.handleAction (A::EnterVisualMode);
    editor.handleAction (A::MoveToEnd);

    EXPECT_EQ (editor.handleAction (A::Cut), VimEditor::BufferChanged);
    EXPECT_EQ (editor.getText(), "hello ");
    EXPECT_EQ (registers.get().text, "world");
    EXPECT_EQ (editor.getMode(), VimMode::Normal);
}

TEST_F (VimEditorTest, VisualPasteReplacesSelection)
{
    registers.store ("XY", false, Registers::Yank);
    editor.setText ("abcdef");
    editor.setCursor (1);
    editor.handleAction (A::EnterVisualMode);
    editor.handleAction (A::MoveRight);
    editor.handleAction (A::MoveRight);

    EXPECT_EQ (editor.handleAction (A::Paste), VimEditor::BufferChanged);
    EXPECT_EQ (editor.getText(), "aXYef");
}

TEST_F (VimEditorTest, CommandMode)
{
    EXPECT_EQ (editor.handleAction (A::EnterCommandMode), VimEditor::ModeChanged);
    EXPECT_EQ (editor.getMode(), VimMode::Command);

    editor.handleAction (A::InsertChar, 'q');
    editor.handleAction (A::InsertChar, 'x');
    editor.handleAction (A::DeleteCharBefore);
    EXPECT_EQ (editor.getCommandLine(), "q");

    EXPECT_EQ (editor.handleAction (A::Confirm), VimEditor::CommandEntered);
    EXPECT_EQ (editor.takeEnteredCommand(), "q");
    EXPECT_EQ (editor.takeEnteredCommand(), "");
    EXPECT_EQ (editor.getMode(), VimMode::Normal);
}

TEST_F (VimEditorTest, BackspaceOnEmptyCommandLineLeaves)
{
    editor.handleAction (A::EnterCommandMode);
    EXPECT_EQ (editor.handleAction (A::DeleteCharBefore), VimEditor::ModeChanged);
    EXPECT_EQ (editor.getMode(), VimMode::Normal);
}

TEST_F (VimEditorTest, CursorModeEditing)
{
    editor.enterInsertMode();

    EXPECT_EQ (editor.handleCursorAction (A::InsertChar, 'h'), VimEditor::BufferChanged);
    EXPECT_EQ (editor.handleCursorAction (A::InsertChar, 'i'), VimEditor::BufferChanged);
    EXPECT_EQ (editor.getText(), "hi");

    EXPECT_EQ (editor.handleCursorAction (A::Undo), VimEditor::BufferChanged);
    EXPECT_EQ (editor.getText(), "");

    EXPECT_EQ (editor.handleCursorAction (A::Redo), VimEditor::BufferChanged);
    EXPECT_EQ (editor.getText(), "hi");

    EXPECT_EQ (editor.handleCursorAction (A::ToggleViewEditMode), VimEditor::Ignored);
}

TEST_F (VimEditorTest, EditingActionsIgnoredWhereMeaningless)
{
    EXPECT_EQ (editor.handleAction (A::InsertNewline), VimEditor::Ignored);
    EXPECT_EQ (editor.handleAction (A::Paste), VimEditor::Ignored);
    EXPECT_EQ (editor.handleAction (A::FocusResults), VimEditor::Ignored);
}

TEST_F (VimEditorTest, OpenLineBelow)
{
    editor.setText ("one\ntwo");
    editor.setCursor (1);

    EXPECT_EQ (editor.handleAction (A::OpenLineBelow), VimEditor::ModeChanged);
    EXPECT_EQ (editor.getMode(), VimMode::Insert);
    EXPECT_EQ (editor.getText(), "one\n\ntwo");
    EXPECT_EQ (editor.getCursor(), 4);

    type ("x");
    editor.handleAction (A::EnterNormalMode);
    EXPECT_EQ (editor.getText(), "one\nx\ntwo");

    // The new line and the typing undo together
    editor.handleAction (A::Undo);
    EXPECT_EQ (editor.getText(), "one\ntwo");
}

TEST_F (VimEditorTest, OpenLineAbove)
{
    editor.setText ("one\ntwo");
    editor.setCursor (6);

    EXPECT_EQ (editor.handleAction (A::OpenLineAbove), VimEditor::ModeChanged);
    EXPECT_EQ (editor.getMode(), VimMode::Insert);
    EXPECT_EQ (editor.getText(), "one\n\ntwo");
    EXPECT_EQ (editor.getCursor(), 4);

    type ("x");
    EXPECT_EQ (editor.getText(), "one\nx\ntwo");
}

TEST_F (VimEditorTest, CountedPasteIsBounded)
{
    registers.store (juce::String::repeatedString ("abcdefgh", 1000), false, Registers::Yank);

    count (99999);
    EXPECT_EQ (editor.handleAction (A::Paste), VimEditor::BufferChanged);

    EXPECT_GT (editor.getText().length(), 0);
    EXPECT_LE (editor.getText().length(), VimEditor::maxPasteLength);
    EXPECT_EQ (editor.getText().length() % 8000, 0);
}
