#include <gtest/gtest.h>
#include "navigation/BoxManager.h"

using namespace ll;
using A = NavigationAction;

namespace
{

KeyResolution action (A a, juce::juce_wchar c = 0)
{
    KeyResolution r;
    r.kind = KeyResolution::Action;
    r.action = a;
    r.character = c;
    return r;
}

class BoxManagerTest : public ::testing::Test
{
protected:
    Registers registers;
    BoxManager manager { registers };
    Box table { BoxKind::DataTable, "results" };
    Effect effect;

    void SetUp() override
    {
        table.enableEditing (registers);
        table.setColumns ({ "id", "name", "owner_id" });

        juce::Array<juce::StringArray> rows;

        for (int i = 0; i < 10; ++i)
            rows.add (juce::StringArray::fromTokens (juce::String (i) + " row" + juce::String (i) + " 7", false));

        table.setRows (rows);
    }

    bool send (A a, juce::juce_wchar c = 0)
    {
        return manager.dispatch (action (a, c), table, PaneKind::Results, effect);
    }
};

} // namespace

TEST_F (BoxManagerTest, CountedMoveOnDataTable)
{
    manager.accumulateCount (table, 3);
    ASSERT_TRUE (send (A::MoveDown));

    EXPECT_EQ (table.getRow(), 3);
    EXPECT_FALSE (table.getEditor()->hasPendingCount());
}

TEST_F (BoxManagerTest, CountedMoveClampsAtLastRow)
{
    table.setCursorCell (8, 0);
    manager.accumulateCount (table, 3);
    send (A::MoveDown);

    EXPECT_EQ (table.getRow(), 9);
}

TEST_F (BoxManagerTest, TableColumnMotions)
{
    send (A::MoveToEnd);
    EXPECT_EQ (table.getColumn(), 2);

    send (A::MoveRight);
    EXPECT_EQ (table.getColumn(), 2);

    send (A::MoveToStart);
    EXPECT_EQ (table.getColumn(), 0);
}

TEST_F (BoxManagerTest, CopyCellAndRow)
{
    table.setCursorCell (2, 1);

    send (A::Copy);
    EXPECT_EQ (registers.get().text, "row2");
    EXPECT_FALSE (registers.get().linewise);

    send (A::CopyRow);
    EXPECT_EQ (registers.get().text, "2\trow2\t7");
    EXPECT_TRUE (registers.get().linewise);
}

TEST_F (BoxManagerTest, PasteRowIntoTable)
{
    table.setCursorCell (0, 0);
    send (A::CopyRow);

    table.setCursorCell (5, 0);
    ASSERT_TRUE (send (A::Paste));

    EXPECT_EQ (effect.type, Effect::BufferChanged);
    EXPECT_EQ (table.getRowText (5), "0\trow0\t7");
}

TEST_F (BoxManagerTest, CutClearsCell)
{
    table.setCursorCell (4, 1);
    send (A::Cut);

    EXPECT_EQ (table.getCell (4, 1), "");
    EXPECT_EQ (registers.get ('1').text, "row4");
}

TEST_F (BoxManagerTest, EditCellAndCommit)
{
    table.setCursorCell (1, 1);

    ASSERT_TRUE (send (A::EnterAppendMode));
    EXPECT_EQ (effect.type, Effect::ModeChanged);
    EXPECT_TRUE (BoxManager::isEditingText (table));
    EXPECT_EQ (table.getEditor()->getText(), "row1");

    send (A::InsertChar, '!');
    ASSERT_TRUE (send (A::EnterNormalMode));

    EXPECT_EQ (effect.type, Effect::BufferChanged);
    EXPECT_EQ (table.getCell (1, 1), "row1!");
    EXPECT_FALSE (BoxManager::isEditingText (table));
}

TEST_F (BoxManagerTest, NavigationActionsAreNotClaimed)
{
    EXPECT_FALSE (send (A::FocusConnections));
    EXPECT_FALSE (send (A::FollowForeignKey));
    EXPECT_FALSE (send (A::Confirm));
}

TEST_F (BoxManagerTest, PaneDirectionalMovesAreNotClaimed)
{
    auto r = action (A::MoveDown);
    r.paneDirectional = true;

    EXPECT_FALSE (manager.dispatch (r, table, PaneKind::Results, effect));
    EXPECT_EQ (table.getRow(), 0);
}

TEST_F (BoxManagerTest, CancelClearsPendingCount)
{
    manager.accumulateCount (table, 4);
    EXPECT_TRUE (send (A::Cancel));
    EXPECT_FALSE (table.getEditor()->hasPendingCount());

    EXPECT_FALSE (send (A::Cancel));
}

TEST_F (BoxManagerTest, CursorModeTableToggle)
{
    table.setEditingMode (EditingMode::Cursor);
    table.setCursorCell (0, 1);

    ASSERT_TRUE (send (A::ToggleViewEditMode));
    EXPECT_TRUE (table.isEditing());

    send (A::InsertChar, 'X');
    send (A::ToggleViewEditMode);

    EXPECT_FALSE (table.isEditing());
    EXPECT_EQ (table.getCell (0, 1), "Xrow0");
}

TEST (BoxManager, TreeClaimsVerticalMovesOnly)
{
    Registers registers;
    BoxManager manager (registers);
    Box tree (BoxKind::TreeView, "tables");
    tree.setItems ({ "users", "orders", "items" });
    Effect effect;

    EXPECT_TRUE (manager.dispatch (action (A::MoveDown), tree, PaneKind::SchemaExplorer, effect));
    EXPECT_EQ (tree.getRow(), 1);

    EXPECT_TRUE (manager.dispatch (action (A::MoveToEnd), tree, PaneKind::SchemaExplorer, effect));
    EXPECT_EQ (tree.getRow(), 2);

    // Horizontal moves fall through to spatial navigation
    EXPECT_FALSE (manager.dispatch (action (A::MoveRight), tree, PaneKind::SchemaExplorer, effect));

    // Edits are swallowed
    EXPECT_TRUE (manager.dispatch (action (A::InsertChar, 'x'), tree, PaneKind::SchemaExplorer, effect));
    EXPECT_EQ (tree.getCurrentItemText(), "items");
    EXPECT_TRUE (effect.isNone());
}

TEST (BoxManager, TextBoxInVimMode)
{
    Registers registers;
    BoxManager manager (registers);
    Box query (BoxKind::TextInput, "query");
    query.enableEditing (registers);
    Effect effect;

    EXPECT_TRUE (manager.dispatch (action (A::EnterInsertMode), query, PaneKind::QueryInput, effect));
    EXPECT_EQ (effect.type, Effect::ModeChanged);

    manager.dispatch (action (A::InsertChar, 's'), query, PaneKind::QueryInput, effect);
    EXPECT_EQ (effect.type, Effect::BufferChanged);
    EXPECT_EQ (query.getCurrentItemText(), "s");

    // Normal mode has no use for Confirm, so it goes on to navigation
    manager.dispatch (action (A::EnterNormalMode), query, PaneKind::QueryInput, effect);
    EXPECT_FALSE (manager.dispatch (action (A::Confirm), query, PaneKind::QueryInput, effect));
}

TEST (BoxManager, EditorCommandIsRun)
{
    Registers registers;
    BoxManager manager (registers);
    Box query (BoxKind::TextInput, "query");
    query.enableEditing (registers);
    Effect effect;

    juce::String ran;
    manager.onCommand = [&ran] (const juce::String& command)
    {
        ran = command;
        return Effect::make (Effect::RequestQuit, PaneKind::QueryInput);
    };

    manager.dispatch (action (A::EnterCommandMode), query, PaneKind::QueryInput, effect);
    manager.dispatch (action (A::InsertChar, 'q'), query, PaneKind::QueryInput, effect);
    ASSERT_TRUE (manager.dispatch (action (A::Confirm), query, PaneKind::QueryInput, effect));

    EXPECT_EQ (ran, "q");
    EXPECT_EQ (effect.type, Effect::RequestQuit);
}

TEST (BoxManager, CursorModeTextBoxViewState)
{
    Registers registers;
    BoxManager manager (registers);
    Box query (BoxKind::TextInput, "query");
    query.enableEditing (registers);
    query.setEditingMode (EditingMode::Cursor);
    query.getEditor()->setText ("select 1");
    Effect effect;

    EXPECT_FALSE (manager.dispatch (action (A::MoveRight), query, PaneKind::QueryInput, effect));
    EXPECT_TRUE (manager.dispatch (action (A::Copy), query, PaneKind::QueryInput, effect));
    EXPECT_EQ (registers.get().text, "select 1");

    EXPECT_TRUE (manager.dispatch (action (A::ToggleViewEditMode), query, PaneKind::QueryInput, effect));
    EXPECT_TRUE (query.isEditing());
    EXPECT_TRUE (manager.dispatch (action (A::MoveRight), query, PaneKind::QueryInput, effect));
}

TEST (BoxManager, CycleAndFocusBoxes)
{
    Registers registers;
    BoxManager manager (registers);
    Pane pane (PaneKind::SchemaExplorer, {});
    pane.addBox (std::make_unique<Box> (BoxKind::TreeView, "tables"));
    pane.addBox (std::make_unique<Box> (BoxKind::ListView, "columns"));

    EXPECT_TRUE (manager.cycleBox (pane, 1));
    EXPECT_EQ (pane.getActiveBoxIndex(), 1);
    EXPECT_TRUE (manager.cycleBox (pane, 1));
    EXPECT_EQ (pane.getActiveBoxIndex(), 0);
    EXPECT_TRUE (manager.cycleBox (pane, -1));
    EXPECT_EQ (pane.getActiveBoxIndex(), 1);

    EXPECT_TRUE (manager.focusBox (pane, BoxKind::TreeView));
    EXPECT_FALSE (manager.focusBox (pane, BoxKind::TreeView));
    EXPECT_FALSE (manager.focusBox (pane, BoxKind::DataTable));

    Pane single (PaneKind::QueryInput, {});
    single.addBox (std::make_unique<Box> (BoxKind::TextInput, "query"));
    EXPECT_FALSE (manager.cycleBox (single, 1));
}
