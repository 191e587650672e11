#pragma once

#include "model/FocusTypes.h"
#include "model/Geometry.h"
#include "vim/VimEditor.h"
#include <memory>

namespace ll
{

/** A focusable unit inside a pane.

    Text boxes keep their content in the editor. Row-based boxes (table,
    tree, list, modal) keep rows of cells and a grid cursor that is always
    clamped to the content.
*/
class Box
{
public:
    Box (BoxKind kind, const juce::String& name, Rect bounds = {});

    BoxKind getKind() const { return kind; }
    const juce::String& getName() const { return name; }

    Rect getBounds() const { return bounds; }
    void setBounds (Rect r) { bounds = r; }

    bool isRowBased() const { return kind != BoxKind::TextInput; }

    // ── Editing ──────────────────────────────────────────────────
    void enableEditing (Registers& registers);
    bool supportsEditing() const { return editor != nullptr; }
    VimEditor* getEditor() const { return editor.get(); }

    EditingMode getEditingMode() const { return editingMode; }
    void setEditingMode (EditingMode m);

    // Cursor editing mode: false = view, true = edit
    bool isEditing() const { return editing; }
    void setEditing (bool shouldEdit) { editing = shouldEdit; }

    // ── Rows ─────────────────────────────────────────────────────
    void setColumns (const juce::StringArray& names);
    const juce::StringArray& getColumns() const { return columns; }

    void setRows (const juce::Array<juce::StringArray>& newRows);
    void setItems (const juce::StringArray& items);
    void clearRows();

    int getNumRows() const { return rows.size(); }
    int getNumColumns() const;

    juce::String getCell (int row, int column) const;
    void setCell (int row, int column, const juce::String& value);
    juce::String getRowText (int row) const;

    int getRow() const { return row; }
    int getColumn() const { return column; }
    void setCursorCell (int newRow, int newColumn);
    void moveCursorBy (int rowDelta, int columnDelta);

    juce::String getCurrentCell() const { return getCell (row, column); }
    juce::String getColumnName (int index) const { return columns[index]; }

    // Text of the focused item: cell for row boxes, buffer for text boxes
    juce::String getCurrentItemText() const;

    const juce::String& getTableName() const { return tableName; }
    void setTableName (const juce::String& t) { tableName = t; }

private:
    BoxKind kind;
    juce::String name;
    Rect bounds;

    std::unique_ptr<VimEditor> editor;
    EditingMode editingMode = EditingMode::Vim;
    bool editing = false;

    juce::StringArray columns;
    juce::Array<juce::StringArray> rows;
    int row = 0;
    int column = 0;
    juce::String tableName;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (Box)
};

} // namespace ll
