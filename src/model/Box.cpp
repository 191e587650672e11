#include "Box.h"

namespace ll
{

Box::Box (BoxKind k, const juce::String& n, Rect b)
    : kind (k), name (n), bounds (b)
{
}

void Box::enableEditing (Registers& registers)
{
    if (editor == nullptr)
        editor = std::make_unique<VimEditor> (registers);
}

void Box::setEditingMode (EditingMode m)
{
    editingMode = m;
    editing = false;

    if (editor != nullptr)
        editor->enterNormalMode();
}

// ─── Rows ───────────────────────────────────────────────────────────────────

void Box::setColumns (const juce::StringArray& names)
{
    columns = names;
    setCursorCell (row, column);
}

void Box::setRows (const juce::Array<juce::StringArray>& newRows)
{
    rows = newRows;
    setCursorCell (row, column);
}

void Box::setItems (const juce::StringArray& items)
{
    rows.clear();

    for (auto& item : items)
        rows.add (juce::StringArray (item));

    setCursorCell (row, column);
}

void Box::clearRows()
{
    rows.clear();
    row = 0;
    column = 0;
}

int Box::getNumColumns() const
{
    int n = columns.size();

    for (auto& r : rows)
        n = std::max (n, r.size());

    return n;
}

juce::String Box::getCell (int r, int c) const
{
    if (! juce::isPositiveAndBelow (r, rows.size()))
        return {};

    return rows.getReference (r)[c];
}

void Box::setCell (int r, int c, const juce::String& value)
{
    if (! juce::isPositiveAndBelow (r, rows.size()) || c < 0)
        return;

    auto& cells = rows.getReference (r);

    while (cells.size() <= c)
        cells.add ({});

    cells.set (c, value);
}

juce::String Box::getRowText (int r) const
{
    if (! juce::isPositiveAndBelow (r, rows.size()))
        return {};

    return rows.getReference (r).joinIntoString ("\t");
}

void Box::setCursorCell (int newRow, int newColumn)
{
    row = juce::jlimit (0, std::max (0, rows.size() - 1), newRow);
    column = juce::jlimit (0, std::max (0, getNumColumns() - 1), newColumn);
}

void Box::moveCursorBy (int rowDelta, int columnDelta)
{
    setCursorCell (row + rowDelta, column + columnDelta);
}

juce::String Box::getCurrentItemText() const
{
    if (! isRowBased())
        return editor != nullptr ? editor->getText() : juce::String();

    return getCurrentCell();
}

} // namespace ll
