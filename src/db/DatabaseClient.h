#pragma once

#include "model/FocusTypes.h"

namespace ll
{

using RequestId = juce::int64;

struct QuerySpec
{
    juce::String text;          // as typed in the query box; empty when browsing a table
    juce::String table;
    int page = 0;
    int pageSize = 50;
    juce::String sortColumn;
    bool sortDescending = false;

    bool isEmpty() const { return text.isEmpty() && table.isEmpty(); }
};

struct CellRef
{
    juce::String table;
    int row = 0;
    int column = 0;
    juce::String columnName;
    juce::String value;
};

struct QueryResult
{
    juce::String table;
    juce::StringArray columns;
    juce::Array<juce::StringArray> rows;
    int totalRows = 0;
};

// Where a foreign-key lookup landed.
struct TargetLocation
{
    PaneKind pane = PaneKind::Results;
    BoxKind box = BoxKind::DataTable;
    juce::String table;
    int row = 0;
    bool hasRows = false;   // result carries the target table's rows
    QueryResult rows;
};

/** The database backend. Each call starts work and returns at once; the
    result is delivered later through the AppController's completion
    callbacks, from any thread.
*/
class DatabaseClient
{
public:
    virtual ~DatabaseClient() = default;

    virtual RequestId executeQuery (const juce::String& connection, const QuerySpec& spec) = 0;
    virtual RequestId followForeignKey (const juce::String& connection, const CellRef& cell) = 0;
    virtual RequestId fetchSchema (const juce::String& connection) = 0;
};

} // namespace ll
