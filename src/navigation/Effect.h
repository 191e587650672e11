#pragma once

#include "db/DatabaseClient.h"

namespace ll
{

// The observable result of dispatching one key or completion.
struct Effect
{
    enum Type
    {
        None,
        FocusChanged,
        BufferChanged,
        ModeChanged,
        RequestQuery,
        RequestForeignKeyFollow,
        RequestPageChange,
        RequestSort,
        RequestQuit,
        RequestConfirm,
        RequestSearch,
        DisplayError
    };

    enum PageDirection { FirstPage, PreviousPage, NextPage, LastPage };

    Type type = None;
    PaneKind origin = PaneKind::Connections;
    juce::String text;            // confirm text or error message
    QuerySpec query;              // RequestQuery
    CellRef cell;                 // RequestForeignKeyFollow
    PageDirection page = NextPage;
    int column = -1;              // RequestSort
    juce::String columnName;
    bool fromModal = false;       // RequestConfirm raised by dismissing a modal

    static Effect make (Type t, PaneKind from)
    {
        Effect e;
        e.type = t;
        e.origin = from;
        return e;
    }

    bool isNone() const    { return type == None; }
    bool isRequest() const { return type >= RequestQuery && type <= RequestSearch; }

    static juce::String getTypeName (Type t);
    juce::String describe() const;
};

} // namespace ll
