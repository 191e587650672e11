#include "Effect.h"

namespace ll
{

juce::String Effect::getTypeName (Type t)
{
    switch (t)
    {
        case None:                    return "None";
        case FocusChanged:            return "FocusChanged";
        case BufferChanged:           return "BufferChanged";
        case ModeChanged:             return "ModeChanged";
        case RequestQuery:            return "RequestQuery";
        case RequestForeignKeyFollow: return "RequestForeignKeyFollow";
        case RequestPageChange:       return "RequestPageChange";
        case RequestSort:             return "RequestSort";
        case RequestQuit:             return "RequestQuit";
        case RequestConfirm:          return "RequestConfirm";
        case RequestSearch:           return "RequestSearch";
        case DisplayError:            return "DisplayError";
    }

    return {};
}

juce::String Effect::describe() const
{
    juce::String s = getTypeName (type);

    switch (type)
    {
        case RequestQuery:
            s << " [" << (query.table.isNotEmpty() ? query.table : query.text.upToFirstOccurrenceOf ("\n", false, false)) << "]";
            break;

        case RequestForeignKeyFollow:
            s << " [" << cell.table << "." << cell.columnName << " = " << cell.value << "]";
            break;

        case RequestPageChange:
        {
            const char* names[] = { "first", "previous", "next", "last" };
            s << " [" << names[page] << "]";
            break;
        }

        case RequestSort:
            s << " [" << columnName << "]";
            break;

        case RequestConfirm:
        case DisplayError:
            s << " [" << text << "]";
            break;

        default:
            break;
    }

    return s;
}

} // namespace ll
