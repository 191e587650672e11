#include "StatusLine.h"

namespace ll
{
namespace ui
{

juce::String StatusLine::getModeIndicator (const FocusSnapshot& focus)
{
    if (focus.hasVimMode)
        return getVimModeName (focus.vimMode);

    if (focus.hasBox && focus.editingMode == EditingMode::Cursor
        && (focus.box == BoxKind::TextInput || focus.box == BoxKind::DataTable))
        return focus.cursorEditing ? "EDIT" : "VIEW";

    return "NAV";
}

juce::String StatusLine::render (const FocusSnapshot& focus,
                                 const juce::String& navigationInfo, int width)
{
    // ── Command line takes the whole bar
    if (focus.commandActive)
        return (":" + focus.commandLine).substring (0, width);

    juce::String line;
    line << "-- " << getModeIndicator (focus) << " --";

    // ── Pending state
    if (focus.pendingCount > 0)
        line << "  " << focus.pendingCount;

    if (focus.modalOpen)
        line << "  [modal]";

    // ── Navigation info, right-aligned
    auto info = navigationInfo.substring (0, std::max (0, width - line.length() - 1));
    int gap = width - line.length() - info.length();

    if (gap > 0)
        line << juce::String::repeatedString (" ", gap);

    return line + info;
}

} // namespace ui
} // namespace ll
