#pragma once

#include "navigation/NavigationManager.h"

namespace ll
{
namespace ui
{

// Text status bar: mode segment, focused pane and box, pending state.
class StatusLine
{
public:
    // NORMAL / INSERT / VISUAL / COMMAND in Vim mode, VIEW / EDIT in Cursor
    // mode, NAV when the focus has no editor.
    static juce::String getModeIndicator (const FocusSnapshot& focus);

    static juce::String render (const FocusSnapshot& focus,
                                const juce::String& navigationInfo,
                                int width = 80);
};

} // namespace ui
} // namespace ll
