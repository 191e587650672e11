#pragma once

#include "model/Box.h"
#include <vector>

namespace ll
{

/** Top-level container. Panes are created once by the layout and only ever
    shown or hidden afterwards. The active box index is -1 when the pane has
    no boxes.
*/
class Pane
{
public:
    Pane (PaneKind kind, Rect bounds);

    PaneKind getKind() const { return kind; }
    juce::String getName() const { return getPaneName (kind); }
    Rect getBounds() const { return bounds; }

    bool isVisible() const { return visible; }
    void setVisible (bool shouldBeVisible) { visible = shouldBeVisible; }

    Box& addBox (std::unique_ptr<Box> box);

    int getNumBoxes() const { return static_cast<int> (boxes.size()); }
    Box* getBox (int index) const;
    int indexOfBox (BoxKind kind) const;
    Box* findBox (BoxKind kind) const;

    int getActiveBoxIndex() const { return activeBoxIndex; }
    bool setActiveBoxIndex (int index);
    Box* getActiveBox() const { return getBox (activeBoxIndex); }

private:
    PaneKind kind;
    Rect bounds;
    bool visible = true;

    std::vector<std::unique_ptr<Box>> boxes;
    int activeBoxIndex = -1;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (Pane)
};

} // namespace ll
