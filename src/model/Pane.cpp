#include "Pane.h"

namespace ll
{

Pane::Pane (PaneKind k, Rect b)
    : kind (k), bounds (b)
{
}

Box& Pane::addBox (std::unique_ptr<Box> box)
{
    boxes.push_back (std::move (box));

    if (activeBoxIndex < 0)
        activeBoxIndex = 0;

    return *boxes.back();
}

Box* Pane::getBox (int index) const
{
    if (! juce::isPositiveAndBelow (index, getNumBoxes()))
        return nullptr;

    return boxes[static_cast<size_t> (index)].get();
}

int Pane::indexOfBox (BoxKind k) const
{
    for (int i = 0; i < getNumBoxes(); ++i)
        if (boxes[static_cast<size_t> (i)]->getKind() == k)
            return i;

    return -1;
}

Box* Pane::findBox (BoxKind k) const
{
    return getBox (indexOfBox (k));
}

bool Pane::setActiveBoxIndex (int index)
{
    if (! juce::isPositiveAndBelow (index, getNumBoxes()) || index == activeBoxIndex)
        return false;

    activeBoxIndex = index;
    return true;
}

} // namespace ll
