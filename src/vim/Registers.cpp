#include "Registers.h"

namespace ll
{

void Registers::store (const juce::String& text, bool linewise, StoreKind kind)
{
    const juce::ScopedLock sl (lock);

    Entry entry { text, linewise };
    unnamed = entry;

    switch (kind)
    {
        case Yank:
            numbered[0] = entry;
            break;

        case Delete:
            rotateDeleteHistory();
            numbered[1] = entry;
            break;

        case SmallDelete:
            break;
    }
}

Registers::Entry Registers::get (char reg) const
{
    const juce::ScopedLock sl (lock);

    if (isNumberedRegister (reg))
        return numbered[reg - '0'];

    return unnamed;
}

bool Registers::isEmpty() const
{
    const juce::ScopedLock sl (lock);
    return unnamed.isEmpty();
}

void Registers::clear()
{
    const juce::ScopedLock sl (lock);

    unnamed = {};

    for (auto& e : numbered)
        e = {};
}

void Registers::rotateDeleteHistory()
{
    // Shift "1→"2→...→"9 (oldest in "9 is dropped)
    for (int i = 9; i > 1; --i)
        numbered[i] = std::move (numbered[i - 1]);

    numbered[1] = {};
}

} // namespace ll
