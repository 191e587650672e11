#include "CompletionQueue.h"
#include <iterator>

namespace ll
{

void CompletionQueue::post (Completion completion)
{
    const juce::ScopedLock sl (lock);
    pending.push_back (std::move (completion));
}

std::vector<Completion> CompletionQueue::drain()
{
    std::deque<Completion> taken;

    {
        const juce::ScopedLock sl (lock);
        taken.swap (pending);
    }

    return { std::make_move_iterator (taken.begin()), std::make_move_iterator (taken.end()) };
}

bool CompletionQueue::isEmpty() const
{
    const juce::ScopedLock sl (lock);
    return pending.empty();
}

} // namespace ll
