#pragma once

#include "db/DatabaseClient.h"
#include <deque>
#include <vector>

namespace ll
{

struct Completion
{
    enum Kind { Query, Lookup, Schema };

    Kind kind = Query;
    RequestId id = 0;
    juce::String error;          // non-empty when the request failed

    QueryResult result;          // Query
    TargetLocation target;       // Lookup
    juce::StringArray tables;    // Schema

    bool failed() const { return error.isNotEmpty(); }
};

/** Completions posted by database workers, drained by the input thread
    between key events.
*/
class CompletionQueue
{
public:
    CompletionQueue() = default;

    void post (Completion completion);
    std::vector<Completion> drain();
    bool isEmpty() const;

private:
    mutable juce::CriticalSection lock;
    std::deque<Completion> pending;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (CompletionQueue)
};

} // namespace ll
