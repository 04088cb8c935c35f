#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>

namespace roadfleet::core {

// Reusable rendezvous for a shrinking set of participants.
//
// The last participant to arrive runs the completion on its own thread while
// every other participant is still blocked, then releases them into the next
// phase. A participant that stops for good calls retire() so the rest never
// wait for it. abort() releases every waiter and makes later waits fail.
class StepBarrier {
public:
    using Completion = std::function<void()>;

    StepBarrier(std::size_t participants, Completion on_complete);

    StepBarrier(const StepBarrier&) = delete;
    StepBarrier& operator=(const StepBarrier&) = delete;

    // Returns false when the barrier was aborted before or during the wait.
    // Rethrows an exception escaping the completion, after aborting.
    bool arrive_and_wait();

    void retire();
    void abort();

    bool aborted() const;
    std::size_t participants() const;
    uint64_t generation() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t expected_;
    std::size_t arrived_ = 0;
    uint64_t generation_ = 0;
    bool aborted_ = false;
    Completion on_complete_;

    void complete_phase();
};

} // namespace roadfleet::core
