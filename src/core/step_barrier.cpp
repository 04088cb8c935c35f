#include "roadfleet/core/step_barrier.hpp"

namespace roadfleet::core {

StepBarrier::StepBarrier(std::size_t participants, Completion on_complete)
    : expected_(participants)
    , on_complete_(std::move(on_complete)) {
}

void StepBarrier::complete_phase() {
    // mutex_ is held by the caller
    try {
        if (on_complete_) {
            on_complete_();
        }
    } catch (...) {
        aborted_ = true;
        cv_.notify_all();
        throw;
    }

    arrived_ = 0;
    generation_++;
    cv_.notify_all();
}

bool StepBarrier::arrive_and_wait() {
    std::unique_lock lock(mutex_);
    if (aborted_) {
        return false;
    }

    const uint64_t phase = generation_;
    if (++arrived_ >= expected_) {
        complete_phase();
        return !aborted_;
    }

    cv_.wait(lock, [&] { return generation_ != phase || aborted_; });
    return generation_ != phase && !aborted_;
}

void StepBarrier::retire() {
    std::unique_lock lock(mutex_);
    if (aborted_ || expected_ == 0) {
        return;
    }

    expected_--;
    if (expected_ > 0 && arrived_ >= expected_) {
        complete_phase();
    }
}

void StepBarrier::abort() {
    {
        std::lock_guard lock(mutex_);
        aborted_ = true;
    }
    cv_.notify_all();
}

bool StepBarrier::aborted() const {
    std::lock_guard lock(mutex_);
    return aborted_;
}

std::size_t StepBarrier::participants() const {
    std::lock_guard lock(mutex_);
    return expected_;
}

uint64_t StepBarrier::generation() const {
    std::lock_guard lock(mutex_);
    return generation_;
}

} // namespace roadfleet::core
