#include "../include/outcome_queue.hpp"
#include <utility>

void OutcomeQueue::push(DispatchOutcome outcome) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        ready_.push_back(std::move(outcome));
    }
    cv_.notify_one();
}

DispatchOutcome OutcomeQueue::pop() {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait(lock, [&]{ return !ready_.empty(); });
    DispatchOutcome o = std::move(ready_.front());
    ready_.pop_front();
    return o;
}

std::size_t OutcomeQueue::size() {
    std::lock_guard<std::mutex> lock(mtx_);
    return ready_.size();
}
