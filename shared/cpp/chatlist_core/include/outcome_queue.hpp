#pragma once
#include "outcome.hpp"
#include <deque>
#include <mutex>
#include <condition_variable>

// Completion channel between provider workers and the dispatching thread.
class OutcomeQueue {
public:
    void push(DispatchOutcome outcome);
    DispatchOutcome pop();
    std::size_t size();

private:
    std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<DispatchOutcome> ready_;
};
