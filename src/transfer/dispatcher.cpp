#include "transfer/dispatcher.hpp"

#include <utility>

namespace adbpipe {

void DispatchQueue::Post(std::function<void()> task) {
    if (!task)
        return;
    {
        std::lock_guard<std::mutex> lk(mu_);
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

std::size_t DispatchQueue::RunPending() {
    std::deque<std::function<void()>> batch;
    {
        std::lock_guard<std::mutex> lk(mu_);
        batch.swap(tasks_);
    }
    for (auto& task : batch) {
        task();
    }
    return batch.size();
}

std::size_t DispatchQueue::RunFor(std::chrono::milliseconds timeout) {
    {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait_for(lk, timeout, [this] { return !tasks_.empty(); });
    }
    return RunPending();
}

std::size_t DispatchQueue::Size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return tasks_.size();
}

} // namespace adbpipe
