#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>

namespace adbpipe {

// Hands work to the interactive context. Tasks posted from one thread run
// in posting order.
class IDispatcher {
  public:
    virtual ~IDispatcher() = default;
    virtual void Post(std::function<void()> task) = 0;
};

// FIFO drained by the thread that owns the interactive loop.
class DispatchQueue final : public IDispatcher {
  public:
    void Post(std::function<void()> task) override;

    // Runs the tasks queued at the time of the call. Returns how many ran.
    std::size_t RunPending();

    // Waits up to timeout for work, then runs everything pending.
    std::size_t RunFor(std::chrono::milliseconds timeout);

    std::size_t Size() const;

  private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> tasks_;
};

} // namespace adbpipe
