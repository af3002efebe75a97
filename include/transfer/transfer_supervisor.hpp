#pragma once

#include "transfer/dispatcher.hpp"
#include "transfer/pipeline_builder.hpp"
#include "transfer/transfer_outcome.hpp"
#include "util/result.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <sys/types.h>
#include <thread>

namespace adbpipe {

class Fd;

// Runs one pipeline at a time. The shell, its stages and the stream reader
// live off the caller's thread; every callback is posted to the dispatcher.
class TransferSupervisor {
  public:
    struct Callbacks {
        std::function<void(double fraction)> on_progress;
        std::function<void(const TransferOutcome&)> on_complete;
    };

    explicit TransferSupervisor(IDispatcher& dispatcher,
                                std::size_t max_diagnostic_lines = 1000);
    TransferSupervisor(const TransferSupervisor&) = delete;
    TransferSupervisor& operator=(const TransferSupervisor&) = delete;
    ~TransferSupervisor();

    // Fails with kErrLaunch when the pipeline cannot be started at all; in
    // that case on_complete is never called. Otherwise on_complete is posted
    // exactly once, after the last on_progress.
    Result Run(const PipelineSpec& spec, Callbacks callbacks);

    // Terminates the running pipeline's process group.
    void Cancel();

    // Joins the reader thread of the last run.
    void Wait();

    bool Running() const { return running_.load(); }

  private:
    void ReadLoop(Fd diag, pid_t pid, std::shared_ptr<const Callbacks> callbacks);

    IDispatcher& dispatcher_;
    std::size_t max_diagnostic_lines_;

    std::mutex mu_;
    std::thread reader_;
    std::atomic_bool running_{false};
    std::atomic_bool cancel_{false};
};

} // namespace adbpipe
