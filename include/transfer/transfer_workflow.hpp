#pragma once

#include "device/device_bridge.hpp"
#include "device/local_filesystem.hpp"
#include "transfer/dispatcher.hpp"
#include "transfer/pipeline_builder.hpp"
#include "transfer/rate_estimator.hpp"
#include "transfer/transfer_outcome.hpp"
#include "transfer/transfer_supervisor.hpp"
#include "util/result.hpp"
#include "util/transfer_config.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace adbpipe {

enum class TransferState {
    Idle,
    CheckingDevice,
    Sizing,
    Transferring,
    Completed,
    Failed,
};

const char* ToString(TransferState state);

struct TransferProgress {
    double fraction = 0.0;
    // Absent when the estimator has nothing new; keep the previous value.
    std::optional<Throughput> speed;
};

// Receives everything on the interactive context (the dispatcher's thread).
class ITransferObserver {
  public:
    virtual ~ITransferObserver() = default;
    virtual void OnStateChanged(TransferState state) = 0;
    virtual void OnProgress(const TransferProgress& progress) = 0;
    virtual void OnComplete(const TransferOutcome& outcome) = 0;
};

// Per-attempt values; discarded once the outcome is delivered.
struct TransferAttempt {
    std::uint64_t id = 0;
    TransferDirection direction = TransferDirection::Pull;
    std::string local_path;
    std::uint64_t total_bytes = 0;
};

// Device check -> size discovery -> pipeline -> outcome, one attempt at a
// time. StartTransfer, Cancel and the destructor belong to the interactive
// context.
class TransferWorkflow {
  public:
    TransferWorkflow(TransferConfig config,
                     std::shared_ptr<const IDeviceBridge> bridge,
                     std::shared_ptr<const ILocalFileSystem> local_fs,
                     IDispatcher& dispatcher,
                     ITransferObserver& observer);
    TransferWorkflow(const TransferWorkflow&) = delete;
    TransferWorkflow& operator=(const TransferWorkflow&) = delete;
    ~TransferWorkflow();

    // Synchronous rejection (kErrValidation, kErrBusy) leaves the state
    // untouched; otherwise the attempt continues in the background.
    Result StartTransfer(TransferDirection direction, const std::string& local_path);

    void Cancel();

    TransferState State() const { return state_.load(); }
    bool InFlight() const;

    // Joins the background work of the last attempt. Tasks it posted may
    // still be queued on the dispatcher.
    void Wait();

  private:
    void RunAttempt(TransferAttempt attempt);
    bool PrepareLocalSide(TransferAttempt& attempt);
    void SetState(TransferState state);
    void Finish(TransferOutcome outcome);
    bool FinishIfCancelled();

    void HandleProgress(double fraction);
    void HandleComplete(const TransferOutcome& outcome);

    TransferConfig config_;
    std::shared_ptr<const IDeviceBridge> bridge_;
    std::shared_ptr<const ILocalFileSystem> local_fs_;
    IDispatcher& dispatcher_;
    ITransferObserver& observer_;
    PipelineBuilder builder_;
    TransferSupervisor supervisor_;

    // Touched only on the interactive context.
    RateEstimator estimator_;
    std::uint64_t next_attempt_id_ = 1;

    std::atomic<TransferState> state_{TransferState::Idle};
    std::atomic_bool cancel_{false};
    std::thread worker_;
};

} // namespace adbpipe
