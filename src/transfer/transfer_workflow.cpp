#include "transfer/transfer_workflow.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <utility>

namespace adbpipe {

namespace {
constexpr const char* kDeviceMissingMessage = "ADB Device not connected or unauthorized";
constexpr const char* kCancelledMessage = "Transfer cancelled";
} // namespace

const char* ToString(TransferState state) {
    switch (state) {
        case TransferState::Idle:           return "idle";
        case TransferState::CheckingDevice: return "checking-device";
        case TransferState::Sizing:         return "sizing";
        case TransferState::Transferring:   return "transferring";
        case TransferState::Completed:      return "completed";
        case TransferState::Failed:         return "failed";
    }
    return "unknown";
}

TransferWorkflow::TransferWorkflow(TransferConfig config,
                                   std::shared_ptr<const IDeviceBridge> bridge,
                                   std::shared_ptr<const ILocalFileSystem> local_fs,
                                   IDispatcher& dispatcher,
                                   ITransferObserver& observer)
    : config_(std::move(config)),
      bridge_(std::move(bridge)),
      local_fs_(local_fs ? std::move(local_fs) : std::make_shared<PosixLocalFileSystem>()),
      dispatcher_(dispatcher),
      observer_(observer),
      builder_(config_),
      supervisor_(dispatcher, config_.max_diagnostic_lines),
      estimator_(config_.sampling_interval) {
    if (!bridge_)
        bridge_ = std::make_shared<AdbBridge>(config_.bridge_tool);
}

TransferWorkflow::~TransferWorkflow() {
    if (InFlight())
        Cancel();
    Wait();
}

bool TransferWorkflow::InFlight() const {
    const TransferState s = state_.load();
    return s == TransferState::CheckingDevice || s == TransferState::Sizing ||
           s == TransferState::Transferring;
}

Result TransferWorkflow::StartTransfer(TransferDirection direction, const std::string& local_path) {
    const std::string path(TrimWhitespace(local_path));
    if (path.empty())
        return Result::Fail(kErrValidation, "Please select a local path.");
    if (InFlight())
        return Result::Fail(kErrBusy, "A transfer is already in progress.");

    Wait();

    TransferAttempt attempt;
    attempt.id = next_attempt_id_++;
    attempt.direction = direction;
    attempt.local_path = path;

    cancel_.store(false);
    estimator_.Reset(0);
    state_.store(TransferState::Idle);

    LogInfo("Starting transfer #%llu. Mode=%s, Path=%s",
            static_cast<unsigned long long>(attempt.id),
            ToString(direction),
            path.c_str());

    SetState(TransferState::CheckingDevice);
    worker_ = std::thread(&TransferWorkflow::RunAttempt, this, std::move(attempt));
    return Result::Ok();
}

void TransferWorkflow::Cancel() {
    if (!InFlight())
        return;
    LogWarn("Cancel requested");
    cancel_.store(true);
    supervisor_.Cancel();
}

void TransferWorkflow::Wait() {
    if (worker_.joinable())
        worker_.join();
    supervisor_.Wait();
}

void TransferWorkflow::RunAttempt(TransferAttempt attempt) {
    if (FinishIfCancelled())
        return;

    if (!bridge_->DevicePresent()) {
        Finish(TransferOutcome::Failed(FailureKind::Connectivity, kDeviceMissingMessage));
        return;
    }

    SetState(TransferState::Sizing);
    if (FinishIfCancelled())
        return;
    if (!PrepareLocalSide(attempt))
        return;
    if (FinishIfCancelled())
        return;

    const std::uint64_t total = attempt.total_bytes;
    dispatcher_.Post([this, total] { estimator_.Reset(total); });

    const PipelineSpec spec = builder_.Build(attempt.direction, attempt.local_path, total);
    if (attempt.direction == TransferDirection::Pull) {
        LogInfo("Pulling %s from %s", config_.remote_target_dir.c_str(), config_.remote_base_dir.c_str());
    } else {
        LogInfo("Pushing files to %s", config_.device_staging_dir.c_str());
    }

    SetState(TransferState::Transferring);

    TransferSupervisor::Callbacks callbacks;
    callbacks.on_progress = [this](double fraction) { HandleProgress(fraction); };
    callbacks.on_complete = [this](const TransferOutcome& outcome) { HandleComplete(outcome); };

    auto r = supervisor_.Run(spec, std::move(callbacks));
    if (!r.is_ok()) {
        Finish(TransferOutcome::Failed(FailureKind::Launch, r.message()));
        return;
    }

    // A cancel that raced with the launch.
    if (cancel_.load())
        supervisor_.Cancel();
}

bool TransferWorkflow::PrepareLocalSide(TransferAttempt& attempt) {
    if (attempt.direction == TransferDirection::Pull) {
        attempt.total_bytes = bridge_->RemoteSize(config_.RemoteSourcePath());
        if (attempt.total_bytes == 0)
            LogWarn("Remote size returned 0. Progress will be indeterminate.");

        if (auto r = local_fs_->EnsureDir(attempt.local_path); !r.is_ok()) {
            Finish(TransferOutcome::Failed(FailureKind::Validation, r.message()));
            return false;
        }
        return true;
    }

    if (!local_fs_->Exists(attempt.local_path)) {
        Finish(TransferOutcome::Failed(FailureKind::Validation,
                                       "Local path does not exist: " + attempt.local_path));
        return false;
    }

    if (auto r = bridge_->EnsureRemoteDir(config_.device_staging_dir); !r.is_ok())
        LogWarn("Could not prepare %s: %s", config_.device_staging_dir.c_str(), r.message().c_str());

    attempt.total_bytes = local_fs_->LocalSize(attempt.local_path, cancel_);
    if (attempt.total_bytes == 0)
        LogWarn("Local size is 0. Progress will be indeterminate.");
    return true;
}

void TransferWorkflow::SetState(TransferState state) {
    state_.store(state);
    dispatcher_.Post([this, state] { observer_.OnStateChanged(state); });
}

bool TransferWorkflow::FinishIfCancelled() {
    if (!cancel_.load())
        return false;
    Finish(TransferOutcome::Failed(FailureKind::Cancelled, kCancelledMessage));
    return true;
}

void TransferWorkflow::Finish(TransferOutcome outcome) {
    dispatcher_.Post([this, outcome = std::move(outcome)] { HandleComplete(outcome); });
}

void TransferWorkflow::HandleProgress(double fraction) {
    TransferProgress progress;
    progress.fraction = fraction;
    progress.speed = estimator_.Update(fraction, RateEstimator::Clock::now());
    observer_.OnProgress(progress);
}

void TransferWorkflow::HandleComplete(const TransferOutcome& outcome) {
    const TransferState terminal = outcome.success ? TransferState::Completed : TransferState::Failed;
    state_.store(terminal);

    if (outcome.success) {
        LogInfo("Transfer finished successfully.");
    } else {
        LogError("Transfer failed (%s): %s", ToString(outcome.failure), outcome.diagnostic_text.c_str());
    }

    observer_.OnStateChanged(terminal);
    observer_.OnComplete(outcome);
}

} // namespace adbpipe
