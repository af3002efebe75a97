#include "transfer/transfer_supervisor.hpp"

#include "io/fd.hpp"
#include "io/line_reader.hpp"
#include "io/process.hpp"
#include "transfer/progress_stream_parser.hpp"
#include "util/logger.hpp"

#include <csignal>
#include <string>
#include <utility>
#include <vector>

namespace adbpipe {

namespace {
constexpr const char* kShell = "/bin/sh";
constexpr int kPollIntervalMs = 100;
} // namespace

TransferSupervisor::TransferSupervisor(IDispatcher& dispatcher, std::size_t max_diagnostic_lines)
    : dispatcher_(dispatcher), max_diagnostic_lines_(max_diagnostic_lines) {}

TransferSupervisor::~TransferSupervisor() {
    if (running_.load())
        Cancel();
    Wait();
}

Result TransferSupervisor::Run(const PipelineSpec& spec, Callbacks callbacks) {
    std::lock_guard<std::mutex> lk(mu_);
    if (running_.load())
        return Result::Fail(kErrBusy, "a transfer is already running");
    if (reader_.joinable())
        reader_.join();

    for (const auto& tool : spec.required_tools) {
        if (!IsExecutableOnPath(tool)) {
            LogError("Required tool not found: %s", tool.c_str());
            return Result::Fail(kErrLaunch, "required tool not found: " + tool);
        }
    }

    Fd diag_read;
    Fd diag_write;
    if (auto r = Fd::Pipe(diag_read, diag_write); !r.is_ok())
        return Result::Fail(kErrLaunch, r.message());

    // stdout of the last stage joins stderr so bridge errors are not lost.
    SpawnIo io;
    io.stdout_fd = diag_write.Get();
    io.stderr_fd = diag_write.Get();
    io.new_process_group = true;

    LogInfo("Executing Command: %s", spec.command.c_str());

    pid_t pid = -1;
    if (auto r = SpawnProcess({kShell, "-c", spec.command}, io, pid); !r.is_ok()) {
        LogError("Pipeline launch failed: %s", r.message().c_str());
        return r;
    }
    diag_write.Close();

    cancel_.store(false);
    running_.store(true);

    auto shared = std::make_shared<const Callbacks>(std::move(callbacks));
    reader_ = std::thread(&TransferSupervisor::ReadLoop, this, std::move(diag_read), pid, std::move(shared));
    return Result::Ok();
}

void TransferSupervisor::Cancel() {
    cancel_.store(true);
}

void TransferSupervisor::Wait() {
    std::lock_guard<std::mutex> lk(mu_);
    if (reader_.joinable())
        reader_.join();
}

void TransferSupervisor::ReadLoop(Fd diag, pid_t pid, std::shared_ptr<const Callbacks> callbacks) {
    ProgressStreamParser parser(
        [this, callbacks](double fraction) {
            dispatcher_.Post([callbacks, fraction] {
                if (callbacks->on_progress)
                    callbacks->on_progress(fraction);
            });
        },
        max_diagnostic_lines_);

    LineReader reader(diag.Get());
    const auto end = parser.Consume(reader, cancel_, kPollIntervalMs);

    if (end == ProgressStreamParser::StreamEnd::Cancelled) {
        LogWarn("Cancelling pipeline (pgid %d)", static_cast<int>(pid));
        (void)::kill(-pid, SIGTERM);
    } else if (end == ProgressStreamParser::StreamEnd::ReadError) {
        LogWarn("Output lost, terminating pipeline (pgid %d)", static_cast<int>(pid));
        (void)::kill(-pid, SIGTERM);
    }
    diag.Close();

    const int rc = WaitForExit(pid);

    TransferOutcome outcome;
    if (end == ProgressStreamParser::StreamEnd::Cancelled) {
        std::string text = "Transfer cancelled";
        const std::string diagnostics = parser.DiagnosticText();
        if (!diagnostics.empty())
            text += "\n" + diagnostics;
        outcome = TransferOutcome::Failed(FailureKind::Cancelled, std::move(text), rc);
    } else if (end == ProgressStreamParser::StreamEnd::ReadError) {
        std::string text = "Lost pipeline output";
        const std::string diagnostics = parser.DiagnosticText();
        if (!diagnostics.empty())
            text += "\n" + diagnostics;
        outcome = TransferOutcome::Failed(FailureKind::Execution, std::move(text), rc);
    } else if (rc == 0) {
        outcome = TransferOutcome::Succeeded();
    } else {
        outcome = TransferOutcome::Failed(FailureKind::Execution, parser.DiagnosticText(), rc);
    }

    if (outcome.success) {
        LogInfo("Pipeline finished (%zu progress samples)", parser.ProgressSamples());
    } else {
        LogError("Process finished with error code %d", rc);
        LogError("Error Output: %s", outcome.diagnostic_text.c_str());
    }

    // Clear running_ before completion is visible so the completion
    // handler may start the next run.
    running_.store(false);
    dispatcher_.Post([callbacks, outcome = std::move(outcome)] {
        if (callbacks->on_complete)
            callbacks->on_complete(outcome);
    });
}

} // namespace adbpipe
