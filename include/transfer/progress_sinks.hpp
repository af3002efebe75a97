#pragma once

#include "transfer/transfer_workflow.hpp"

#include <string>
#include <vector>

namespace adbpipe {

// Writes a small JSON status document for external front-ends.
class FileProgressSink final : public ITransferObserver {
public:
    explicit FileProgressSink(std::string path);

    void OnStateChanged(TransferState state) override;
    void OnProgress(const TransferProgress& progress) override;
    void OnComplete(const TransferOutcome& outcome) override;

private:
    void Write() const;

    std::string path_;
    TransferState state_ = TransferState::Idle;
    int percent_ = 0;
    std::string speed_;
    bool finished_ = false;
    bool success_ = false;
    std::string message_;
};

// In-place "[pull]  42% | 3.4 MB/s" line on stderr.
class ConsoleProgressSink final : public ITransferObserver {
public:
    explicit ConsoleProgressSink(std::string label);

    void OnStateChanged(TransferState state) override;
    void OnProgress(const TransferProgress& progress) override;
    void OnComplete(const TransferOutcome& outcome) override;

    const std::string& SpeedText() const { return speed_text_; }

private:
    std::string label_;
    std::string speed_text_ = "Calculating...";
};

class ObserverList final : public ITransferObserver {
public:
    void Add(ITransferObserver* observer);

    void OnStateChanged(TransferState state) override;
    void OnProgress(const TransferProgress& progress) override;
    void OnComplete(const TransferOutcome& outcome) override;

private:
    std::vector<ITransferObserver*> observers_;
};

int PercentOf(double fraction);

} // namespace adbpipe
