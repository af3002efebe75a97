#include "transfer/progress_sinks.hpp"

#include "util/logger.hpp"

#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>

namespace adbpipe {

int PercentOf(double fraction) {
    if (!(fraction > 0.0))
        return 0;
    if (fraction >= 1.0)
        return 100;
    return static_cast<int>(fraction * 100.0);
}

FileProgressSink::FileProgressSink(std::string path) : path_(std::move(path)) {}

void FileProgressSink::OnStateChanged(TransferState state) {
    state_ = state;
    Write();
}

void FileProgressSink::OnProgress(const TransferProgress& progress) {
    percent_ = PercentOf(progress.fraction);
    if (progress.speed)
        speed_ = progress.speed->ToString();
    Write();
}

void FileProgressSink::OnComplete(const TransferOutcome& outcome) {
    finished_ = true;
    success_ = outcome.success;
    message_ = outcome.Summary();
    Write();
}

void FileProgressSink::Write() const {
    nlohmann::json j;
    j["state"] = ToString(state_);
    j["percent"] = percent_;
    j["speed"] = speed_;
    if (finished_) {
        j["success"] = success_;
        j["message"] = message_;
    }

    const std::string tmp_path = path_ + ".tmp";
    std::ofstream os(tmp_path, std::ios::trunc);
    if (!os.good()) {
        LogDebug("cannot write progress file %s", tmp_path.c_str());
        return;
    }
    os << j.dump();
    os.close();

    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        LogDebug("cannot replace progress file %s", path_.c_str());
    }
}

ConsoleProgressSink::ConsoleProgressSink(std::string label) : label_(std::move(label)) {}

void ConsoleProgressSink::OnStateChanged(TransferState state) {
    switch (state) {
        case TransferState::CheckingDevice:
            LogInfo("Initializing...");
            break;
        case TransferState::Transferring:
            speed_text_ = "Calculating...";
            LogInfo("Transferring...");
            break;
        default:
            break;
    }
}

void ConsoleProgressSink::OnProgress(const TransferProgress& progress) {
    if (progress.speed)
        speed_text_ = progress.speed->ToString();

    char line[128];
    std::snprintf(line,
                  sizeof(line),
                  "[%s] %3d%% | %-16s",
                  label_.c_str(),
                  PercentOf(progress.fraction),
                  speed_text_.c_str());
    Logger::Instance().WriteStatusLine(line);
}

void ConsoleProgressSink::OnComplete(const TransferOutcome&) {
    Logger::Instance().EndStatusLine();
}

void ObserverList::Add(ITransferObserver* observer) {
    if (observer)
        observers_.push_back(observer);
}

void ObserverList::OnStateChanged(TransferState state) {
    for (auto* o : observers_) o->OnStateChanged(state);
}

void ObserverList::OnProgress(const TransferProgress& progress) {
    for (auto* o : observers_) o->OnProgress(progress);
}

void ObserverList::OnComplete(const TransferOutcome& outcome) {
    for (auto* o : observers_) o->OnComplete(outcome);
}

} // namespace adbpipe
