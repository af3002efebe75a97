#include "device/device_bridge.hpp"
#include "device/local_filesystem.hpp"
#include "system/signals.hpp"
#include "transfer/dispatcher.hpp"
#include "transfer/progress_sinks.hpp"
#include "transfer/transfer_workflow.hpp"
#include "util/logger.hpp"
#include "util/transfer_config.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <getopt.h>
#include <memory>
#include <optional>
#include <string>
#include <sys/stat.h>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitConfig = 3;
constexpr int kExitCancelled = 130;

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s -d <pull|push> -p <local-path> [-c <config>] [--progress-file <path>] [-v]\n"
        "\n"
        "Options:\n"
        "  -d, --direction        pull (device -> host) or push (host -> device)\n"
        "  -p, --path             Local folder (pull destination or push source)\n"
        "  -c, --config           JSON config file (default $ADBPIPE_CONFIG_PATH or %s)\n"
        "      --progress-file    Write JSON progress status to this file\n"
        "  -v, --verbose          Debug logging\n"
        "  -h, --help             Show this help\n",
        argv, adbpipe::kDefaultConfigPath);
}

bool FileExists(const std::string &path) {
    struct stat st {};
    return ::stat(path.c_str(), &st) == 0;
}

class CompletionWatcher final : public adbpipe::ITransferObserver {
public:
    void OnStateChanged(adbpipe::TransferState) override {}
    void OnProgress(const adbpipe::TransferProgress &) override {}
    void OnComplete(const adbpipe::TransferOutcome &outcome) override { outcome_ = outcome; }

    const std::optional<adbpipe::TransferOutcome> &Outcome() const { return outcome_; }

private:
    std::optional<adbpipe::TransferOutcome> outcome_;
};

} // namespace

int main(int argc, char **argv) {
    adbpipe::InstallSignalHandlers();

    const char *direction_arg = nullptr;
    std::string local_path;
    std::string config_path;
    bool config_explicit = false;
    std::string progress_file;
    bool verbose = false;

    enum { kOptProgressFile = 1000 };
    static option long_opts[] = {
        {"direction", required_argument, nullptr, 'd'},
        {"path", required_argument, nullptr, 'p'},
        {"config", required_argument, nullptr, 'c'},
        {"progress-file", required_argument, nullptr, kOptProgressFile},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hvd:p:c:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return kExitOk;

            case 'd':
                direction_arg = optarg;
                break;

            case 'p':
                local_path = optarg;
                break;

            case 'c':
                config_path = optarg;
                config_explicit = true;
                break;

            case kOptProgressFile:
                progress_file = optarg;
                break;

            case 'v':
                verbose = true;
                break;

            default:
                PrintUsage(argv[0]);
                return kExitUsage;
        }
    }

    adbpipe::TransferDirection direction{};
    if (!direction_arg || !adbpipe::ParseDirection(direction_arg, direction)) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    if (!config_explicit) {
        if (const char *env = std::getenv(adbpipe::kConfigPathEnv); env && *env) {
            config_path = env;
            config_explicit = true;
        } else {
            config_path = adbpipe::kDefaultConfigPath;
        }
    }

    adbpipe::TransferConfig cfg;
    if (config_explicit || FileExists(config_path)) {
        if (auto r = adbpipe::TransferConfig::LoadFromFile(config_path, cfg); !r.is_ok()) {
            std::fprintf(stderr, "ERROR: cannot load config: %s\n", r.message().c_str());
            return kExitConfig;
        }
    } else {
        std::fprintf(stderr, "WARN: no config at %s, using defaults\n", config_path.c_str());
    }

    adbpipe::Logger::Instance().SetLevel(verbose ? adbpipe::LogLevel::Debug : cfg.log_level);

    adbpipe::DispatchQueue queue;
    adbpipe::ConsoleProgressSink console(adbpipe::ToString(direction));
    std::unique_ptr<adbpipe::FileProgressSink> file_sink;
    CompletionWatcher watcher;

    adbpipe::ObserverList observers;
    observers.Add(&console);
    if (!progress_file.empty()) {
        file_sink = std::make_unique<adbpipe::FileProgressSink>(progress_file);
        observers.Add(file_sink.get());
    }
    observers.Add(&watcher);

    auto bridge = std::make_shared<adbpipe::AdbBridge>(cfg.bridge_tool);
    auto local_fs = std::make_shared<adbpipe::PosixLocalFileSystem>();
    adbpipe::TransferWorkflow workflow(cfg, bridge, local_fs, queue, observers);

    if (auto r = workflow.StartTransfer(direction, local_path); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.message().c_str());
        return kExitUsage;
    }

    bool cancel_sent = false;
    while (!watcher.Outcome()) {
        queue.RunFor(std::chrono::milliseconds(100));
        if (adbpipe::g_cancel.load() && !cancel_sent) {
            LogWarn("Received signal %d, cancelling transfer", adbpipe::g_cancel_signal.load());
            workflow.Cancel();
            cancel_sent = true;
        }
    }
    workflow.Wait();
    queue.RunPending();

    const auto &outcome = *watcher.Outcome();
    if (outcome.success) {
        std::fprintf(stderr, "%s\n", outcome.Summary().c_str());
        return kExitOk;
    }

    std::fprintf(stderr, "Error: %s\n", outcome.Summary().c_str());
    if (outcome.failure == adbpipe::FailureKind::Cancelled)
        return kExitCancelled;
    return kExitFailed;
}
