#include <gtest/gtest.h>

#include "testing.hpp"
#include "transfer/progress_sinks.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <thread>

namespace adbpipe {
namespace {

TEST(ProgressSinksTest, PercentOfClampsFraction) {
    EXPECT_EQ(PercentOf(0.0), 0);
    EXPECT_EQ(PercentOf(-0.5), 0);
    EXPECT_EQ(PercentOf(0.426), 42);
    EXPECT_EQ(PercentOf(0.999), 99);
    EXPECT_EQ(PercentOf(1.0), 100);
    EXPECT_EQ(PercentOf(1.7), 100);
}

TEST(ProgressSinksTest, FileSinkWritesStatusDocument) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Path() + "/progress.json";
    FileProgressSink sink(path);

    sink.OnStateChanged(TransferState::Transferring);
    sink.OnProgress({.fraction = 0.5, .speed = Throughput{.bytes_per_sec = 2.5 * 1024 * 1024}});

    auto j = nlohmann::json::parse(testutil::ReadFile(path));
    EXPECT_EQ(j["state"], "transferring");
    EXPECT_EQ(j["percent"], 50);
    EXPECT_EQ(j["speed"], "2.5 MB/s");
    EXPECT_FALSE(j.contains("success"));

    // A sample without a speed keeps the last reading.
    sink.OnProgress({.fraction = 0.75, .speed = std::nullopt});
    j = nlohmann::json::parse(testutil::ReadFile(path));
    EXPECT_EQ(j["percent"], 75);
    EXPECT_EQ(j["speed"], "2.5 MB/s");

    sink.OnStateChanged(TransferState::Failed);
    sink.OnComplete(TransferOutcome::Failed(FailureKind::Execution, "tar: broken pipe\nmore", 2));
    j = nlohmann::json::parse(testutil::ReadFile(path));
    EXPECT_EQ(j["state"], "failed");
    EXPECT_EQ(j["success"], false);
    EXPECT_EQ(j["message"], "tar: broken pipe...");
}

TEST(ProgressSinksTest, ConsoleSinkKeepsLastSpeed) {
    ConsoleProgressSink sink("push");
    EXPECT_EQ(sink.SpeedText(), "Calculating...");

    sink.OnProgress({.fraction = 0.1, .speed = Throughput{.bytes_per_sec = 512}});
    EXPECT_EQ(sink.SpeedText(), "512 B/s");
    EXPECT_TRUE(Logger::Instance().StatusLineActive());

    sink.OnProgress({.fraction = 0.2, .speed = std::nullopt});
    EXPECT_EQ(sink.SpeedText(), "512 B/s");

    sink.OnComplete(TransferOutcome::Succeeded());
    EXPECT_FALSE(Logger::Instance().StatusLineActive());
}

TEST(ProgressSinksTest, LogRecordsNeverShareTheProgressLine) {
    ConsoleProgressSink sink("pull");

    ::testing::internal::CaptureStderr();
    std::thread reader([] {
        for (int i = 0; i < 200; ++i) {
            LogError("CMD STDERR: line %d", i);
        }
    });
    for (int i = 0; i < 200; ++i) {
        sink.OnProgress({.fraction = i / 200.0, .speed = std::nullopt});
    }
    reader.join();
    sink.OnComplete(TransferOutcome::Succeeded());
    const std::string out = ::testing::internal::GetCapturedStderr();

    std::istringstream lines(out);
    std::string line;
    int records = 0;
    while (std::getline(lines, line)) {
        const auto pos = line.find("CMD STDERR: line ");
        if (pos == std::string::npos)
            continue;
        ++records;
        EXPECT_EQ(line.find('\r'), std::string::npos) << line;
        EXPECT_EQ(line.front(), '[') << line;
        EXPECT_EQ(line.find("[pull]"), std::string::npos) << line;
    }
    EXPECT_EQ(records, 200);
    EXPECT_FALSE(Logger::Instance().StatusLineActive());
}

class CountingObserver final : public ITransferObserver {
  public:
    void OnStateChanged(TransferState) override { ++states; }
    void OnProgress(const TransferProgress&) override { ++progress; }
    void OnComplete(const TransferOutcome&) override { ++completions; }

    int states = 0;
    int progress = 0;
    int completions = 0;
};

TEST(ProgressSinksTest, ObserverListFansOut) {
    CountingObserver a;
    CountingObserver b;
    ObserverList list;
    list.Add(&a);
    list.Add(nullptr);
    list.Add(&b);

    list.OnStateChanged(TransferState::Sizing);
    list.OnProgress({.fraction = 0.3, .speed = std::nullopt});
    list.OnComplete(TransferOutcome::Succeeded());

    for (const auto* o : {&a, &b}) {
        EXPECT_EQ(o->states, 1);
        EXPECT_EQ(o->progress, 1);
        EXPECT_EQ(o->completions, 1);
    }
}

} // namespace
} // namespace adbpipe
