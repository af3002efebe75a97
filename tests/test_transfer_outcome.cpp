#include <gtest/gtest.h>

#include "transfer/transfer_outcome.hpp"

#include <string>

namespace adbpipe {
namespace {

TEST(TransferOutcomeTest, SuccessSummary) {
    const auto o = TransferOutcome::Succeeded();
    EXPECT_TRUE(o.success);
    EXPECT_EQ(o.exit_code, 0);
    EXPECT_EQ(o.failure, FailureKind::None);
    EXPECT_EQ(o.Summary(), "Transfer Complete!");
}

TEST(TransferOutcomeTest, ShortFailureIsShownAsIs) {
    const auto o = TransferOutcome::Failed(FailureKind::Connectivity,
                                           "ADB Device not connected or unauthorized");
    EXPECT_FALSE(o.success);
    EXPECT_EQ(o.Summary(), "ADB Device not connected or unauthorized");
}

TEST(TransferOutcomeTest, LongFirstLineIsTruncated) {
    const std::string text(60, 'x');
    const auto o = TransferOutcome::Failed(FailureKind::Execution, text, 2);
    EXPECT_EQ(o.exit_code, 2);
    EXPECT_EQ(o.Summary(), std::string(40, 'x') + "...");
    EXPECT_EQ(o.Summary(10), std::string(10, 'x') + "...");
}

TEST(TransferOutcomeTest, OnlyFirstLineIsUsed) {
    const auto o = TransferOutcome::Failed(FailureKind::Execution,
                                           "tar: short read\nsecond line\nthird line", 2);
    EXPECT_EQ(o.Summary(), "tar: short read...");
    EXPECT_EQ(o.diagnostic_text, "tar: short read\nsecond line\nthird line");
}

TEST(TransferOutcomeTest, EmptyDiagnosticsPointToLog) {
    EXPECT_EQ(TransferOutcome::Failed(FailureKind::Execution, "", 1).Summary(),
              "Check log for details.");
    EXPECT_EQ(TransferOutcome::Failed(FailureKind::Execution, "\nlater", 1).Summary(),
              "Check log for details.");
}

TEST(TransferOutcomeTest, FailureKindNames) {
    EXPECT_STREQ(ToString(FailureKind::Launch), "launch");
    EXPECT_STREQ(ToString(FailureKind::Cancelled), "cancelled");
}

} // namespace
} // namespace adbpipe
