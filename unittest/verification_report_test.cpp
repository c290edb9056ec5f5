#include <gtest/gtest.h>
#include "backup/verification_report.hpp"

class VerificationReportTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (size_t i = 0; i < 3; ++i) {
            Unit unit;
            unit.index = i;
            unit.fileName = "unit_" + std::to_string(i) + ".bin";
            unit.status = UnitStatus::Verified;
            units_.push_back(unit);
        }
        trusted_ = {true};
    }

    std::vector<Unit> units_;
    std::vector<bool> trusted_;
};

TEST_F(VerificationReportTest, AllVerifiedIsVerified) {
    EXPECT_EQ(decideVerdict(units_, trusted_, ErrorKind::None), Verdict::Verified);

    auto report = buildReport("job1", "", "2026-01-01T00:00:00.000Z", units_, trusted_, ErrorKind::None, "");
    EXPECT_EQ(report.verdict, Verdict::Verified);
    ASSERT_EQ(report.findings.size(), 1u);
    EXPECT_EQ(report.findings[0], "All 3 units match the checksum ledger");
}

TEST_F(VerificationReportTest, RepairedUnitDegrades) {
    units_[1].status = UnitStatus::Repaired;
    auto report = buildReport("job1", "", "t", units_, trusted_, ErrorKind::None, "");
    EXPECT_EQ(report.verdict, Verdict::Degraded);
    ASSERT_EQ(report.findings.size(), 1u);
    EXPECT_EQ(report.findings[0], "Unit 1 (unit_1.bin) was repaired from redundancy data");
}

TEST_F(VerificationReportTest, UntrustedBlockDegrades) {
    trusted_ = {true, false};
    EXPECT_EQ(decideVerdict(units_, trusted_, ErrorKind::None), Verdict::Degraded);
}

TEST_F(VerificationReportTest, FailureTakesPrecedence) {
    units_[0].status = UnitStatus::Repaired;
    units_[2].status = UnitStatus::Unrepairable;
    EXPECT_EQ(decideVerdict(units_, {false}, ErrorKind::None), Verdict::Failed);

    units_[2].status = UnitStatus::Verified;
    EXPECT_EQ(decideVerdict(units_, trusted_, ErrorKind::UserCancelled), Verdict::Failed);
}

TEST_F(VerificationReportTest, UnverifiedUnitFails) {
    units_[2].status = UnitStatus::Unverified;
    auto report = buildReport("job1", "", "t", units_, trusted_, ErrorKind::None, "");
    EXPECT_EQ(report.verdict, Verdict::Failed);
    EXPECT_EQ(report.findings.back(), "Unit 2 (unit_2.bin) was never verified");
}

TEST_F(VerificationReportTest, FailedJobWithoutUnits) {
    auto report = buildReport("job1", "", "t", {}, {}, ErrorKind::DeviceError, "No medium");
    EXPECT_EQ(report.verdict, Verdict::Failed);
    EXPECT_EQ(report.failureKind, ErrorKind::DeviceError);
    ASSERT_EQ(report.findings.size(), 1u);
    EXPECT_EQ(report.findings[0], "Job failed with DeviceError: No medium");
}

TEST_F(VerificationReportTest, BuildingTwiceIsDeterministic) {
    units_[0].status = UnitStatus::Repaired;
    auto first = buildReport("job1", "parent", "t", units_, trusted_, ErrorKind::None, "");
    auto second = buildReport("job1", "parent", "t", units_, trusted_, ErrorKind::None, "");
    EXPECT_EQ(reportToJson(first), reportToJson(second));
    EXPECT_EQ(renderReport(first), renderReport(second));
}

TEST_F(VerificationReportTest, JsonPreservesReport) {
    units_[1].status = UnitStatus::Repaired;
    auto report = buildReport("job1", "parent", "2026-01-01T00:00:00.000Z", units_, {true, false},
                              ErrorKind::None, "");
    auto parsed = reportFromJson(reportToJson(report));
    EXPECT_EQ(parsed.jobId, "job1");
    EXPECT_EQ(parsed.parentJobId, "parent");
    EXPECT_EQ(parsed.verdict, Verdict::Degraded);
    ASSERT_EQ(parsed.units.size(), 3u);
    EXPECT_EQ(parsed.units[1].status, UnitStatus::Repaired);
    ASSERT_EQ(parsed.blocks.size(), 2u);
    EXPECT_FALSE(parsed.blocks[1].trusted);
    EXPECT_EQ(parsed.findings, report.findings);
}

TEST_F(VerificationReportTest, ExitCodes) {
    EXPECT_EQ(verdictExitCode(Verdict::Verified), 0);
    EXPECT_EQ(verdictExitCode(Verdict::Degraded), 1);
    EXPECT_EQ(verdictExitCode(Verdict::Failed), 2);
}

TEST_F(VerificationReportTest, RenderMentionsVerdict) {
    auto report = buildReport("job1", "", "t", units_, trusted_, ErrorKind::None, "");
    std::string text = renderReport(report);
    EXPECT_NE(text.find("Verdict:   verified"), std::string::npos);
    EXPECT_NE(text.find("Units:     3 (0 repaired, 0 unrepairable)"), std::string::npos);
}
