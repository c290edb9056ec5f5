#pragma once

#include "backup/backup_types.hpp"
#include "common/backup_status.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class Verdict {
    Verified,
    Degraded,
    Failed
};

std::string verdictToString(Verdict verdict);
Verdict parseVerdict(const std::string& text);

// Exit status the command line reports for a verdict
int verdictExitCode(Verdict verdict);

struct UnitReport {
    size_t index{0};
    std::string fileName;
    UnitStatus status{UnitStatus::Unverified};
};

struct BlockReport {
    size_t index{0};
    bool trusted{false};
};

// Outcome of one job attempt. Built only from the job's recorded state, so
// building it twice from the same terminal job yields the same report.
struct VerificationReport {
    std::string jobId;
    std::string parentJobId;
    std::string attemptedAt;
    Verdict verdict{Verdict::Failed};
    std::vector<UnitReport> units;
    std::vector<BlockReport> blocks;
    ErrorKind failureKind{ErrorKind::None};
    std::string failureDetail;
    std::vector<std::string> findings;
};

// Failed if a unit is unrepairable, was never verified, or the job recorded
// a fatal error. Otherwise Degraded if anything was repaired or a block
// failed its self-check. Otherwise Verified.
Verdict decideVerdict(const std::vector<Unit>& units, const std::vector<bool>& blockTrusted,
                      ErrorKind failureKind);

VerificationReport buildReport(const std::string& jobId, const std::string& parentJobId,
                               const std::string& attemptedAt, const std::vector<Unit>& units,
                               const std::vector<bool>& blockTrusted, ErrorKind failureKind,
                               const std::string& failureDetail);

nlohmann::json reportToJson(const VerificationReport& report);
VerificationReport reportFromJson(const nlohmann::json& json);

// Multi-line summary for the terminal
std::string renderReport(const VerificationReport& report);
