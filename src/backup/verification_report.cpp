#include "backup/verification_report.hpp"
#include <sstream>

std::string verdictToString(Verdict verdict) {
    switch (verdict) {
        case Verdict::Verified: return "verified";
        case Verdict::Degraded: return "degraded";
        case Verdict::Failed:   return "failed";
        default:                return "unknown";
    }
}

Verdict parseVerdict(const std::string& text) {
    if (text == "verified") {
        return Verdict::Verified;
    } else if (text == "degraded") {
        return Verdict::Degraded;
    } else if (text == "failed") {
        return Verdict::Failed;
    }
    throw BackupError(ErrorKind::StorageIOError, "Unknown verdict in report: " + text);
}

int verdictExitCode(Verdict verdict) {
    switch (verdict) {
        case Verdict::Verified: return 0;
        case Verdict::Degraded: return 1;
        default:                return 2;
    }
}

Verdict decideVerdict(const std::vector<Unit>& units, const std::vector<bool>& blockTrusted,
                      ErrorKind failureKind) {
    if (failureKind != ErrorKind::None) {
        return Verdict::Failed;
    }

    bool degraded = false;
    for (const auto& unit : units) {
        switch (unit.status) {
            case UnitStatus::Verified:
                break;
            case UnitStatus::Repaired:
                degraded = true;
                break;
            default:
                // Unrepairable, or evidence that was never completed
                return Verdict::Failed;
        }
    }
    for (bool trusted : blockTrusted) {
        if (!trusted) {
            degraded = true;
        }
    }
    return degraded ? Verdict::Degraded : Verdict::Verified;
}

VerificationReport buildReport(const std::string& jobId, const std::string& parentJobId,
                               const std::string& attemptedAt, const std::vector<Unit>& units,
                               const std::vector<bool>& blockTrusted, ErrorKind failureKind,
                               const std::string& failureDetail) {
    VerificationReport report;
    report.jobId = jobId;
    report.parentJobId = parentJobId;
    report.attemptedAt = attemptedAt;
    report.failureKind = failureKind;
    report.failureDetail = failureDetail;
    report.verdict = decideVerdict(units, blockTrusted, failureKind);

    if (failureKind != ErrorKind::None) {
        report.findings.push_back("Job failed with " + errorKindToString(failureKind) +
                                  (failureDetail.empty() ? std::string() : ": " + failureDetail));
    }

    size_t verified = 0;
    for (const auto& unit : units) {
        report.units.push_back(UnitReport{unit.index, unit.fileName, unit.status});
        switch (unit.status) {
            case UnitStatus::Verified:
                ++verified;
                break;
            case UnitStatus::Repaired:
                report.findings.push_back("Unit " + std::to_string(unit.index) + " (" + unit.fileName +
                                          ") was repaired from redundancy data");
                break;
            case UnitStatus::Unrepairable:
                report.findings.push_back("Unit " + std::to_string(unit.index) + " (" + unit.fileName +
                                          ") is damaged and could not be repaired");
                break;
            case UnitStatus::Mismatched:
                report.findings.push_back("Unit " + std::to_string(unit.index) + " (" + unit.fileName +
                                          ") does not match its recorded checksum");
                break;
            case UnitStatus::Unverified:
                if (failureKind == ErrorKind::None) {
                    report.findings.push_back("Unit " + std::to_string(unit.index) + " (" + unit.fileName +
                                              ") was never verified");
                }
                break;
        }
    }

    for (size_t i = 0; i < blockTrusted.size(); ++i) {
        report.blocks.push_back(BlockReport{i, blockTrusted[i]});
        if (!blockTrusted[i]) {
            report.findings.push_back("Redundancy block " + std::to_string(i) + " failed its self-check");
        }
    }

    if (report.verdict == Verdict::Verified) {
        report.findings.push_back("All " + std::to_string(verified) + " units match the checksum ledger");
    }
    return report;
}

nlohmann::json reportToJson(const VerificationReport& report) {
    nlohmann::json units = nlohmann::json::array();
    for (const auto& unit : report.units) {
        units.push_back({
            {"index", unit.index},
            {"file", unit.fileName},
            {"status", unitStatusToString(unit.status)}
        });
    }

    nlohmann::json blocks = nlohmann::json::array();
    for (const auto& block : report.blocks) {
        blocks.push_back({{"index", block.index}, {"trusted", block.trusted}});
    }

    nlohmann::json json = {
        {"jobId", report.jobId},
        {"attemptedAt", report.attemptedAt},
        {"verdict", verdictToString(report.verdict)},
        {"units", units},
        {"blocks", blocks},
        {"failureKind", errorKindToString(report.failureKind)},
        {"failureDetail", report.failureDetail},
        {"findings", report.findings}
    };
    if (!report.parentJobId.empty()) {
        json["parentJobId"] = report.parentJobId;
    }
    return json;
}

VerificationReport reportFromJson(const nlohmann::json& json) {
    VerificationReport report;
    try {
        report.jobId = json.at("jobId").get<std::string>();
        report.parentJobId = json.value("parentJobId", std::string());
        report.attemptedAt = json.at("attemptedAt").get<std::string>();
        report.verdict = parseVerdict(json.at("verdict").get<std::string>());
        for (const auto& unit : json.at("units")) {
            report.units.push_back(UnitReport{
                unit.at("index").get<size_t>(),
                unit.at("file").get<std::string>(),
                parseUnitStatus(unit.at("status").get<std::string>())
            });
        }
        for (const auto& block : json.at("blocks")) {
            report.blocks.push_back(BlockReport{block.at("index").get<size_t>(), block.at("trusted").get<bool>()});
        }
        report.failureKind = parseErrorKind(json.at("failureKind").get<std::string>());
        report.failureDetail = json.value("failureDetail", std::string());
        report.findings = json.at("findings").get<std::vector<std::string>>();
    } catch (const nlohmann::json::exception& e) {
        throw BackupError(ErrorKind::StorageIOError, std::string("Malformed report: ") + e.what());
    }
    return report;
}

std::string renderReport(const VerificationReport& report) {
    size_t repaired = 0;
    size_t unrepairable = 0;
    for (const auto& unit : report.units) {
        if (unit.status == UnitStatus::Repaired) {
            ++repaired;
        } else if (unit.status == UnitStatus::Unrepairable) {
            ++unrepairable;
        }
    }
    size_t untrusted = 0;
    for (const auto& block : report.blocks) {
        if (!block.trusted) {
            ++untrusted;
        }
    }

    std::ostringstream out;
    out << "Job:       " << report.jobId << "\n";
    if (!report.parentJobId.empty()) {
        out << "Parent:    " << report.parentJobId << "\n";
    }
    out << "Attempted: " << report.attemptedAt << "\n";
    out << "Verdict:   " << verdictToString(report.verdict) << "\n";
    out << "Units:     " << report.units.size() << " (" << repaired << " repaired, "
        << unrepairable << " unrepairable)\n";
    out << "Blocks:    " << report.blocks.size() << " (" << untrusted << " untrusted)\n";
    if (!report.findings.empty()) {
        out << "Findings:\n";
        for (const auto& finding : report.findings) {
            out << "  - " << finding << "\n";
        }
    }
    return out.str();
}
