#pragma once

#include "backup/threaded_extractor.hpp"
#include <chrono>
#include <string>
#include <vector>

// Runs an external ripping tool (ddrescue, cdparanoia, ...) in the
// extraction directory and cuts whatever it produces into units once it
// exits cleanly. An optional recovery pass (e.g. ddrescue --direct -M over
// the same map file) runs after the first pass and must exit cleanly too.
// Arguments may contain {device} and {dest} placeholders. Files ending in
// .log are treated as tool logs and not archived.
class ProcessExtractor : public ThreadedExtractor {
public:
    ProcessExtractor(uint64_t unitSize, std::vector<std::string> commandTemplate,
                     std::vector<std::string> recoveryPass = {},
                     std::chrono::milliseconds killGrace = std::chrono::seconds(10));
    ~ProcessExtractor() override;

    std::string name() const override { return "process"; }

    const std::vector<std::string>& getCommandTemplate() const { return commandTemplate_; }
    const std::vector<std::string>& getRecoveryPass() const { return recoveryPass_; }

    // Tool invocation used for a medium kind when none is configured
    static std::vector<std::string> defaultCommandFor(MediumKind kind);
    static std::vector<std::string> defaultRecoveryPassFor(MediumKind kind);

    static std::vector<std::string> expandCommand(const std::vector<std::string>& commandTemplate,
                                                  const Source& source, const std::string& destination);

protected:
    void checkSource(const Source& source) const override;
    ExtractionStatus run(Session& session) override;
    void onCancel(Session& session) override;

private:
    // Returns false with failure set when the tool could not run to a clean exit
    bool runPass(Session& session, const std::vector<std::string>& commandTemplate, bool appendLog,
                 ExtractionStatus& failure) const;

    static uint64_t directoryBytes(const std::string& path);

    std::vector<std::string> commandTemplate_;
    std::vector<std::string> recoveryPass_;
    std::chrono::milliseconds killGrace_;
};
