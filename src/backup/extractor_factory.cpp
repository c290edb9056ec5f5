#include "backup/extractor_factory.hpp"
#include "backup/image_extractor.hpp"
#include "backup/process_extractor.hpp"
#include "common/backup_status.hpp"
#include "common/logger.hpp"

std::shared_ptr<Extractor> createExtractor(const BackupConfig& config) {
    Logger::debug("Creating extractor of type: " + config.extractor);

    if (config.extractor == "image") {
        return std::make_shared<ImageExtractor>(config.unitSize);
    } else if (config.extractor == "process") {
        std::vector<std::string> command = config.commandTemplate;
        std::vector<std::string> recoveryPass = config.recoveryPass;
        if (command.empty()) {
            command = ProcessExtractor::defaultCommandFor(config.kind);
            if (recoveryPass.empty()) {
                recoveryPass = ProcessExtractor::defaultRecoveryPassFor(config.kind);
            }
            Logger::info("Using default " + mediumKindToString(config.kind) + " command: " + command.front());
        }
        return std::make_shared<ProcessExtractor>(config.unitSize, command, recoveryPass);
    } else {
        Logger::error("Unsupported extractor type: " + config.extractor);
        throw BackupError(ErrorKind::InvalidConfiguration, "Unsupported extractor type: " + config.extractor);
    }
}
