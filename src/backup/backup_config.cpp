#include "backup/backup_config.hpp"
#include "backup/media_probe.hpp"
#include "backup/redundancy_encoder.hpp"
#include "common/backup_status.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <fstream>

nlohmann::json backupConfigToJson(const BackupConfig& config) {
    return {
        {"name", config.name},
        {"source", config.sourcePath},
        {"kind", mediumKindToString(config.kind)},
        {"label", config.label},
        {"destination", config.stagingRoot},
        {"ratio", config.redundancyRatio},
        {"algorithm", hashAlgorithmToString(config.algorithm)},
        {"codec", config.codec},
        {"extractor", config.extractor},
        {"command", config.commandTemplate},
        {"recoveryPass", config.recoveryPass},
        {"eject", config.ejectWhenDone},
        {"unitSize", config.unitSize},
        {"maxExtractionAttempts", config.maxExtractionAttempts},
        {"retryBaseDelayMs", config.retryBaseDelay.count()},
        {"stallTimeoutMs", config.stallTimeout.count()},
        {"workerThreads", config.workerThreads}
    };
}

bool backupConfigFromJson(const nlohmann::json& json, BackupConfig& config, std::string& error) {
    if (!json.is_object()) {
        error = "Configuration must be a JSON object";
        return false;
    }

    try {
        config.name = json.value("name", config.name);
        config.sourcePath = json.value("source", config.sourcePath);
        config.label = json.value("label", config.label);
        config.stagingRoot = json.value("destination", config.stagingRoot);
        config.redundancyRatio = json.value("ratio", config.redundancyRatio);
        config.codec = json.value("codec", config.codec);
        config.extractor = json.value("extractor", config.extractor);
        config.unitSize = json.value("unitSize", config.unitSize);
        config.maxExtractionAttempts = json.value("maxExtractionAttempts", config.maxExtractionAttempts);
        config.workerThreads = json.value("workerThreads", config.workerThreads);
        config.ejectWhenDone = json.value("eject", config.ejectWhenDone);

        if (json.contains("kind")) {
            std::string kind = json.at("kind").get<std::string>();
            if (!parseMediumKind(kind, config.kind)) {
                error = "Unknown medium kind: " + kind;
                return false;
            }
        }
        if (json.contains("algorithm")) {
            std::string algorithm = json.at("algorithm").get<std::string>();
            if (!parseHashAlgorithm(algorithm, config.algorithm)) {
                error = "Unknown checksum algorithm: " + algorithm;
                return false;
            }
        }
        if (json.contains("command")) {
            config.commandTemplate = json.at("command").get<std::vector<std::string>>();
        }
        if (json.contains("recoveryPass")) {
            config.recoveryPass = json.at("recoveryPass").get<std::vector<std::string>>();
        }
        if (json.contains("retryBaseDelayMs")) {
            config.retryBaseDelay = std::chrono::milliseconds(json.at("retryBaseDelayMs").get<int64_t>());
        }
        if (json.contains("stallTimeoutMs")) {
            config.stallTimeout = std::chrono::milliseconds(json.at("stallTimeoutMs").get<int64_t>());
        }
    } catch (const nlohmann::json::exception& e) {
        error = std::string("Invalid configuration value: ") + e.what();
        return false;
    }
    return true;
}

bool loadBackupConfig(const std::string& path, BackupConfig& config, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "Failed to open config file: " + path;
        return false;
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        error = "Failed to parse config file " + path + ": " + e.what();
        return false;
    }

    if (!backupConfigFromJson(json, config, error)) {
        error = path + ": " + error;
        return false;
    }
    Logger::debug("Loaded configuration from " + path);
    return true;
}

bool validateBackupConfig(const BackupConfig& config, std::string& error) {
    if (config.sourcePath.empty()) {
        error = "Source path is required";
        return false;
    }
    if (config.stagingRoot.empty()) {
        error = "Destination directory is required";
        return false;
    }
    if (!config.name.empty() && !isPortableName(config.name)) {
        error = "Job name must be portable (letters, digits, '.', '_' or '-'): " + config.name;
        return false;
    }
    if (!(config.redundancyRatio > 0.0 && config.redundancyRatio < 1.0)) {
        error = "Redundancy ratio must be between 0 and 1 (exclusive)";
        return false;
    }
    if (config.unitSize == 0) {
        error = "Unit size must be greater than zero";
        return false;
    }
    if (config.maxExtractionAttempts < 1 || config.maxExtractionAttempts > kMaxExtractionAttempts) {
        error = "Extraction attempts must be between 1 and " + std::to_string(kMaxExtractionAttempts);
        return false;
    }
    if (config.retryBaseDelay.count() < 0 || config.retryBaseDelay > kMaxRetryDelay) {
        error = "Retry delay must be between 0 and " + std::to_string(kMaxRetryDelay.count()) + " ms";
        return false;
    }
    if (config.stallTimeout.count() <= 0 || config.stallTimeout > kMaxStallTimeout) {
        error = "Stall timeout must be greater than zero and at most " +
                std::to_string(kMaxStallTimeout.count()) + " ms";
        return false;
    }
    if (config.workerThreads == 0) {
        error = "At least one worker thread is required";
        return false;
    }
    if (config.extractor != "image" && config.extractor != "process") {
        error = "Unknown extractor: " + config.extractor;
        return false;
    }

    try {
        createRedundancyEncoder(config.codec);
    } catch (const BackupError& e) {
        error = e.what();
        return false;
    }
    return true;
}

std::chrono::milliseconds retryDelayFor(std::chrono::milliseconds base, int attempt) {
    if (base.count() <= 0) {
        return std::chrono::milliseconds(0);
    }
    std::chrono::milliseconds delay = std::min(base, kMaxRetryDelay);
    for (int i = 1; i < attempt && delay < kMaxRetryDelay; ++i) {
        delay *= 2;
    }
    return std::min(delay, kMaxRetryDelay);
}
