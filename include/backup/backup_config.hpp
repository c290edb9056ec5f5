#pragma once

#include "backup/backup_types.hpp"
#include "backup/checksum_ledger.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Limits enforced by validateBackupConfig
constexpr int kMaxExtractionAttempts = 32;
constexpr std::chrono::milliseconds kMaxRetryDelay = std::chrono::hours(1);
constexpr std::chrono::milliseconds kMaxStallTimeout = std::chrono::hours(24);

// Configuration for one backup job. Resolved once when the job is created
// and persisted with it, so a resumed job runs with the same settings.
struct BackupConfig {
    std::string name;               // Optional human-readable job name
    std::string sourcePath;         // Device node or dump path
    MediumKind kind{MediumKind::OpticalData};
    std::string label;              // Volume label, probed if empty
    std::string stagingRoot;        // Directory holding one subdirectory per job
    double redundancyRatio{0.25};
    HashAlgorithm algorithm{HashAlgorithm::SHA256};
    std::string codec{"xor"};
    std::string extractor{"image"}; // "image" or "process"
    std::vector<std::string> commandTemplate;   // For the process extractor
    std::vector<std::string> recoveryPass;      // Run after commandTemplate succeeds
    bool ejectWhenDone{true};       // Eject a device source once the job ends
    uint64_t unitSize{1024 * 1024};
    int maxExtractionAttempts{3};
    std::chrono::milliseconds retryBaseDelay{2000};
    std::chrono::milliseconds stallTimeout{300000};
    size_t workerThreads{4};
};

// Merge settings from a JSON config file into config. Keys absent from the
// file leave the current value untouched.
bool loadBackupConfig(const std::string& path, BackupConfig& config, std::string& error);

bool validateBackupConfig(const BackupConfig& config, std::string& error);

// Delay before extraction attempt + 1: base * 2^(attempt-1), saturating at
// kMaxRetryDelay
std::chrono::milliseconds retryDelayFor(std::chrono::milliseconds base, int attempt);

nlohmann::json backupConfigToJson(const BackupConfig& config);
bool backupConfigFromJson(const nlohmann::json& json, BackupConfig& config, std::string& error);
