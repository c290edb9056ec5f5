#pragma once

#include <cstdint>
#include <string>
#include <vector>

// On-disk layout of the staging root. Every job owns one subdirectory:
//
//   <root>/<jobId>/job.json          job record, replaced atomically
//   <root>/<jobId>/ledger.jsonl      append-only checksum ledger
//   <root>/<jobId>/extract.partial/  extractor output while running
//   <root>/<jobId>/units/            promoted extraction output
//   <root>/<jobId>/redundancy/       block_NNNNN.par
//   <root>/<jobId>/report.json       written once the job is terminal
//
// All failures throw BackupError(StorageIOError).
class StagingArea {
public:
    explicit StagingArea(std::string root);

    const std::string& getRoot() const { return root_; }

    std::string jobDir(const std::string& jobId) const;
    std::string jobRecordPath(const std::string& jobId) const;
    std::string ledgerPath(const std::string& jobId) const;
    std::string partialDir(const std::string& jobId) const;
    std::string unitsDir(const std::string& jobId) const;
    std::string redundancyDir(const std::string& jobId) const;
    std::string reportPath(const std::string& jobId) const;

    static std::string blockFileName(size_t index);

    void createJobDirectory(const std::string& jobId) const;
    bool jobExists(const std::string& jobId) const;

    // Ids of every directory under the root that holds a job record, sorted
    std::vector<std::string> listJobs() const;

    // Rename extract.partial to units. A units directory left by an
    // interrupted promotion is replaced.
    void promoteExtraction(const std::string& jobId) const;
    void clearPartial(const std::string& jobId) const;
    void clearUnits(const std::string& jobId) const;

    // Remove leftover *.tmp files anywhere under the job directory
    size_t cleanupTemporaries(const std::string& jobId) const;

    // Give a verify-only job its parent's artifacts. Units are hard-linked
    // where the filesystem allows it and copied otherwise; the ledger and
    // redundancy blocks are copied so the parent is never written through.
    void linkArtifacts(const std::string& parentJobId, const std::string& jobId) const;

    // Write to <path>.tmp, fsync, rename over path, then fsync the directory
    static void writeFileAtomic(const std::string& path, const std::string& contents);
    static void writeFileAtomic(const std::string& path, const std::vector<uint8_t>& contents);

    static std::vector<uint8_t> readFile(const std::string& path);
    static std::string readTextFile(const std::string& path);

    static constexpr const char* kTempSuffix = ".tmp";

private:
    static void writeAtomic(const std::string& path, const char* data, size_t size);
    static void syncDirectory(const std::string& dir);

    std::string root_;
};
