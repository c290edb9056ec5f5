#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class HashAlgorithm {
    SHA256,
    SHA512,
    SHA1,
    MD5,
    BLAKE2B512
};

std::string hashAlgorithmToString(HashAlgorithm algorithm);
bool parseHashAlgorithm(const std::string& text, HashAlgorithm& algorithm);

struct LedgerEntry {
    size_t unitIndex{0};
    HashAlgorithm algorithm{HashAlgorithm::SHA256};
    std::vector<uint8_t> digest;
};

// Append-only record of unit digests. Each (unit, algorithm) pair is written
// once. When constructed with a path, every record() is appended to the
// ledger file as one JSON line and synced before returning.
class ChecksumLedger {
public:
    ChecksumLedger() = default;
    explicit ChecksumLedger(const std::string& ledgerPath);

    ChecksumLedger(const ChecksumLedger&) = delete;
    ChecksumLedger& operator=(const ChecksumLedger&) = delete;

    static std::vector<uint8_t> digestOf(const std::vector<uint8_t>& bytes, HashAlgorithm algorithm);
    static std::vector<uint8_t> digestOfFile(const std::string& path, HashAlgorithm algorithm);

    // Throws BackupError(DuplicateEntry) if the pair was already recorded
    void record(size_t unitIndex, HashAlgorithm algorithm, const std::vector<uint8_t>& digest);

    // Throws BackupError(NoEntry) if nothing was recorded for the pair
    bool verify(size_t unitIndex, HashAlgorithm algorithm, const std::vector<uint8_t>& digest) const;

    bool hasEntry(size_t unitIndex, HashAlgorithm algorithm) const;
    std::optional<LedgerEntry> entry(size_t unitIndex, HashAlgorithm algorithm) const;
    std::vector<LedgerEntry> entries() const;
    size_t size() const;

    // Rebuild from the ledger file. A torn final line is dropped.
    void load();

    const std::string& getPath() const { return path_; }

private:
    using Key = std::pair<size_t, HashAlgorithm>;

    void appendToFile(const LedgerEntry& entry);

    std::string path_;
    std::map<Key, LedgerEntry> entries_;
    mutable std::mutex mutex_;
};
