#include "backup/checksum_ledger.hpp"
#include "backup/backup_types.hpp"
#include "common/backup_status.hpp"
#include "common/logger.hpp"
#include <openssl/evp.h>
#include <nlohmann/json.hpp>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <fcntl.h>
#include <unistd.h>

using json = nlohmann::json;

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

const EVP_MD* messageDigestFor(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::SHA256:     return EVP_sha256();
        case HashAlgorithm::SHA512:     return EVP_sha512();
        case HashAlgorithm::SHA1:       return EVP_sha1();
        case HashAlgorithm::MD5:        return EVP_md5();
        case HashAlgorithm::BLAKE2B512: return EVP_blake2b512();
        default:                        return nullptr;
    }
}

DigestContext beginDigest(HashAlgorithm algorithm) {
    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw BackupError(ErrorKind::StorageIOError, "Failed to create OpenSSL digest context");
    }
    const EVP_MD* md = messageDigestFor(algorithm);
    if (!md || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
        throw BackupError(ErrorKind::InvalidConfiguration,
                          "Failed to initialize digest " + hashAlgorithmToString(algorithm));
    }
    return ctx;
}

std::vector<uint8_t> finishDigest(EVP_MD_CTX* ctx) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &hashLen) != 1) {
        throw BackupError(ErrorKind::StorageIOError, "Failed to finalize digest");
    }
    return std::vector<uint8_t>(hash, hash + hashLen);
}

LedgerEntry parseLine(const std::string& line) {
    json record = json::parse(line);
    LedgerEntry entry;
    entry.unitIndex = record.at("unit").get<size_t>();
    if (!parseHashAlgorithm(record.at("algorithm").get<std::string>(), entry.algorithm)) {
        throw BackupError(ErrorKind::StorageIOError, "Unknown algorithm in ledger line: " + line);
    }
    entry.digest = fromHex(record.at("digest").get<std::string>());
    return entry;
}

}

std::string hashAlgorithmToString(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::SHA256:     return "sha256";
        case HashAlgorithm::SHA512:     return "sha512";
        case HashAlgorithm::SHA1:       return "sha1";
        case HashAlgorithm::MD5:        return "md5";
        case HashAlgorithm::BLAKE2B512: return "blake2b512";
        default:                        return "unknown";
    }
}

bool parseHashAlgorithm(const std::string& text, HashAlgorithm& algorithm) {
    if (text == "sha256") {
        algorithm = HashAlgorithm::SHA256;
    } else if (text == "sha512") {
        algorithm = HashAlgorithm::SHA512;
    } else if (text == "sha1") {
        algorithm = HashAlgorithm::SHA1;
    } else if (text == "md5") {
        algorithm = HashAlgorithm::MD5;
    } else if (text == "blake2b512") {
        algorithm = HashAlgorithm::BLAKE2B512;
    } else {
        return false;
    }
    return true;
}

ChecksumLedger::ChecksumLedger(const std::string& ledgerPath)
    : path_(ledgerPath) {
}

std::vector<uint8_t> ChecksumLedger::digestOf(const std::vector<uint8_t>& bytes, HashAlgorithm algorithm) {
    DigestContext ctx = beginDigest(algorithm);
    if (!bytes.empty() && EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1) {
        throw BackupError(ErrorKind::StorageIOError, "Failed to update digest");
    }
    return finishDigest(ctx.get());
}

std::vector<uint8_t> ChecksumLedger::digestOfFile(const std::string& path, HashAlgorithm algorithm) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw BackupError(ErrorKind::StorageIOError, "Failed to open for hashing: " + path);
    }

    DigestContext ctx = beginDigest(algorithm);
    std::vector<char> buffer(1024 * 1024);
    while (file.good()) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (file.gcount() > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(file.gcount())) != 1) {
            throw BackupError(ErrorKind::StorageIOError, "Failed to update digest for " + path);
        }
    }
    if (file.bad()) {
        throw BackupError(ErrorKind::StorageIOError, "Read error while hashing " + path);
    }
    return finishDigest(ctx.get());
}

void ChecksumLedger::record(size_t unitIndex, HashAlgorithm algorithm, const std::vector<uint8_t>& digest) {
    std::lock_guard<std::mutex> lock(mutex_);

    Key key(unitIndex, algorithm);
    if (entries_.count(key) != 0) {
        throw BackupError(ErrorKind::DuplicateEntry,
                          "Ledger already holds a " + hashAlgorithmToString(algorithm) +
                          " digest for unit " + std::to_string(unitIndex));
    }

    LedgerEntry entry{unitIndex, algorithm, digest};
    if (!path_.empty()) {
        appendToFile(entry);
    }
    entries_.emplace(key, std::move(entry));
}

bool ChecksumLedger::verify(size_t unitIndex, HashAlgorithm algorithm, const std::vector<uint8_t>& digest) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(Key(unitIndex, algorithm));
    if (it == entries_.end()) {
        throw BackupError(ErrorKind::NoEntry,
                          "No " + hashAlgorithmToString(algorithm) +
                          " digest recorded for unit " + std::to_string(unitIndex));
    }
    return it->second.digest == digest;
}

bool ChecksumLedger::hasEntry(size_t unitIndex, HashAlgorithm algorithm) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(Key(unitIndex, algorithm)) != 0;
}

std::optional<LedgerEntry> ChecksumLedger::entry(size_t unitIndex, HashAlgorithm algorithm) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(Key(unitIndex, algorithm));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<LedgerEntry> ChecksumLedger::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<LedgerEntry> result;
    result.reserve(entries_.size());
    for (const auto& pair : entries_) {
        result.push_back(pair.second);
    }
    return result;
}

size_t ChecksumLedger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void ChecksumLedger::load() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (path_.empty()) {
        throw BackupError(ErrorKind::StorageIOError, "Ledger has no backing file");
    }

    entries_.clear();
    if (!std::filesystem::exists(path_)) {
        return;
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        throw BackupError(ErrorKind::StorageIOError, "Failed to open ledger: " + path_);
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    file.close();

    size_t pos = 0;
    size_t goodBytes = 0;
    size_t lineNumber = 0;
    while (pos < content.size()) {
        size_t newline = content.find('\n', pos);
        bool terminated = newline != std::string::npos;
        std::string line = content.substr(pos, terminated ? newline - pos : std::string::npos);
        ++lineNumber;

        LedgerEntry entry;
        try {
            entry = parseLine(line);
        } catch (const std::exception& e) {
            if (!terminated) {
                // Crash in the middle of an append; the unit gets re-hashed
                Logger::warning("Dropping torn ledger line " + std::to_string(lineNumber) + " in " + path_);
                break;
            }
            throw BackupError(ErrorKind::StorageIOError,
                              "Corrupt ledger line " + std::to_string(lineNumber) + " in " + path_ + ": " + e.what());
        }

        if (!terminated) {
            // Complete record but missing newline; keep it and repair the file below
            content.insert(content.end(), '\n');
            newline = content.size() - 1;
        }

        Key key(entry.unitIndex, entry.algorithm);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            if (it->second.digest != entry.digest) {
                throw BackupError(ErrorKind::StorageIOError,
                                  "Conflicting ledger entries for unit " + std::to_string(entry.unitIndex));
            }
        } else {
            entries_.emplace(key, std::move(entry));
        }

        pos = newline + 1;
        goodBytes = pos;
    }

    std::error_code ec;
    auto onDisk = std::filesystem::file_size(path_, ec);
    if (!ec && onDisk != goodBytes) {
        std::ofstream rewrite(path_, std::ios::binary | std::ios::trunc);
        rewrite.write(content.data(), static_cast<std::streamsize>(goodBytes));
        rewrite.flush();
        if (!rewrite) {
            throw BackupError(ErrorKind::StorageIOError, "Failed to repair ledger tail: " + path_);
        }
    }
}

void ChecksumLedger::appendToFile(const LedgerEntry& entry) {
    json record;
    record["unit"] = entry.unitIndex;
    record["algorithm"] = hashAlgorithmToString(entry.algorithm);
    record["digest"] = toHex(entry.digest);
    std::string line = record.dump() + "\n";

    int fd = ::open(path_.c_str(), O_CREAT | O_APPEND | O_WRONLY, 0644);
    if (fd < 0) {
        throw BackupError(ErrorKind::StorageIOError,
                          "Failed to open ledger " + path_ + ": " + strerror(errno));
    }
    size_t written = 0;
    while (written < line.size()) {
        ssize_t n = ::write(fd, line.data() + written, line.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            ::close(fd);
            throw BackupError(ErrorKind::StorageIOError,
                              "Failed to append to ledger " + path_ + ": " + strerror(err));
        }
        written += static_cast<size_t>(n);
    }
    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        throw BackupError(ErrorKind::StorageIOError, "Failed to sync ledger " + path_ + ": " + strerror(err));
    }
    ::close(fd);
}
