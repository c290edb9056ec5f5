#include "backup/staging_area.hpp"
#include "common/backup_status.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

[[noreturn]] void throwStorage(const std::string& message) {
    throw BackupError(ErrorKind::StorageIOError, message);
}

std::string join(const std::string& dir, const std::string& name) {
    return (fs::path(dir) / name).string();
}

}

StagingArea::StagingArea(std::string root)
    : root_(std::move(root)) {
}

std::string StagingArea::jobDir(const std::string& jobId) const {
    return join(root_, jobId);
}

std::string StagingArea::jobRecordPath(const std::string& jobId) const {
    return join(jobDir(jobId), "job.json");
}

std::string StagingArea::ledgerPath(const std::string& jobId) const {
    return join(jobDir(jobId), "ledger.jsonl");
}

std::string StagingArea::partialDir(const std::string& jobId) const {
    return join(jobDir(jobId), "extract.partial");
}

std::string StagingArea::unitsDir(const std::string& jobId) const {
    return join(jobDir(jobId), "units");
}

std::string StagingArea::redundancyDir(const std::string& jobId) const {
    return join(jobDir(jobId), "redundancy");
}

std::string StagingArea::reportPath(const std::string& jobId) const {
    return join(jobDir(jobId), "report.json");
}

std::string StagingArea::blockFileName(size_t index) {
    char name[32];
    std::snprintf(name, sizeof(name), "block_%05zu.par", index);
    return name;
}

void StagingArea::createJobDirectory(const std::string& jobId) const {
    std::error_code ec;
    if (fs::exists(jobDir(jobId), ec)) {
        throwStorage("Job directory already exists: " + jobDir(jobId));
    }
    fs::create_directories(jobDir(jobId), ec);
    if (ec) {
        throwStorage("Failed to create job directory " + jobDir(jobId) + ": " + ec.message());
    }
    syncDirectory(root_);
}

bool StagingArea::jobExists(const std::string& jobId) const {
    std::error_code ec;
    return !jobId.empty() && fs::exists(jobRecordPath(jobId), ec);
}

std::vector<std::string> StagingArea::listJobs() const {
    std::vector<std::string> ids;
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return ids;
    }
    for (const auto& entry : fs::directory_iterator(root_, ec)) {
        std::error_code entryEc;
        if (entry.is_directory(entryEc) && fs::exists(entry.path() / "job.json", entryEc)) {
            ids.push_back(entry.path().filename().string());
        }
    }
    if (ec) {
        throwStorage("Failed to list staging root " + root_ + ": " + ec.message());
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

void StagingArea::promoteExtraction(const std::string& jobId) const {
    std::error_code ec;
    fs::remove_all(unitsDir(jobId), ec);
    if (ec) {
        throwStorage("Failed to remove stale units directory: " + ec.message());
    }
    fs::rename(partialDir(jobId), unitsDir(jobId), ec);
    if (ec) {
        throwStorage("Failed to promote " + partialDir(jobId) + ": " + ec.message());
    }
    syncDirectory(jobDir(jobId));
}

void StagingArea::clearPartial(const std::string& jobId) const {
    std::error_code ec;
    fs::remove_all(partialDir(jobId), ec);
    if (ec) {
        throwStorage("Failed to remove " + partialDir(jobId) + ": " + ec.message());
    }
}

void StagingArea::clearUnits(const std::string& jobId) const {
    std::error_code ec;
    fs::remove_all(unitsDir(jobId), ec);
    if (ec) {
        throwStorage("Failed to remove " + unitsDir(jobId) + ": " + ec.message());
    }
}

size_t StagingArea::cleanupTemporaries(const std::string& jobId) const {
    std::vector<fs::path> stale;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(jobDir(jobId), ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        const std::string name = it->path().filename().string();
        const std::string suffix = kTempSuffix;
        if (name.size() > suffix.size() &&
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
            stale.push_back(it->path());
        }
    }
    if (ec) {
        throwStorage("Failed to scan " + jobDir(jobId) + ": " + ec.message());
    }

    for (const auto& path : stale) {
        fs::remove(path, ec);
        if (ec) {
            throwStorage("Failed to remove " + path.string() + ": " + ec.message());
        }
        Logger::debug("Removed stale temporary file " + path.string());
    }
    return stale.size();
}

void StagingArea::linkArtifacts(const std::string& parentJobId, const std::string& jobId) const {
    std::error_code ec;
    fs::create_directories(unitsDir(jobId), ec);
    if (ec) {
        throwStorage("Failed to create " + unitsDir(jobId) + ": " + ec.message());
    }

    size_t copied = 0;
    for (const auto& entry : fs::directory_iterator(unitsDir(parentJobId), ec)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        fs::path target = fs::path(unitsDir(jobId)) / entry.path().filename();
        std::error_code linkEc;
        fs::create_hard_link(entry.path(), target, linkEc);
        if (linkEc) {
            fs::copy_file(entry.path(), target, fs::copy_options::overwrite_existing, ec);
            if (ec) {
                throwStorage("Failed to copy " + entry.path().string() + ": " + ec.message());
            }
            ++copied;
        }
    }
    if (ec) {
        throwStorage("Failed to read " + unitsDir(parentJobId) + ": " + ec.message());
    }
    if (copied > 0) {
        Logger::info("Hard links unavailable, copied " + std::to_string(copied) + " unit files");
    }

    if (fs::exists(redundancyDir(parentJobId), ec)) {
        fs::copy(redundancyDir(parentJobId), redundancyDir(jobId), fs::copy_options::recursive, ec);
        if (ec) {
            throwStorage("Failed to copy redundancy blocks: " + ec.message());
        }
    }
    if (fs::exists(ledgerPath(parentJobId), ec)) {
        fs::copy_file(ledgerPath(parentJobId), ledgerPath(jobId), fs::copy_options::overwrite_existing, ec);
        if (ec) {
            throwStorage("Failed to copy checksum ledger: " + ec.message());
        }
    }
    syncDirectory(jobDir(jobId));
}

void StagingArea::writeFileAtomic(const std::string& path, const std::string& contents) {
    writeAtomic(path, contents.data(), contents.size());
}

void StagingArea::writeFileAtomic(const std::string& path, const std::vector<uint8_t>& contents) {
    writeAtomic(path, reinterpret_cast<const char*>(contents.data()), contents.size());
}

void StagingArea::writeAtomic(const std::string& path, const char* data, size_t size) {
    const std::string tempPath = path + kTempSuffix;

    int fd = ::open(tempPath.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throwStorage("Failed to create " + tempPath + ": " + strerror(errno));
    }

    size_t written = 0;
    while (written < size) {
        ssize_t n = ::write(fd, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::string reason = strerror(errno);
            ::close(fd);
            ::unlink(tempPath.c_str());
            throwStorage("Failed to write " + tempPath + ": " + reason);
        }
        written += static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0) {
        std::string reason = strerror(errno);
        ::close(fd);
        ::unlink(tempPath.c_str());
        throwStorage("Failed to sync " + tempPath + ": " + reason);
    }
    ::close(fd);

    if (::rename(tempPath.c_str(), path.c_str()) != 0) {
        std::string reason = strerror(errno);
        ::unlink(tempPath.c_str());
        throwStorage("Failed to replace " + path + ": " + reason);
    }

    syncDirectory(fs::path(path).parent_path().string());
}

void StagingArea::syncDirectory(const std::string& dir) {
    int fd = ::open(dir.empty() ? "." : dir.c_str(), O_DIRECTORY | O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throwStorage("Failed to open directory " + dir + ": " + strerror(errno));
    }
    int rc = ::fsync(fd);
    ::close(fd);
    if (rc != 0) {
        throwStorage("Failed to sync directory " + dir + ": " + strerror(errno));
    }
}

std::vector<uint8_t> StagingArea::readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throwStorage("Failed to open " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throwStorage("Failed to read " + path);
    }
    return bytes;
}

std::string StagingArea::readTextFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throwStorage("Failed to open " + path);
    }
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throwStorage("Failed to read " + path);
    }
    return text;
}
