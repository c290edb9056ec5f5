#pragma once

#include "backup/extractor.hpp"
#include "backup/backup_job.hpp"
#include "common/backup_status.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>
#include <unistd.h>

// Scratch directory removed when the test ends
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("discvault_test_" + std::to_string(::getpid()) + "_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::string path() const { return path_.string(); }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

inline std::vector<uint8_t> patternBytes(size_t size, uint8_t seed) {
    std::vector<uint8_t> bytes(size);
    for (size_t i = 0; i < size; ++i) {
        bytes[i] = static_cast<uint8_t>(seed * 31 + i * 7);
    }
    return bytes;
}

inline void writeBytes(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

inline std::vector<uint8_t> readBytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// Manually advanced time source for BackupJob::setClock
class FakeClock {
public:
    FakeClock() : now_(JobClock::time_point(std::chrono::hours(24 * 365 * 50))) {}

    JobClock::time_point now() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(std::chrono::milliseconds step) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += step;
    }

    ClockFunction function() {
        return [this]() { return now(); };
    }

private:
    JobClock::time_point now_;
    mutable std::mutex mutex_;
};

// Scripted extractor. Each attempt reports runningPolls Running statuses
// with growing byte counts, then fails for the first failures attempts
// and succeeds afterwards by writing the configured units.
class FakeExtractor : public Extractor {
public:
    explicit FakeExtractor(std::vector<std::vector<uint8_t>> units)
        : units_(std::move(units)) {}

    std::string name() const override { return "fake"; }

    void setFailures(int failures) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_ = failures;
    }

    void setRunningPolls(int polls) {
        std::lock_guard<std::mutex> lock(mutex_);
        runningPolls_ = polls;
    }

    // Report Running forever without any new bytes
    void setHang(bool hang) {
        std::lock_guard<std::mutex> lock(mutex_);
        hang_ = hang;
    }

    void setDeviceMissing(bool missing) {
        std::lock_guard<std::mutex> lock(mutex_);
        deviceMissing_ = missing;
    }

    ExtractionHandle begin(const Source& source, const std::string& destination) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (deviceMissing_) {
            throw BackupError(ErrorKind::DeviceError, "No medium in " + source.path);
        }
        destination_ = destination;
        cancelled_ = false;
        pollsThisAttempt_ = 0;
        return static_cast<ExtractionHandle>(++beginCount_);
    }

    ExtractionStatus poll(ExtractionHandle handle) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++pollCount_;
        if (cancelled_) {
            return ExtractionStatus::failed("Cancelled", true);
        }
        if (hang_) {
            return ExtractionStatus::running(4096);
        }
        if (pollsThisAttempt_ < runningPolls_) {
            ++pollsThisAttempt_;
            return ExtractionStatus::running(static_cast<uint64_t>(pollsThisAttempt_) * 1000);
        }
        if (static_cast<int>(handle) <= failures_) {
            return ExtractionStatus::failed("Read error on sector 1234");
        }

        std::filesystem::create_directories(destination_);
        std::vector<UnitDescriptor> manifest;
        uint64_t offset = 0;
        for (size_t i = 0; i < units_.size(); ++i) {
            UnitDescriptor unit;
            unit.index = i;
            unit.fileName = "unit_" + std::to_string(i) + ".bin";
            unit.offset = offset;
            unit.size = units_[i].size();
            writeBytes((std::filesystem::path(destination_) / unit.fileName).string(), units_[i]);
            offset += unit.size;
            manifest.push_back(unit);
        }
        return ExtractionStatus::done(std::move(manifest), offset);
    }

    void cancel(ExtractionHandle) override {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        ++cancelCount_;
    }

    int beginCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return beginCount_;
    }

    int cancelCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelCount_;
    }

private:
    std::vector<std::vector<uint8_t>> units_;
    std::string destination_;
    int failures_{0};
    int runningPolls_{0};
    int pollsThisAttempt_{0};
    bool hang_{false};
    bool deviceMissing_{false};
    bool cancelled_{false};
    int beginCount_{0};
    int pollCount_{0};
    int cancelCount_{0};
    mutable std::mutex mutex_;
};
