#pragma once

#include "backup/extractor.hpp"
#include <atomic>
#include <chrono>
#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

// Extractor whose sessions each run on a worker thread. poll() only reads
// the session's shared state.
class ThreadedExtractor : public Extractor {
public:
    explicit ThreadedExtractor(uint64_t unitSize);
    ~ThreadedExtractor() override;

    ExtractionHandle begin(const Source& source, const std::string& destination) override;
    ExtractionStatus poll(ExtractionHandle handle) override;
    void cancel(ExtractionHandle handle) override;

    uint64_t getUnitSize() const { return unitSize_; }

protected:
    struct Session {
        Source source;
        std::string destination;
        std::atomic<uint64_t> bytes{0};
        std::atomic<bool> cancelRequested{false};
        std::atomic<int> childPid{-1};
        std::chrono::steady_clock::time_point cancelTime;
        std::mutex mutex;
        bool finished{false};
        ExtractionStatus result;
        std::thread worker;
    };

    // Throws BackupError(DeviceError) when the source cannot be read
    virtual void checkSource(const Source& source) const = 0;

    // Runs on the worker thread; returns Done or Failed
    virtual ExtractionStatus run(Session& session) = 0;

    virtual void onCancel(Session& session) { (void)session; }

    // Cancel and join every session. Derived destructors call this so no
    // worker is still inside run() once the derived part is gone.
    void shutdown();

    // Cut a stream into unit files named unit_NNNNN.bin under the session's
    // destination, appending descriptors to manifest
    bool writeUnits(std::istream& input, Session& session, std::vector<UnitDescriptor>& manifest,
                    uint64_t& offset, std::string& error) const;

    static std::string unitFileName(size_t index);

private:
    std::shared_ptr<Session> findSession(ExtractionHandle handle) const;

    uint64_t unitSize_;
    std::map<ExtractionHandle, std::shared_ptr<Session>> sessions_;
    ExtractionHandle nextHandle_{1};
    mutable std::mutex mutex_;
};
