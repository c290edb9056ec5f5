#pragma once

#include "backup/backup_types.hpp"
#include <cstdint>
#include <string>
#include <vector>

using ExtractionHandle = uint64_t;

struct ExtractionStatus {
    enum class Kind {
        Running,
        Done,
        Failed
    };

    Kind kind{Kind::Running};
    uint64_t bytesSoFar{0};
    std::vector<UnitDescriptor> manifest;   // Ordered, set when Done
    std::string reason;                     // Set when Failed
    bool cancelled{false};

    static ExtractionStatus running(uint64_t bytes) {
        ExtractionStatus status;
        status.kind = Kind::Running;
        status.bytesSoFar = bytes;
        return status;
    }

    static ExtractionStatus done(std::vector<UnitDescriptor> manifest, uint64_t bytes) {
        ExtractionStatus status;
        status.kind = Kind::Done;
        status.manifest = std::move(manifest);
        status.bytesSoFar = bytes;
        return status;
    }

    static ExtractionStatus failed(const std::string& reason, bool cancelled = false) {
        ExtractionStatus status;
        status.kind = Kind::Failed;
        status.reason = reason;
        status.cancelled = cancelled;
        return status;
    }
};

// Polled wrapper around a ripping tool. Implementations never retry; the
// job decides whether a failed extraction is attempted again.
class Extractor {
public:
    virtual ~Extractor() = default;

    virtual std::string name() const = 0;

    // Throws BackupError(DeviceError) if the source is absent or unreadable
    virtual ExtractionHandle begin(const Source& source, const std::string& destination) = 0;

    // Non-blocking
    virtual ExtractionStatus poll(ExtractionHandle handle) = 0;

    // Best effort; later polls report Failed with cancelled set
    virtual void cancel(ExtractionHandle handle) = 0;
};
