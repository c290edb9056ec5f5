#pragma once

#include "backup/backup_types.hpp"
#include <memory>
#include <string>
#include <vector>

struct RepairResult {
    bool recovered{false};
    std::vector<UnitData> units;        // All units, gaps filled, when recovered
    std::vector<size_t> missingUnits;   // Units the codec could not rebuild
};

// Capability interface over an FEC codec. Implementations hold only
// immutable configuration, so one instance may serve several jobs.
class RedundancyEncoder {
public:
    virtual ~RedundancyEncoder() = default;

    virtual std::string name() const = 0;

    // Throws BackupError(EncodingError) for empty input or a ratio outside (0, 1)
    virtual std::vector<RedundancyBlock> encode(const std::vector<UnitData>& units,
                                                double redundancyRatio) const = 0;

    // Rebuild units whose present flag is false. Unrecoverable gaps are a
    // property of the codec, reported through RepairResult, never thrown.
    virtual RepairResult repair(const std::vector<UnitData>& unitsWithGaps,
                                const std::vector<RedundancyBlock>& blocks) const = 0;
};

// Resolve a codec by name; throws BackupError(InvalidConfiguration) if unknown
std::shared_ptr<RedundancyEncoder> createRedundancyEncoder(const std::string& codec);

// SHA-256 hex of the block bytes, used as the block's self-checksum
std::string computeBlockChecksum(const RedundancyBlock& block);
bool blockSelfCheck(const RedundancyBlock& block);
