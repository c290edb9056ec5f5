#include "backup/xor_parity_encoder.hpp"
#include "common/backup_status.hpp"
#include <algorithm>
#include <cmath>
#include <map>

size_t XorParityEncoder::groupSizeFor(double redundancyRatio) {
    if (!(redundancyRatio > 0.0 && redundancyRatio < 1.0)) {
        throw BackupError(ErrorKind::EncodingError,
                          "Redundancy ratio must be in (0, 1), got " + std::to_string(redundancyRatio));
    }
    // Overhead of one parity block per group must stay within the ratio
    return static_cast<size_t>(std::ceil(1.0 / redundancyRatio - 1e-9));
}

std::vector<RedundancyBlock> XorParityEncoder::encode(const std::vector<UnitData>& units,
                                                      double redundancyRatio) const {
    if (units.empty()) {
        throw BackupError(ErrorKind::EncodingError, "Nothing to encode: unit list is empty");
    }
    size_t groupSize = groupSizeFor(redundancyRatio);

    std::vector<RedundancyBlock> blocks;
    for (size_t start = 0; start < units.size(); start += groupSize) {
        size_t end = std::min(start + groupSize, units.size());

        RedundancyBlock block;
        block.index = blocks.size();
        block.parameters.codec = name();
        block.parameters.groupSize = groupSize;

        uint64_t shardSize = 0;
        for (size_t i = start; i < end; ++i) {
            if (!units[i].present) {
                throw BackupError(ErrorKind::EncodingError,
                                  "Cannot encode missing unit " + std::to_string(units[i].index));
            }
            shardSize = std::max<uint64_t>(shardSize, units[i].bytes.size());
        }
        block.parameters.shardSize = shardSize;
        block.bytes.assign(shardSize, 0);

        for (size_t i = start; i < end; ++i) {
            const auto& data = units[i].bytes;
            for (size_t j = 0; j < data.size(); ++j) {
                block.bytes[j] ^= data[j];
            }
            block.unitIndices.push_back(units[i].index);
            block.unitSizes.push_back(data.size());
        }

        block.checksum = computeBlockChecksum(block);
        blocks.push_back(std::move(block));
    }
    return blocks;
}

RepairResult XorParityEncoder::repair(const std::vector<UnitData>& unitsWithGaps,
                                      const std::vector<RedundancyBlock>& blocks) const {
    RepairResult result;
    result.units = unitsWithGaps;

    std::map<size_t, size_t> position;
    for (size_t i = 0; i < result.units.size(); ++i) {
        position[result.units[i].index] = i;
    }

    for (const auto& block : blocks) {
        if (block.parameters.codec != name() || !blockSelfCheck(block) ||
            block.unitIndices.size() != block.unitSizes.size()) {
            continue;
        }

        std::vector<size_t> gaps;
        bool usable = true;
        for (size_t k = 0; k < block.unitIndices.size(); ++k) {
            auto it = position.find(block.unitIndices[k]);
            if (it == position.end()) {
                usable = false;
                break;
            }
            const UnitData& unit = result.units[it->second];
            if (!unit.present) {
                gaps.push_back(k);
            } else if (unit.bytes.size() != block.unitSizes[k]) {
                // Truncated or grown unit is not a trustworthy input
                usable = false;
                break;
            }
        }
        if (!usable || gaps.size() != 1) {
            continue;
        }

        size_t slot = gaps.front();
        std::vector<uint8_t> rebuilt(block.bytes);
        for (size_t k = 0; k < block.unitIndices.size(); ++k) {
            if (k == slot) {
                continue;
            }
            const auto& data = result.units[position[block.unitIndices[k]]].bytes;
            for (size_t j = 0; j < data.size(); ++j) {
                rebuilt[j] ^= data[j];
            }
        }
        rebuilt.resize(block.unitSizes[slot]);

        UnitData& target = result.units[position[block.unitIndices[slot]]];
        target.bytes = std::move(rebuilt);
        target.present = true;
    }

    for (const auto& unit : result.units) {
        if (!unit.present) {
            result.missingUnits.push_back(unit.index);
        }
    }
    result.recovered = result.missingUnits.empty();
    if (!result.recovered) {
        result.units.clear();
    }
    return result;
}
