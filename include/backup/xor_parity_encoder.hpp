#pragma once

#include "backup/redundancy_encoder.hpp"

// Single-parity codec. Consecutive units are grouped ceil(1 / ratio) at a
// time and each group gets one parity block: the XOR of its units, each
// zero-padded to the largest unit in the group. Any one missing unit per
// group can be rebuilt.
class XorParityEncoder : public RedundancyEncoder {
public:
    std::string name() const override { return "xor"; }

    std::vector<RedundancyBlock> encode(const std::vector<UnitData>& units,
                                        double redundancyRatio) const override;

    RepairResult repair(const std::vector<UnitData>& unitsWithGaps,
                        const std::vector<RedundancyBlock>& blocks) const override;

    static size_t groupSizeFor(double redundancyRatio);
};
