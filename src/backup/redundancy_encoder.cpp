#include "backup/redundancy_encoder.hpp"
#include "backup/xor_parity_encoder.hpp"
#include "backup/checksum_ledger.hpp"
#include "common/backup_status.hpp"
#include "common/logger.hpp"

std::shared_ptr<RedundancyEncoder> createRedundancyEncoder(const std::string& codec) {
    Logger::debug("Creating redundancy encoder: " + codec);

    if (codec == "xor") {
        return std::make_shared<XorParityEncoder>();
    }

    throw BackupError(ErrorKind::InvalidConfiguration, "Unsupported redundancy codec: " + codec);
}

std::string computeBlockChecksum(const RedundancyBlock& block) {
    return toHex(ChecksumLedger::digestOf(block.bytes, HashAlgorithm::SHA256));
}

bool blockSelfCheck(const RedundancyBlock& block) {
    return !block.checksum.empty() && computeBlockChecksum(block) == block.checksum;
}
