#include "backup/image_extractor.hpp"
#include "common/backup_status.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <fstream>

ImageExtractor::ImageExtractor(uint64_t unitSize)
    : ThreadedExtractor(unitSize) {
}

ImageExtractor::~ImageExtractor() {
    shutdown();
}

void ImageExtractor::checkSource(const Source& source) const {
    std::error_code ec;
    if (source.path.empty() || !std::filesystem::exists(source.path, ec)) {
        throw BackupError(ErrorKind::DeviceError, "Source does not exist: " + source.path);
    }
    if (std::filesystem::is_directory(source.path, ec)) {
        throw BackupError(ErrorKind::DeviceError, "Source is a directory: " + source.path);
    }

    std::ifstream probe(source.path, std::ios::binary);
    if (!probe.is_open()) {
        throw BackupError(ErrorKind::DeviceError, "Source is not readable: " + source.path);
    }
}

ExtractionStatus ImageExtractor::run(Session& session) {
    std::ifstream input(session.source.path, std::ios::binary);
    if (!input.is_open()) {
        return ExtractionStatus::failed("Source became unreadable: " + session.source.path);
    }

    std::vector<UnitDescriptor> manifest;
    uint64_t offset = 0;
    std::string error;
    if (!writeUnits(input, session, manifest, offset, error)) {
        return ExtractionStatus::failed(error, session.cancelRequested);
    }

    Logger::debug("Image extraction of " + session.source.path + " produced " +
                  std::to_string(manifest.size()) + " units, " + std::to_string(offset) + " bytes");
    return ExtractionStatus::done(std::move(manifest), offset);
}
