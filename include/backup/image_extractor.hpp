#pragma once

#include "backup/threaded_extractor.hpp"

// Reads an image file, block device or cartridge dump directly and cuts it
// into fixed-size units
class ImageExtractor : public ThreadedExtractor {
public:
    explicit ImageExtractor(uint64_t unitSize);
    ~ImageExtractor() override;

    std::string name() const override { return "image"; }

protected:
    void checkSource(const Source& source) const override;
    ExtractionStatus run(Session& session) override;
};
