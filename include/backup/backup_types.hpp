#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class MediumKind {
    OpticalData,
    OpticalAudio,
    Cartridge
};

// Physical medium the job reads from; fixed once the job starts
struct Source {
    std::string path;       // Device node or dump/image path
    MediumKind kind{MediumKind::OpticalData};
    std::string label;      // Volume label, empty if unknown
};

enum class UnitStatus {
    Unverified,
    Verified,
    Mismatched,
    Repaired,
    Unrepairable
};

// One piece of extractor output as reported in the Done manifest
struct UnitDescriptor {
    size_t index{0};
    std::string fileName;   // Relative to the job's units directory
    uint64_t offset{0};     // Byte offset within the source
    uint64_t size{0};
};

struct Unit {
    size_t index{0};
    std::string fileName;
    uint64_t offset{0};
    uint64_t size{0};
    std::optional<std::string> digest;          // Hex digest, set once checksummed
    std::optional<size_t> redundancyBlock;      // Index of the covering block
    UnitStatus status{UnitStatus::Unverified};
};

// Unit contents handed to a RedundancyEncoder. A unit with present == false
// is a gap that repair() should fill.
struct UnitData {
    size_t index{0};
    std::vector<uint8_t> bytes;
    bool present{true};
};

struct EncodingParameters {
    std::string codec;
    size_t groupSize{0};
    uint64_t shardSize{0};
};

struct RedundancyBlock {
    size_t index{0};
    std::vector<size_t> unitIndices;
    std::vector<uint64_t> unitSizes;
    EncodingParameters parameters;
    std::vector<uint8_t> bytes;
    std::string checksum;   // SHA-256 hex of bytes
};

std::string mediumKindToString(MediumKind kind);
bool parseMediumKind(const std::string& text, MediumKind& kind);

std::string unitStatusToString(UnitStatus status);
UnitStatus parseUnitStatus(const std::string& text);

std::string toHex(const std::vector<uint8_t>& bytes);
std::vector<uint8_t> fromHex(const std::string& hex);
