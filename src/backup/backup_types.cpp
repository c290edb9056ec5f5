#include "backup/backup_types.hpp"
#include "common/backup_status.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>

std::string mediumKindToString(MediumKind kind) {
    switch (kind) {
        case MediumKind::OpticalData:  return "optical-data";
        case MediumKind::OpticalAudio: return "optical-audio";
        case MediumKind::Cartridge:    return "cartridge";
        default:                       return "unknown";
    }
}

bool parseMediumKind(const std::string& text, MediumKind& kind) {
    if (text == "optical-data" || text == "cd" || text == "dvd") {
        kind = MediumKind::OpticalData;
    } else if (text == "optical-audio" || text == "audio") {
        kind = MediumKind::OpticalAudio;
    } else if (text == "cartridge" || text == "retrode") {
        kind = MediumKind::Cartridge;
    } else {
        return false;
    }
    return true;
}

std::string unitStatusToString(UnitStatus status) {
    switch (status) {
        case UnitStatus::Unverified:   return "unverified";
        case UnitStatus::Verified:     return "verified";
        case UnitStatus::Mismatched:   return "mismatched";
        case UnitStatus::Repaired:     return "repaired";
        case UnitStatus::Unrepairable: return "unrepairable";
        default:                       return "unknown";
    }
}

UnitStatus parseUnitStatus(const std::string& text) {
    static const UnitStatus statuses[] = {
        UnitStatus::Unverified, UnitStatus::Verified, UnitStatus::Mismatched,
        UnitStatus::Repaired, UnitStatus::Unrepairable
    };
    for (UnitStatus status : statuses) {
        if (unitStatusToString(status) == text) {
            return status;
        }
    }
    throw BackupError(ErrorKind::StorageIOError, "Unknown unit status in job record: " + text);
}

std::string toHex(const std::vector<uint8_t>& bytes) {
    std::stringstream ss;
    for (uint8_t b : bytes) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return ss.str();
}

std::vector<uint8_t> fromHex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw BackupError(ErrorKind::StorageIOError, "Odd-length hex string");
    }
    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        if (!std::isxdigit(static_cast<unsigned char>(hex[i])) ||
            !std::isxdigit(static_cast<unsigned char>(hex[i + 1]))) {
            throw BackupError(ErrorKind::StorageIOError, "Invalid hex digest: " + hex);
        }
        bytes.push_back(static_cast<uint8_t>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }
    return bytes;
}
