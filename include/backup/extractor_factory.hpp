#pragma once

#include "backup/backup_config.hpp"
#include "backup/extractor.hpp"
#include <memory>
#include <string>

// Factory function to create the extractor named in the job configuration
std::shared_ptr<Extractor> createExtractor(const BackupConfig& config);
