#pragma once

#include "archup/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace archup {

/**
 * @brief Settings for one upload run
 *
 * Defaults first, then an optional JSON file, then command-line flags.
 * JSON keys match the field names; unknown keys are ignored.
 */
struct UploadConfig {
    std::string vault_name;
    std::string description;
    std::uint64_t part_size_mb = 8;
    std::size_t concurrency = 0;               ///< 0 picks available parallelism times five
    std::uint32_t max_attempts = 10;
    std::uint64_t single_request_threshold = 4096;
    bool allow_part_size_adjustment = true;
    std::string log_level = "info";

    /// Rejects values that would fail before any remote call.
    archup::Result<void> validate() const;
};

archup::Result<UploadConfig> load_config(const std::filesystem::path& path, UploadConfig base = {});

archup::Result<UploadConfig> parse_config(const std::string& text, UploadConfig base = {});

} // namespace archup
