#include "archup/core/config.hpp"
#include "archup/upload/chunk_planner.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace archup {
namespace {

using json = nlohmann::json;

template<typename T>
void read_field(const json& payload, const char* key, T& field) {
    if (payload.contains(key)) {
        field = payload.at(key).get<T>();
    }
}

} // namespace

archup::Result<void> UploadConfig::validate() const {
    if (vault_name.empty()) {
        return archup::Err<void>(archup::Error(ErrorKind::InvalidConfig, "Vault name must not be empty"));
    }
    if (auto res = upload::ChunkPlanner::validate_part_size_mb(part_size_mb); res.is_error()) {
        return res;
    }
    if (max_attempts == 0) {
        return archup::Err<void>(archup::Error(ErrorKind::InvalidConfig, "max_attempts must be at least 1"));
    }
    if (spdlog::level::from_str(log_level) == spdlog::level::off && log_level != "off") {
        return archup::Err<void>(archup::Error(ErrorKind::InvalidConfig, "Unknown log level: " + log_level));
    }
    return archup::Ok();
}

archup::Result<UploadConfig> parse_config(const std::string& text, UploadConfig base) {
    auto payload = json::parse(text, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return archup::Err<UploadConfig>(archup::Error(ErrorKind::InvalidConfig, "Config is not a JSON object"));
    }

    try {
        read_field(payload, "vault_name", base.vault_name);
        read_field(payload, "description", base.description);
        read_field(payload, "part_size_mb", base.part_size_mb);
        read_field(payload, "concurrency", base.concurrency);
        read_field(payload, "max_attempts", base.max_attempts);
        read_field(payload, "single_request_threshold", base.single_request_threshold);
        read_field(payload, "allow_part_size_adjustment", base.allow_part_size_adjustment);
        read_field(payload, "log_level", base.log_level);
    } catch (const json::exception& e) {
        return archup::Err<UploadConfig>(archup::Error(ErrorKind::InvalidConfig, std::string("Bad config value: ") + e.what()));
    }
    return archup::Ok(std::move(base));
}

archup::Result<UploadConfig> load_config(const std::filesystem::path& path, UploadConfig base) {
    std::ifstream input(path);
    if (!input) {
        return archup::Err<UploadConfig>(archup::Error(ErrorKind::InvalidConfig, "Cannot open config file: " + path.string()));
    }
    std::ostringstream oss;
    oss << input.rdbuf();
    return parse_config(oss.str(), std::move(base));
}

} // namespace archup
