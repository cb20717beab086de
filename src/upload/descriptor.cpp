#include "archup/upload/descriptor.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace archup::upload {
namespace fs = std::filesystem;
using json = nlohmann::json;

fs::path descriptor_path_for(const fs::path& source) {
    fs::path path = source;
    path += ".archup-session.json";
    return path;
}

archup::Result<void> save_descriptor(const fs::path& path, const SessionDescriptor& descriptor) {
    json j;
    j["session_id"] = descriptor.session_id;
    j["vault_name"] = descriptor.vault_name;
    j["part_size"] = descriptor.part_size;
    j["total_size"] = descriptor.total_size;

    std::ofstream output(path, std::ios::trunc);
    if (!output) {
        return archup::Err<void>(archup::Error(ErrorKind::Io, "Failed to write session descriptor: " + path.string()));
    }
    output << j.dump(2) << '\n';
    if (!output) {
        return archup::Err<void>(archup::Error(ErrorKind::Io, "Failed to write session descriptor: " + path.string()));
    }
    return archup::Ok();
}

archup::Result<SessionDescriptor> load_descriptor(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return archup::Err<SessionDescriptor>(
            archup::Error(ErrorKind::Io, "Failed to open session descriptor: " + path.string()));
    }
    std::ostringstream oss;
    oss << input.rdbuf();

    auto payload = json::parse(oss.str(), nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return archup::Err<SessionDescriptor>(
            archup::Error(ErrorKind::InvalidConfig, "Session descriptor is not a JSON object: " + path.string()));
    }

    SessionDescriptor descriptor;
    try {
        descriptor.session_id = payload.at("session_id").get<std::string>();
        descriptor.vault_name = payload.at("vault_name").get<std::string>();
        descriptor.part_size = payload.at("part_size").get<std::uint64_t>();
        descriptor.total_size = payload.at("total_size").get<std::uint64_t>();
    } catch (const json::exception& e) {
        return archup::Err<SessionDescriptor>(
            archup::Error(ErrorKind::InvalidConfig, std::string("Malformed session descriptor: ") + e.what()));
    }
    return archup::Ok(std::move(descriptor));
}

} // namespace archup::upload
