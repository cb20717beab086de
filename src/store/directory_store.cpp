#include "archup/store/directory_store.hpp"
#include "archup/hash/tree_hash.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace archup::store {
namespace fs = std::filesystem;
using json = nlohmann::json;
using upload::ArchiveReceipt;
using upload::ByteRange;
using upload::PartListing;
using upload::RemotePart;
using upload::SessionSummary;

namespace {

constexpr const char* kManifestFile = "manifest.json";
constexpr const char* kStagingFile = "staging.bin";

std::string utc_timestamp() {
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

bool is_safe_name(const std::string& name) {
    return !name.empty() && name != "." && name != ".." && name.find('/') == std::string::npos &&
           name.find('\\') == std::string::npos;
}

archup::Error transport(std::string message) {
    return archup::Error(ErrorKind::Transport, std::move(message));
}

bool is_archive_id(const std::string& id) {
    return !id.empty() && std::all_of(id.begin(), id.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

} // namespace

struct DirectoryStore::Manifest {
    std::string description;
    std::uint64_t part_size = 0;
    std::string created_at;
    std::vector<RemotePart> parts; ///< Sorted by start
};

DirectoryStore::DirectoryStore(fs::path root, std::size_t page_size, std::optional<std::uint64_t> id_seed)
    : root_(std::move(root)),
      page_size_(page_size == 0 ? kDefaultPageSize : page_size),
      rng_(id_seed.has_value() ? *id_seed : std::random_device{}()) {}

archup::Result<void> DirectoryStore::create_vault(const std::string& vault_name) {
    if (!is_safe_name(vault_name)) {
        return archup::Err<void>(transport("Invalid vault name: " + vault_name));
    }
    std::error_code ec;
    fs::create_directories(root_ / vault_name / "uploads", ec);
    if (!ec) {
        fs::create_directories(root_ / vault_name / "archives", ec);
    }
    if (ec) {
        return archup::Err<void>(transport("Failed to create vault " + vault_name + ": " + ec.message()));
    }
    return archup::Ok();
}

archup::Result<std::string> DirectoryStore::create_session(const std::string& vault_name,
                                                           const std::string& description,
                                                           std::uint64_t part_size) {
    std::lock_guard lock(mutex_);
    auto vault = vault_dir(vault_name);
    if (vault.is_error()) {
        return archup::Err<std::string>(vault.error());
    }

    const auto session_id = generate_id();
    const auto dir = vault.value() / "uploads" / session_id;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return archup::Err<std::string>(transport("Failed to create session directory: " + ec.message()));
    }
    {
        std::ofstream create(dir / kStagingFile, std::ios::binary | std::ios::trunc);
        if (!create) {
            return archup::Err<std::string>(transport("Failed to create staging file for " + session_id));
        }
    }

    Manifest manifest;
    manifest.description = description;
    manifest.part_size = part_size;
    manifest.created_at = utc_timestamp();
    if (auto res = write_manifest(dir, manifest); res.is_error()) {
        return archup::Err<std::string>(res.error());
    }

    spdlog::debug("DirectoryStore: created session {} in vault {}", session_id, vault_name);
    return archup::Ok(session_id);
}

archup::Result<PartListing> DirectoryStore::list_session_parts(const std::string& vault_name,
                                                               const std::string& session_id,
                                                               const std::optional<std::string>& marker) {
    std::lock_guard lock(mutex_);
    auto dir = session_dir(vault_name, session_id);
    if (dir.is_error()) {
        return archup::Err<PartListing>(dir.error());
    }
    auto manifest = read_manifest(dir.value());
    if (manifest.is_error()) {
        return archup::Err<PartListing>(manifest.error());
    }

    std::size_t offset = 0;
    if (marker.has_value()) {
        const auto& text = *marker;
        const auto parsed = std::from_chars(text.data(), text.data() + text.size(), offset);
        if (parsed.ec != std::errc() || parsed.ptr != text.data() + text.size()) {
            return archup::Err<PartListing>(transport("Invalid list marker: " + text));
        }
    }

    const auto& parts = manifest.value().parts;
    PartListing listing;
    listing.part_size = manifest.value().part_size;
    const std::size_t end = std::min(parts.size(), offset + page_size_);
    for (std::size_t i = offset; i < end; ++i) {
        listing.parts.push_back(parts[i]);
    }
    if (end < parts.size()) {
        listing.next_marker = std::to_string(end);
    }
    return archup::Ok(std::move(listing));
}

archup::Result<std::string> DirectoryStore::upload_part(const std::string& vault_name,
                                                        const std::string& session_id,
                                                        const ByteRange& range,
                                                        const std::vector<std::uint8_t>& bytes) {
    if (bytes.empty() || range.end < range.start || range.length() != bytes.size()) {
        return archup::Err<std::string>(transport("Range " + range.to_header() + " does not match body of " +
                                                  std::to_string(bytes.size()) + " bytes"));
    }

    std::uint64_t part_size = 0;
    {
        std::lock_guard lock(mutex_);
        auto dir = session_dir(vault_name, session_id);
        if (dir.is_error()) {
            return archup::Err<std::string>(dir.error());
        }
        auto manifest = read_manifest(dir.value());
        if (manifest.is_error()) {
            return archup::Err<std::string>(manifest.error());
        }
        part_size = manifest.value().part_size;
    }

    if (range.start % part_size != 0 || bytes.size() > part_size ||
        (bytes.size() < part_size && range.end + 1 != range.total)) {
        return archup::Err<std::string>(transport("Range " + range.to_header() + " is not a valid part for part size " +
                                                  std::to_string(part_size)));
    }

    const auto checksum = hash::to_hex(hash::TreeHasher::part_digest(bytes, static_cast<std::size_t>(part_size)));

    std::lock_guard lock(mutex_);
    auto dir = session_dir(vault_name, session_id);
    if (dir.is_error()) {
        return archup::Err<std::string>(dir.error());
    }
    auto manifest = read_manifest(dir.value());
    if (manifest.is_error()) {
        return archup::Err<std::string>(manifest.error());
    }

    std::fstream file(dir.value() / kStagingFile, std::ios::in | std::ios::out | std::ios::binary);
    if (!file) {
        return archup::Err<std::string>(transport("Failed to open staging file for " + session_id));
    }
    file.seekp(static_cast<std::streamoff>(range.start));
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    file.flush();
    if (!file) {
        return archup::Err<std::string>(transport("Failed to write part " + range.to_header()));
    }

    auto& parts = manifest.value().parts;
    auto it = std::lower_bound(parts.begin(), parts.end(), range.start,
                               [](const RemotePart& part, std::uint64_t start) { return part.start < start; });
    if (it != parts.end() && it->start == range.start) {
        it->end = range.end;
        it->checksum = checksum;
    } else {
        parts.insert(it, RemotePart{range.start, range.end, checksum});
    }

    if (auto res = write_manifest(dir.value(), manifest.value()); res.is_error()) {
        return archup::Err<std::string>(res.error());
    }
    return archup::Ok(checksum);
}

archup::Result<ArchiveReceipt> DirectoryStore::complete_session(const std::string& vault_name,
                                                                const std::string& session_id,
                                                                std::uint64_t total_size,
                                                                const std::string& root_checksum) {
    std::lock_guard lock(mutex_);
    auto vault = vault_dir(vault_name);
    if (vault.is_error()) {
        return archup::Err<ArchiveReceipt>(vault.error());
    }
    auto dir = session_dir(vault_name, session_id);
    if (dir.is_error()) {
        return archup::Err<ArchiveReceipt>(dir.error());
    }
    auto manifest = read_manifest(dir.value());
    if (manifest.is_error()) {
        return archup::Err<ArchiveReceipt>(manifest.error());
    }

    const auto& parts = manifest.value().parts;
    std::vector<hash::Digest> digests;
    digests.reserve(parts.size());
    std::uint64_t expected_start = 0;
    for (const auto& part : parts) {
        if (part.start != expected_start) {
            return archup::Err<ArchiveReceipt>(transport("Part at offset " + std::to_string(expected_start) +
                                                         " has not been uploaded"));
        }
        const auto digest = hash::from_hex(part.checksum);
        if (!digest.has_value()) {
            return archup::Err<ArchiveReceipt>(transport("Corrupt stored checksum at offset " + std::to_string(part.start)));
        }
        digests.push_back(*digest);
        expected_start = part.end + 1;
    }
    if (expected_start != total_size || total_size == 0) {
        return archup::Err<ArchiveReceipt>(transport("Uploaded parts cover " + std::to_string(expected_start) +
                                                     " bytes, archive size is " + std::to_string(total_size)));
    }

    const auto root = hash::TreeHasher::root_digest(digests);
    if (!hash::matches_hex(root, root_checksum)) {
        return archup::Err<ArchiveReceipt>(transport("Checksum " + root_checksum + " does not match tree hash " +
                                                     hash::to_hex(root) + " of the uploaded parts"));
    }

    std::error_code ec;
    fs::resize_file(dir.value() / kStagingFile, total_size, ec);
    if (ec) {
        return archup::Err<ArchiveReceipt>(transport("Failed to finalize staging file: " + ec.message()));
    }

    auto receipt = publish_archive(vault.value(), vault_name, dir.value() / kStagingFile,
                                   manifest.value().description, total_size, hash::to_hex(root));
    if (receipt.is_error()) {
        return receipt;
    }

    fs::remove_all(dir.value(), ec);
    if (ec) {
        spdlog::warn("DirectoryStore: failed to clean up session {}: {}", session_id, ec.message());
    }
    return receipt;
}

archup::Result<ArchiveReceipt> DirectoryStore::upload_whole(const std::string& vault_name,
                                                            const std::string& description,
                                                            const std::vector<std::uint8_t>& bytes) {
    const auto checksum = hash::to_hex(hash::TreeHasher::part_digest(bytes));

    std::lock_guard lock(mutex_);
    auto vault = vault_dir(vault_name);
    if (vault.is_error()) {
        return archup::Err<ArchiveReceipt>(vault.error());
    }

    const auto temp = vault.value() / "uploads" / (generate_id() + ".whole");
    std::error_code ec;
    {
        std::ofstream output(temp, std::ios::binary | std::ios::trunc);
        output.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!output) {
            output.close();
            fs::remove(temp, ec);
            return archup::Err<ArchiveReceipt>(transport("Failed to store archive body"));
        }
    }

    auto receipt = publish_archive(vault.value(), vault_name, temp, description, bytes.size(), checksum);
    if (receipt.is_error()) {
        fs::remove(temp, ec);
    }
    return receipt;
}

archup::Result<std::vector<SessionSummary>> DirectoryStore::list_sessions(const std::string& vault_name) {
    std::lock_guard lock(mutex_);
    auto vault = vault_dir(vault_name);
    if (vault.is_error()) {
        return archup::Err<std::vector<SessionSummary>>(vault.error());
    }

    std::vector<SessionSummary> sessions;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(vault.value() / "uploads", ec)) {
        if (!entry.is_directory()) {
            continue;
        }
        auto manifest = read_manifest(entry.path());
        if (manifest.is_error()) {
            spdlog::warn("DirectoryStore: skipping unreadable session {}: {}",
                         entry.path().filename().string(), manifest.error().message);
            continue;
        }
        sessions.push_back(SessionSummary{entry.path().filename().string(), manifest.value().description,
                                          manifest.value().part_size, manifest.value().created_at});
    }
    if (ec) {
        return archup::Err<std::vector<SessionSummary>>(transport("Failed to list sessions: " + ec.message()));
    }

    std::sort(sessions.begin(), sessions.end(), [](const SessionSummary& a, const SessionSummary& b) {
        return a.created_at < b.created_at || (a.created_at == b.created_at && a.session_id < b.session_id);
    });
    return archup::Ok(std::move(sessions));
}

archup::Result<void> DirectoryStore::abort_session(const std::string& vault_name, const std::string& session_id) {
    std::lock_guard lock(mutex_);
    auto dir = session_dir(vault_name, session_id);
    if (dir.is_error()) {
        return archup::Err<void>(dir.error());
    }
    std::error_code ec;
    fs::remove_all(dir.value(), ec);
    if (ec) {
        return archup::Err<void>(transport("Failed to abort session " + session_id + ": " + ec.message()));
    }
    return archup::Ok();
}

archup::Result<std::vector<ArchiveInfo>> DirectoryStore::list_archives(const std::string& vault_name) {
    std::lock_guard lock(mutex_);
    auto vault = vault_dir(vault_name);
    if (vault.is_error()) {
        return archup::Err<std::vector<ArchiveInfo>>(vault.error());
    }

    std::vector<ArchiveInfo> archives;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(vault.value() / "archives", ec)) {
        if (entry.path().extension() != ".json") {
            continue;
        }
        auto info = read_archive_info(vault.value(), entry.path().stem().string());
        if (info.is_error()) {
            spdlog::warn("DirectoryStore: skipping archive {}: {}", entry.path().stem().string(), info.error().message);
            continue;
        }
        archives.push_back(std::move(info.value()));
    }
    if (ec) {
        return archup::Err<std::vector<ArchiveInfo>>(transport("Failed to list archives: " + ec.message()));
    }

    std::sort(archives.begin(), archives.end(), [](const ArchiveInfo& a, const ArchiveInfo& b) {
        return a.created_at < b.created_at || (a.created_at == b.created_at && a.archive_id < b.archive_id);
    });
    return archup::Ok(std::move(archives));
}

archup::Result<void> DirectoryStore::delete_archive(const std::string& vault_name, const std::string& archive_id) {
    std::lock_guard lock(mutex_);
    auto vault = vault_dir(vault_name);
    if (vault.is_error()) {
        return archup::Err<void>(vault.error());
    }
    auto info = read_archive_info(vault.value(), archive_id);
    if (info.is_error()) {
        return archup::Err<void>(info.error());
    }

    // Metadata goes first so a half-deleted archive is no longer listed
    const auto dir = vault.value() / "archives";
    std::error_code ec;
    fs::remove(dir / (archive_id + ".json"), ec);
    if (!ec) {
        fs::remove(dir / archive_id, ec);
    }
    if (ec) {
        return archup::Err<void>(transport("Failed to delete archive " + archive_id + ": " + ec.message()));
    }
    spdlog::debug("DirectoryStore: deleted archive {} from vault {}", archive_id, vault_name);
    return archup::Ok();
}

archup::Result<ArchiveInfo> DirectoryStore::retrieve_archive(const std::string& vault_name,
                                                             const std::string& archive_id,
                                                             const fs::path& destination) {
    ArchiveInfo info;
    fs::path source;
    {
        std::lock_guard lock(mutex_);
        auto vault = vault_dir(vault_name);
        if (vault.is_error()) {
            return archup::Err<ArchiveInfo>(vault.error());
        }
        auto read = read_archive_info(vault.value(), archive_id);
        if (read.is_error()) {
            return read;
        }
        info = std::move(read.value());
        source = vault.value() / "archives" / archive_id;

        std::error_code ec;
        if (fs::exists(destination, ec)) {
            return archup::Err<ArchiveInfo>(archup::Error(ErrorKind::Io, destination.string() + " already exists"));
        }
        fs::copy_file(source, destination, fs::copy_options::none, ec);
        if (ec) {
            return archup::Err<ArchiveInfo>(archup::Error(
                ErrorKind::Io, "Failed to write " + destination.string() + ": " + ec.message()));
        }
    }

    std::ifstream input(destination, std::ios::binary);
    std::vector<hash::Digest> leaves;
    std::vector<std::uint8_t> buffer(hash::kLeafSize);
    std::uint64_t total = 0;
    while (input) {
        input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        const auto count = static_cast<std::size_t>(input.gcount());
        if (count == 0) {
            break;
        }
        leaves.push_back(hash::TreeHasher::leaf_digest(buffer.data(), count));
        total += count;
    }
    const bool read_failed = input.bad();
    input.close();

    std::error_code ec;
    if (read_failed) {
        fs::remove(destination, ec);
        return archup::Err<ArchiveInfo>(archup::Error(ErrorKind::Io, "Failed to read back " + destination.string()));
    }

    const auto root = hash::TreeHasher::root_digest(leaves);
    if (total != info.size || !hash::matches_hex(root, info.checksum)) {
        fs::remove(destination, ec);
        return archup::Err<ArchiveInfo>(archup::Error(
            ErrorKind::IntegrityViolation, "Archive " + archive_id + " tree hash " + hash::to_hex(root) + " over " +
                                               std::to_string(total) + " bytes does not match stored " +
                                               info.checksum));
    }
    return archup::Ok(std::move(info));
}

fs::path DirectoryStore::archive_path(const std::string& vault_name, const std::string& archive_id) const {
    return root_ / vault_name / "archives" / archive_id;
}

archup::Result<fs::path> DirectoryStore::vault_dir(const std::string& vault_name) const {
    if (!is_safe_name(vault_name)) {
        return archup::Err<fs::path>(archup::Error(ErrorKind::NotFound, "Invalid vault name: " + vault_name));
    }
    auto dir = root_ / vault_name;
    std::error_code ec;
    if (!fs::is_directory(dir / "uploads", ec) || !fs::is_directory(dir / "archives", ec)) {
        return archup::Err<fs::path>(archup::Error(ErrorKind::NotFound, "Vault not found: " + vault_name));
    }
    return archup::Ok(std::move(dir));
}

archup::Result<fs::path> DirectoryStore::session_dir(const std::string& vault_name,
                                                     const std::string& session_id) const {
    auto vault = vault_dir(vault_name);
    if (vault.is_error()) {
        return vault;
    }
    if (!is_safe_name(session_id)) {
        return archup::Err<fs::path>(archup::Error(ErrorKind::NotFound, "Invalid upload id: " + session_id));
    }
    auto dir = vault.value() / "uploads" / session_id;
    std::error_code ec;
    if (!fs::is_regular_file(dir / kManifestFile, ec)) {
        return archup::Err<fs::path>(archup::Error(ErrorKind::NotFound, "Upload not found: " + session_id));
    }
    return archup::Ok(std::move(dir));
}

archup::Result<ArchiveInfo> DirectoryStore::read_archive_info(const fs::path& vault,
                                                             const std::string& archive_id) const {
    const auto data = vault / "archives" / archive_id;
    std::error_code ec;
    if (!is_archive_id(archive_id) || !fs::is_regular_file(data, ec)) {
        return archup::Err<ArchiveInfo>(archup::Error(ErrorKind::NotFound, "Archive not found: " + archive_id));
    }

    std::ifstream input(vault / "archives" / (archive_id + ".json"));
    if (!input) {
        return archup::Err<ArchiveInfo>(archup::Error(ErrorKind::NotFound, "Archive not found: " + archive_id));
    }
    auto meta = json::parse(input, nullptr, false);
    if (meta.is_discarded() || !meta.is_object()) {
        return archup::Err<ArchiveInfo>(transport("Corrupt metadata for archive " + archive_id));
    }

    ArchiveInfo info;
    try {
        info.archive_id = archive_id;
        info.description = meta.value("description", std::string{});
        info.size = meta.at("size").get<std::uint64_t>();
        info.checksum = meta.at("checksum").get<std::string>();
        info.created_at = meta.value("created_at", std::string{});
    } catch (const json::exception& e) {
        return archup::Err<ArchiveInfo>(transport("Corrupt metadata for archive " + archive_id + ": " + e.what()));
    }
    return archup::Ok(std::move(info));
}

archup::Result<DirectoryStore::Manifest> DirectoryStore::read_manifest(const fs::path& dir) {
    std::ifstream input(dir / kManifestFile);
    if (!input) {
        return archup::Err<Manifest>(transport("Failed to open manifest in " + dir.string()));
    }
    std::ostringstream oss;
    oss << input.rdbuf();

    auto payload = json::parse(oss.str(), nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return archup::Err<Manifest>(transport("Corrupt manifest in " + dir.string()));
    }

    Manifest manifest;
    try {
        manifest.description = payload.value("description", std::string{});
        manifest.part_size = payload.at("part_size").get<std::uint64_t>();
        manifest.created_at = payload.value("created_at", std::string{});
        for (const auto& entry : payload.value("parts", json::array())) {
            manifest.parts.push_back(RemotePart{entry.at("start").get<std::uint64_t>(),
                                                entry.at("end").get<std::uint64_t>(),
                                                entry.at("checksum").get<std::string>()});
        }
    } catch (const json::exception& e) {
        return archup::Err<Manifest>(transport(std::string("Corrupt manifest: ") + e.what()));
    }
    if (manifest.part_size == 0) {
        return archup::Err<Manifest>(transport("Manifest in " + dir.string() + " has no part size"));
    }
    return archup::Ok(std::move(manifest));
}

archup::Result<void> DirectoryStore::write_manifest(const fs::path& dir, const Manifest& manifest) {
    json j;
    j["description"] = manifest.description;
    j["part_size"] = manifest.part_size;
    j["created_at"] = manifest.created_at;
    j["parts"] = json::array();
    for (const auto& part : manifest.parts) {
        j["parts"].push_back({{"start", part.start}, {"end", part.end}, {"checksum", part.checksum}});
    }

    const auto temp = dir / (std::string(kManifestFile) + ".tmp");
    {
        std::ofstream output(temp, std::ios::trunc);
        output << j.dump(2);
        if (!output) {
            return archup::Err<void>(transport("Failed to write manifest in " + dir.string()));
        }
    }
    std::error_code ec;
    fs::rename(temp, dir / kManifestFile, ec);
    if (ec) {
        return archup::Err<void>(transport("Failed to replace manifest in " + dir.string() + ": " + ec.message()));
    }
    return archup::Ok();
}

archup::Result<ArchiveReceipt> DirectoryStore::publish_archive(const fs::path& vault,
                                                               const std::string& vault_name,
                                                               const fs::path& data_file,
                                                               const std::string& description,
                                                               std::uint64_t size,
                                                               const std::string& checksum) {
    const auto archive_id = generate_id();
    const auto destination = vault / "archives" / archive_id;

    std::error_code ec;
    fs::rename(data_file, destination, ec);
    if (ec) {
        return archup::Err<ArchiveReceipt>(transport("Failed to publish archive: " + ec.message()));
    }

    json meta;
    meta["archive_id"] = archive_id;
    meta["description"] = description;
    meta["size"] = size;
    meta["checksum"] = checksum;
    meta["created_at"] = utc_timestamp();
    const auto meta_path = vault / "archives" / (archive_id + ".json");
    std::ofstream output(meta_path, std::ios::trunc);
    output << meta.dump(2);
    output.close();
    if (!output) {
        fs::remove(meta_path, ec);
        fs::rename(destination, data_file, ec);
        return archup::Err<ArchiveReceipt>(transport("Failed to write archive metadata for " + archive_id));
    }

    return archup::Ok(ArchiveReceipt{checksum, "/" + vault_name + "/archives/" + archive_id, archive_id});
}

std::string DirectoryStore::generate_id() {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << rng_() << std::setw(16) << rng_();
    return oss.str();
}

std::string inventory_json(const std::string& vault_name, const std::vector<ArchiveInfo>& archives) {
    json list = json::array();
    for (const auto& archive : archives) {
        list.push_back({{"ArchiveId", archive.archive_id},
                        {"ArchiveDescription", archive.description},
                        {"CreationDate", archive.created_at},
                        {"Size", archive.size},
                        {"SHA256TreeHash", archive.checksum}});
    }

    json inventory;
    inventory["VaultName"] = vault_name;
    inventory["InventoryDate"] = utc_timestamp();
    inventory["ArchiveList"] = std::move(list);
    return inventory.dump(2);
}

} // namespace archup::store
