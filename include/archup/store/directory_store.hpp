#pragma once

/**
 * @file directory_store.hpp
 * @brief RemoteStore backed by a local directory tree
 *
 * Behaves like the remote vault service: parts are written into a staging
 * file at their byte offset, the store computes its own tree hash of every
 * part it receives, and completion rebuilds the root digest from the stored
 * part digests before the archive becomes visible.
 *
 * LAYOUT:
 * <root>/<vault>/uploads/<session>/manifest.json   session + received parts
 * <root>/<vault>/uploads/<session>/staging.bin     part data at offsets
 * <root>/<vault>/archives/<archive_id>             committed archive
 * <root>/<vault>/archives/<archive_id>.json        archive metadata
 *
 * THREAD SAFETY:
 * All calls may be made concurrently. Hashing of an incoming part happens
 * outside the store lock; manifest and staging writes happen under it.
 */

#include "archup/upload/remote_store.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <random>

namespace archup::store {

/// Metadata kept beside every committed archive.
struct ArchiveInfo {
    std::string archive_id;
    std::string description;
    std::uint64_t size = 0;
    std::string checksum; ///< Hex SHA-256 tree hash
    std::string created_at;
};

/**
 * @brief Vault inventory in the service's JSON layout
 *
 * {"VaultName", "InventoryDate", "ArchiveList": [{"ArchiveId",
 * "ArchiveDescription", "CreationDate", "Size", "SHA256TreeHash"}]}
 */
std::string inventory_json(const std::string& vault_name, const std::vector<ArchiveInfo>& archives);

class DirectoryStore : public upload::RemoteStore {
public:
    static constexpr std::size_t kDefaultPageSize = 1000;

    /// A fixed id_seed makes generated session and archive ids reproducible.
    explicit DirectoryStore(std::filesystem::path root,
                            std::size_t page_size = kDefaultPageSize,
                            std::optional<std::uint64_t> id_seed = std::nullopt);

    archup::Result<void> create_vault(const std::string& vault_name);

    archup::Result<std::string> create_session(const std::string& vault_name,
                                               const std::string& description,
                                               std::uint64_t part_size) override;

    archup::Result<upload::PartListing> list_session_parts(const std::string& vault_name,
                                                           const std::string& session_id,
                                                           const std::optional<std::string>& marker) override;

    archup::Result<std::string> upload_part(const std::string& vault_name,
                                            const std::string& session_id,
                                            const upload::ByteRange& range,
                                            const std::vector<std::uint8_t>& bytes) override;

    archup::Result<upload::ArchiveReceipt> complete_session(const std::string& vault_name,
                                                            const std::string& session_id,
                                                            std::uint64_t total_size,
                                                            const std::string& root_checksum) override;

    archup::Result<upload::ArchiveReceipt> upload_whole(const std::string& vault_name,
                                                        const std::string& description,
                                                        const std::vector<std::uint8_t>& bytes) override;

    archup::Result<std::vector<upload::SessionSummary>> list_sessions(const std::string& vault_name) override;

    archup::Result<void> abort_session(const std::string& vault_name, const std::string& session_id) override;

    /// Committed archives ordered by creation time.
    archup::Result<std::vector<ArchiveInfo>> list_archives(const std::string& vault_name);

    archup::Result<void> delete_archive(const std::string& vault_name, const std::string& archive_id);

    /**
     * @brief Copy a committed archive to a new local file
     *
     * The copy is re-hashed and must match the stored tree hash, otherwise
     * it is removed and IntegrityViolation is returned. An existing
     * destination is never overwritten.
     */
    archup::Result<ArchiveInfo> retrieve_archive(const std::string& vault_name,
                                                 const std::string& archive_id,
                                                 const std::filesystem::path& destination);

    /// Path of a committed archive, for inspection.
    [[nodiscard]] std::filesystem::path archive_path(const std::string& vault_name,
                                                     const std::string& archive_id) const;

private:
    struct Manifest;

    archup::Result<std::filesystem::path> vault_dir(const std::string& vault_name) const;
    archup::Result<std::filesystem::path> session_dir(const std::string& vault_name,
                                                      const std::string& session_id) const;

    archup::Result<ArchiveInfo> read_archive_info(const std::filesystem::path& vault,
                                                  const std::string& archive_id) const;

    static archup::Result<Manifest> read_manifest(const std::filesystem::path& dir);
    static archup::Result<void> write_manifest(const std::filesystem::path& dir, const Manifest& manifest);

    archup::Result<upload::ArchiveReceipt> publish_archive(const std::filesystem::path& vault,
                                                           const std::string& vault_name,
                                                           const std::filesystem::path& data_file,
                                                           const std::string& description,
                                                           std::uint64_t size,
                                                           const std::string& checksum);

    std::string generate_id();

    std::filesystem::path root_;
    std::size_t page_size_;
    std::mutex mutex_;
    std::mt19937_64 rng_;
};

} // namespace archup::store
