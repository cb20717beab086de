#pragma once

/**
 * @file remote_store.hpp
 * @brief Boundary to the immutable-object store that receives archives
 *
 * The upload engine talks to the store only through this interface.
 * Transport, authentication and transport-level retry belong to the
 * implementation. Every call reports failure as ErrorKind::Transport
 * (network or service failure) or ErrorKind::NotFound (unknown vault or
 * session); the engine decides what to retry.
 *
 * THREAD SAFETY:
 * upload_part is called concurrently from the orchestrator's workers and
 * must be safe to call in parallel. Other calls are made from one thread.
 */

#include "archup/core/result.hpp"
#include "archup/upload/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace archup::upload {

class RemoteStore {
public:
    virtual ~RemoteStore() = default;

    /// Opens a multipart session and returns its opaque id.
    virtual archup::Result<std::string> create_session(const std::string& vault_name,
                                                       const std::string& description,
                                                       std::uint64_t part_size) = 0;

    /// One page of the parts already received; pass the previous next_marker to continue.
    virtual archup::Result<PartListing> list_session_parts(const std::string& vault_name,
                                                           const std::string& session_id,
                                                           const std::optional<std::string>& marker) = 0;

    /// Stores one part and returns the store's tree hash of it (hex).
    virtual archup::Result<std::string> upload_part(const std::string& vault_name,
                                                    const std::string& session_id,
                                                    const ByteRange& range,
                                                    const std::vector<std::uint8_t>& bytes) = 0;

    virtual archup::Result<ArchiveReceipt> complete_session(const std::string& vault_name,
                                                            const std::string& session_id,
                                                            std::uint64_t total_size,
                                                            const std::string& root_checksum) = 0;

    /// Single-request path for small objects.
    virtual archup::Result<ArchiveReceipt> upload_whole(const std::string& vault_name,
                                                        const std::string& description,
                                                        const std::vector<std::uint8_t>& bytes) = 0;

    virtual archup::Result<std::vector<SessionSummary>> list_sessions(const std::string& vault_name) = 0;

    virtual archup::Result<void> abort_session(const std::string& vault_name, const std::string& session_id) = 0;
};

} // namespace archup::upload
