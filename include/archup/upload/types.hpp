#pragma once

#include "archup/hash/tree_hash.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace archup::upload {

inline constexpr std::uint64_t kMiB = 1024ULL * 1024ULL;
inline constexpr std::uint64_t kMinPartSizeMb = 1;
inline constexpr std::uint64_t kMaxPartSizeMb = 4096;
inline constexpr std::uint64_t kMinPartSize = kMinPartSizeMb * kMiB;
inline constexpr std::uint64_t kMaxPartSize = kMaxPartSizeMb * kMiB;
inline constexpr std::uint64_t kMaxParts = 10000;
inline constexpr std::uint32_t kDefaultMaxAttempts = 10;
inline constexpr std::uint64_t kDefaultSingleRequestThreshold = 4096;

/**
 * @brief Inclusive byte range of one part plus the object length
 *
 * Sent with every part upload as "bytes <start>-<end>/<total>".
 */
struct ByteRange {
    std::uint64_t start = 0;
    std::uint64_t end = 0;   ///< Inclusive
    std::uint64_t total = 0;

    [[nodiscard]] std::uint64_t length() const noexcept { return end - start + 1; }
    [[nodiscard]] std::string to_header() const;
};

enum class PartState {
    Pending,   ///< Not confirmed remotely
    Verified,  ///< Already on the remote with a matching digest (resume only)
    Uploaded,  ///< Uploaded and confirmed during this run
    Failed     ///< Exhausted its attempts
};

struct Part {
    std::uint32_t index = 0;
    ByteRange range;
    PartState state = PartState::Pending;
    std::optional<hash::Digest> checksum; ///< Set once Verified or Uploaded, never changed afterwards

    [[nodiscard]] bool confirmed() const noexcept {
        return state == PartState::Verified || state == PartState::Uploaded;
    }
};

/**
 * @brief A part the remote store reports as already received
 */
struct RemotePart {
    std::uint64_t start = 0;
    std::uint64_t end = 0;   ///< Inclusive
    std::string checksum;    ///< Remote tree hash, hex
};

/**
 * @brief One page of a session's part listing
 */
struct PartListing {
    std::uint64_t part_size = 0;
    std::vector<RemotePart> parts;
    std::optional<std::string> next_marker; ///< Present while more pages remain
};

struct SessionSummary {
    std::string session_id;
    std::string description;
    std::uint64_t part_size = 0;
    std::string created_at;
};

/**
 * @brief Remote acknowledgement of a committed archive
 */
struct ArchiveReceipt {
    std::string checksum;   ///< Remote root tree hash, hex
    std::string location;
    std::string archive_id;
};

/**
 * @brief What a caller keeps to resume a session in a later process
 */
struct SessionDescriptor {
    std::string session_id;
    std::string vault_name;
    std::uint64_t part_size = 0;
    std::uint64_t total_size = 0;
};

const char* to_string(PartState state) noexcept;

} // namespace archup::upload
