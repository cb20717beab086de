#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace archup::hash {

inline constexpr std::size_t kDigestSize = 32;
inline constexpr std::size_t kLeafSize = 1024 * 1024;

using Digest = std::array<std::uint8_t, kDigestSize>;

/**
 * @brief Two-level SHA-256 tree hash
 *
 * A part digest hashes 1 MiB leaves and folds them pairwise; a root digest
 * folds part digests the same way. When a level has an odd count the last
 * digest is carried up unchanged, never paired with itself. The remote store
 * computes the same tree, so the output must match it bit for bit.
 *
 * All functions are pure and safe to call from any thread.
 */
class TreeHasher {
public:
    static Digest leaf_digest(const std::uint8_t* data, std::size_t size);
    static Digest leaf_digest(const std::vector<std::uint8_t>& bytes);

    /// Hashes at most part_size_bound bytes of the input. Input must be non-empty.
    static Digest part_digest(const std::uint8_t* data,
                              std::size_t size,
                              std::size_t part_size_bound = std::numeric_limits<std::size_t>::max());
    static Digest part_digest(const std::vector<std::uint8_t>& bytes,
                              std::size_t part_size_bound = std::numeric_limits<std::size_t>::max());

    /// Folds part digests ordered by part index. An empty list yields SHA-256 of nothing.
    static Digest root_digest(const std::vector<Digest>& part_digests);

    static Digest combine(const Digest& left, const Digest& right);

private:
    static Digest fold(std::vector<Digest> level);
};

std::string to_hex(const Digest& digest);

/// Accepts upper or lower case; nullopt unless exactly 64 hex characters.
std::optional<Digest> from_hex(std::string_view hex);

/// True when the hex checksum reported by a remote decodes to the same digest.
bool matches_hex(const Digest& digest, std::string_view hex);

} // namespace archup::hash
