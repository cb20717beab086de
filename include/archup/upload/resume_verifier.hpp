#pragma once

#include "archup/core/result.hpp"
#include "archup/upload/local_source.hpp"
#include "archup/upload/types.hpp"

#include <cstdint>
#include <vector>

namespace archup::upload {

struct VerificationReport {
    std::vector<std::uint32_t> verified; ///< Remote copy matches the local bytes
    std::vector<std::uint32_t> stale;    ///< Reported but mismatched, will be re-uploaded
    std::size_t ignored = 0;             ///< Reported ranges that map to no local part
};

/**
 * @brief Classifies remotely reported parts against the local source
 *
 * Read-only towards the store. Matching parts become Verified with their
 * digest recorded; everything else is left Pending.
 */
class ResumeVerifier {
public:
    archup::Result<VerificationReport> verify(SharedSource& source,
                                              const std::vector<RemotePart>& remote_parts,
                                              std::vector<Part>& parts,
                                              std::uint64_t part_size) const;
};

} // namespace archup::upload
