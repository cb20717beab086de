#include "archup/upload/resume_verifier.hpp"

#include <spdlog/spdlog.h>

namespace archup::upload {

archup::Result<VerificationReport> ResumeVerifier::verify(SharedSource& source,
                                                          const std::vector<RemotePart>& remote_parts,
                                                          std::vector<Part>& parts,
                                                          std::uint64_t part_size) const {
    VerificationReport report;
    if (part_size == 0) {
        return archup::Err<VerificationReport>(archup::Error(ErrorKind::InvalidConfig, "Part size must be > 0"));
    }

    for (const auto& remote : remote_parts) {
        if (remote.start % part_size != 0) {
            spdlog::warn("Remote part at offset {} is not aligned to part size {}, ignoring", remote.start, part_size);
            ++report.ignored;
            continue;
        }

        const auto index = remote.start / part_size;
        if (index >= parts.size()) {
            spdlog::warn("Remote part at offset {} lies beyond the local source, ignoring", remote.start);
            ++report.ignored;
            continue;
        }

        auto& part = parts[static_cast<std::size_t>(index)];
        if (part.state == PartState::Verified) {
            continue;
        }

        auto bytes = source.read_range(part.range.start, static_cast<std::size_t>(part.range.length()));
        if (bytes.is_error()) {
            return archup::Err<VerificationReport>(bytes.error());
        }

        const auto digest = hash::TreeHasher::part_digest(bytes.value(), static_cast<std::size_t>(part_size));
        if (remote.end == part.range.end && hash::matches_hex(digest, remote.checksum)) {
            part.state = PartState::Verified;
            part.checksum = digest;
            report.verified.push_back(part.index);
        } else {
            spdlog::debug("Part {} checksum differs from remote copy, will re-upload", part.index + 1);
            report.stale.push_back(part.index);
        }
    }

    return archup::Ok(std::move(report));
}

} // namespace archup::upload
