#pragma once

#include "archup/core/result.hpp"
#include "archup/events/event_bus.hpp"
#include "archup/hash/tree_hash.hpp"
#include "archup/upload/local_source.hpp"
#include "archup/upload/remote_store.hpp"
#include "archup/upload/types.hpp"

#include <cstdint>
#include <vector>

namespace archup::upload {

struct OrchestratorOptions {
    std::size_t concurrency = default_concurrency();
    std::uint32_t max_attempts = kDefaultMaxAttempts;

    /// Available parallelism times five, at least one.
    static std::size_t default_concurrency();
};

struct UploadResult {
    hash::Digest root_digest{};
    ArchiveReceipt receipt;
    std::vector<std::uint32_t> uploaded; ///< Parts sent during this run, ascending
    bool recomputed = false;             ///< Digests were rebuilt from the source before completion
};

/**
 * @brief Uploads the unconfirmed parts of a session and commits it
 *
 * Pending parts are spread over a fixed pool of workers. Each worker reads
 * its range under the source lock, hashes it and sends it, retrying
 * transport errors and checksum disagreements up to max_attempts. The
 * first part to run out of attempts cancels every part that has not
 * finished yet; the session is left open and the error carries a
 * ResumePoint.
 *
 * When every part is confirmed, the part digests are folded in index order
 * into the root digest and the session is completed. A root checksum from
 * the store that does not match is an IntegrityViolation and is never
 * retried.
 */
class UploadOrchestrator {
public:
    UploadOrchestrator(RemoteStore& store, events::EventBus& bus, OrchestratorOptions options = {});

    /// parts holds the whole plan; Verified parts must carry their digest.
    archup::Result<UploadResult> run(const SessionDescriptor& session,
                                     std::vector<Part>& parts,
                                     SharedSource& source);

    [[nodiscard]] const OrchestratorOptions& options() const noexcept { return options_; }

private:
    struct RunState;

    void upload_part(const SessionDescriptor& session,
                     const Part& part,
                     std::size_t num_parts,
                     SharedSource& source,
                     RunState& state);

    void record_failure(const SessionDescriptor& session,
                        const Part& part,
                        std::uint32_t attempts,
                        const archup::Error& cause,
                        RunState& state);

    archup::Result<std::vector<hash::Digest>> recompute_digests(const std::vector<Part>& parts,
                                                                std::uint64_t part_size,
                                                                SharedSource& source) const;

    static ResumePoint make_resume_point(const SessionDescriptor& session, const std::vector<Part>& parts);

    RemoteStore& store_;
    events::EventBus& bus_;
    OrchestratorOptions options_;
};

} // namespace archup::upload
