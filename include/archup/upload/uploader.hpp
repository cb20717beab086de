#pragma once

#include "archup/core/config.hpp"
#include "archup/core/result.hpp"
#include "archup/events/event_bus.hpp"
#include "archup/upload/chunk_planner.hpp"
#include "archup/upload/local_source.hpp"
#include "archup/upload/orchestrator.hpp"
#include "archup/upload/remote_store.hpp"
#include "archup/upload/resume_verifier.hpp"
#include "archup/upload/session.hpp"

#include <functional>
#include <optional>
#include <string>

namespace archup::upload {

struct UploadOutcome {
    bool single_request = false;
    SessionDescriptor session;   ///< Empty session_id on the single-request path
    hash::Digest root_digest{};
    ArchiveReceipt receipt;
    std::size_t parts_verified = 0;
    std::size_t parts_uploaded = 0;
    bool part_size_adjusted = false;
    bool recomputed = false;
};

/**
 * @brief Runs one archive upload end to end
 *
 * Plans the object, opens or re-attaches to a session, verifies what the
 * store already holds when resuming, and hands the rest to the
 * orchestrator. Objects under the single-request threshold skip the
 * session entirely.
 *
 * On resume the part size is taken from the remote session; the
 * configured value is only used for fresh sessions.
 */
class ArchiveUploader {
public:
    using SessionListener = std::function<void(const SessionDescriptor&)>;

    ArchiveUploader(RemoteStore& store, events::EventBus& bus, UploadConfig config);

    /// Called once the session id is known, before any part is sent.
    void set_session_listener(SessionListener listener) { session_listener_ = std::move(listener); }

    archup::Result<UploadOutcome> upload(SharedSource& source,
                                         const std::optional<std::string>& resume_session_id = std::nullopt);

    [[nodiscard]] const UploadConfig& config() const noexcept { return config_; }

private:
    archup::Result<UploadOutcome> upload_single(SharedSource& source);

    archup::Result<PartListing> fetch_all_parts(const std::string& session_id);

    archup::Result<UploadOutcome> run_session(UploadSessionTracker& tracker,
                                              PartPlan plan,
                                              SharedSource& source);

    RemoteStore& store_;
    events::EventBus& bus_;
    UploadConfig config_;
    ChunkPlanner planner_;
    ResumeVerifier verifier_;
    SessionListener session_listener_;
};

} // namespace archup::upload
