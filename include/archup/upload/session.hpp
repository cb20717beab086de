#pragma once

#include "archup/core/result.hpp"
#include "archup/upload/types.hpp"

#include <chrono>
#include <string>

namespace archup::upload {

enum class SessionState {
    Created,
    Verifying,
    Uploading,
    Completing,
    Committed,
    Abandoned
};

struct UploadSessionInfo {
    SessionDescriptor descriptor;
    bool resumed = false;
    std::chrono::system_clock::time_point started_at{};
    SessionState state = SessionState::Created;
    std::string last_error; ///< Populated when state == Abandoned
};

/**
 * @brief Lifecycle of one multipart session within this process
 *
 * Created -> [Verifying] -> Uploading -> Completing -> Committed, with
 * Abandoned reachable from any non-terminal state. Committed and
 * Abandoned are terminal, so a session closes exactly once.
 */
class UploadSessionTracker {
public:
    UploadSessionTracker(SessionDescriptor descriptor, bool resumed);

    [[nodiscard]] const std::string& session_id() const noexcept { return info_.descriptor.session_id; }
    [[nodiscard]] SessionState state() const noexcept { return info_.state; }
    [[nodiscard]] const UploadSessionInfo& info() const noexcept { return info_; }
    [[nodiscard]] bool closed() const noexcept {
        return info_.state == SessionState::Committed || info_.state == SessionState::Abandoned;
    }

    archup::Result<void> transition_to(SessionState next_state);
    archup::Result<void> abandon(std::string error_message);

    [[nodiscard]] std::chrono::milliseconds elapsed() const;

private:
    [[nodiscard]] bool can_transition(SessionState target) const noexcept;

    UploadSessionInfo info_;
    std::chrono::steady_clock::time_point started_{};
};

const char* to_string(SessionState state) noexcept;

} // namespace archup::upload
