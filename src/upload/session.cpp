#include "archup/upload/session.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace archup::upload {
namespace {

bool is_progressive(SessionState current, SessionState target) {
    static const std::unordered_map<SessionState, std::vector<SessionState>> transitions {
        {SessionState::Created, {SessionState::Verifying, SessionState::Uploading}},
        {SessionState::Verifying, {SessionState::Uploading}},
        {SessionState::Uploading, {SessionState::Completing}},
        {SessionState::Completing, {SessionState::Committed}},
    };

    if (target == SessionState::Abandoned) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), target) != allowed.end();
}

} // namespace

UploadSessionTracker::UploadSessionTracker(SessionDescriptor descriptor, bool resumed) {
    info_.descriptor = std::move(descriptor);
    info_.resumed = resumed;
    info_.started_at = std::chrono::system_clock::now();
    info_.state = SessionState::Created;
    started_ = std::chrono::steady_clock::now();
}

archup::Result<void> UploadSessionTracker::transition_to(SessionState next_state) {
    if (!can_transition(next_state)) {
        return archup::Err<void>(archup::Error(
            ErrorKind::InvalidConfig,
            std::string("Illegal session state transition ") + to_string(info_.state) + " -> " + to_string(next_state)));
    }
    info_.state = next_state;
    return archup::Ok();
}

archup::Result<void> UploadSessionTracker::abandon(std::string error_message) {
    if (auto res = transition_to(SessionState::Abandoned); res.is_error()) {
        return res;
    }
    info_.last_error = std::move(error_message);
    return archup::Ok();
}

std::chrono::milliseconds UploadSessionTracker::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_);
}

bool UploadSessionTracker::can_transition(SessionState target) const noexcept {
    if (closed()) {
        return false;
    }
    return is_progressive(info_.state, target);
}

const char* to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Created: return "Created";
        case SessionState::Verifying: return "Verifying";
        case SessionState::Uploading: return "Uploading";
        case SessionState::Completing: return "Completing";
        case SessionState::Committed: return "Committed";
        case SessionState::Abandoned: return "Abandoned";
    }
    return "Unknown";
}

} // namespace archup::upload
