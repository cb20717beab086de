#include "archup/core/error.hpp"

namespace archup {

bool Error::is_retryable() const noexcept {
    return kind == ErrorKind::Transport || kind == ErrorKind::ChecksumMismatch;
}

std::string Error::describe() const {
    std::string text = std::string(to_string(kind)) + ": " + message;
    if (resume.has_value()) {
        text += " (session " + resume->session_id + ")";
    }
    return text;
}

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidConfig: return "InvalidConfig";
        case ErrorKind::SizeExceedsLimit: return "SizeExceedsLimit";
        case ErrorKind::Transport: return "Transport";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::ChecksumMismatch: return "ChecksumMismatch";
        case ErrorKind::UploadFailed: return "UploadFailed";
        case ErrorKind::IntegrityViolation: return "IntegrityViolation";
        case ErrorKind::Io: return "Io";
    }
    return "Unknown";
}

} // namespace archup
