#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace archup {

enum class ErrorKind {
    InvalidConfig,      ///< Rejected before any remote call
    SizeExceedsLimit,   ///< No valid part size can hold the object
    Transport,          ///< Network or service failure on one remote call
    NotFound,           ///< Unknown vault or session
    ChecksumMismatch,   ///< Local and remote digest of one part disagree
    UploadFailed,       ///< A part exhausted its attempts; session stays resumable
    IntegrityViolation, ///< Root digest disagreement at completion
    Io                  ///< Local source could not be opened or read
};

/**
 * @brief Everything a caller needs to re-attach to an unfinished session
 */
struct ResumePoint {
    std::string session_id;
    std::string vault_name;
    std::uint64_t part_size = 0;
    std::uint64_t total_size = 0;
    std::vector<std::uint32_t> confirmed_parts; ///< Part indices known good remotely
};

struct Error {
    ErrorKind kind = ErrorKind::Transport;
    std::string message;
    std::optional<ResumePoint> resume;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}
    Error(ErrorKind k, std::string msg, ResumePoint point)
        : kind(k), message(std::move(msg)), resume(std::move(point)) {}

    [[nodiscard]] bool is_retryable() const noexcept;
    [[nodiscard]] std::string describe() const;
};

const char* to_string(ErrorKind kind) noexcept;

} // namespace archup
