/**
 * @file events.hpp
 * @brief Events published while an archive is uploaded
 *
 * NAMING CONVENTION:
 * Events are past-tense: PartUploadedEvent, SessionCompletedEvent
 *
 * WHO EMITS:
 * - ArchiveUploader (session lifecycle)
 * - UploadOrchestrator (per-part progress, from worker threads)
 *
 * WHO SUBSCRIBES:
 * - LoggerComponent (progress lines)
 * - MetricsComponent (counters)
 */

#pragma once

#include "archup/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace archup::events {

// ════════════════════════════════════════════════════════
// Session Events
// ════════════════════════════════════════════════════════

struct SessionStartedEvent {
    std::string session_id;
    std::string vault_name;
    std::uint64_t total_size = 0;
    std::uint64_t part_size = 0;
    std::size_t num_parts = 0;
    bool resumed = false;
};

/**
 * @brief Emitted after remote parts were checked against the local source
 */
struct PartsVerifiedEvent {
    std::string session_id;
    std::size_t reported = 0; ///< Parts the store listed
    std::size_t verified = 0; ///< Of those, parts whose digest matched
    std::size_t pending = 0;  ///< Parts left to upload
};

struct SessionCompletedEvent {
    std::string session_id;
    std::string archive_id;
    std::string root_checksum;
    std::uint64_t total_size = 0;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted when a session is left open after a failure
 *
 * The session stays resumable with session_id.
 */
struct SessionAbandonedEvent {
    std::string session_id;
    ErrorKind reason = ErrorKind::UploadFailed;
    std::string message;
};

// ════════════════════════════════════════════════════════
// Part Events
// ════════════════════════════════════════════════════════

struct PartUploadedEvent {
    std::string session_id;
    std::uint32_t part_index = 0;
    std::size_t num_parts = 0;
    std::uint64_t bytes = 0;
    std::uint32_t attempts = 0;
};

struct PartRetryEvent {
    std::string session_id;
    std::uint32_t part_index = 0;
    std::uint32_t attempt = 0; ///< Attempt that just failed, 1-based
    ErrorKind cause = ErrorKind::Transport;
    std::string message;
};

struct PartFailedEvent {
    std::string session_id;
    std::uint32_t part_index = 0;
    std::uint32_t attempts = 0;
    std::string message;
};

} // namespace archup::events
