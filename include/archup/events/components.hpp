/**
 * @file components.hpp
 * @brief Subscribers that turn upload events into logs and counters
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // run an upload, then
 * metrics.print_stats();
 */

#pragma once

#include "archup/events/event_bus.hpp"
#include "archup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>

namespace archup::events {

/**
 * @brief Logs every upload event through spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<SessionStartedEvent>([this](const SessionStartedEvent& e) {
            on_session_started(e);
        });

        bus_.subscribe<PartsVerifiedEvent>([this](const PartsVerifiedEvent& e) {
            on_parts_verified(e);
        });

        bus_.subscribe<PartUploadedEvent>([this](const PartUploadedEvent& e) {
            on_part_uploaded(e);
        });

        bus_.subscribe<PartRetryEvent>([this](const PartRetryEvent& e) {
            on_part_retry(e);
        });

        bus_.subscribe<PartFailedEvent>([this](const PartFailedEvent& e) {
            on_part_failed(e);
        });

        bus_.subscribe<SessionCompletedEvent>([this](const SessionCompletedEvent& e) {
            on_session_completed(e);
        });

        bus_.subscribe<SessionAbandonedEvent>([this](const SessionAbandonedEvent& e) {
            on_session_abandoned(e);
        });
    }

private:
    void on_session_started(const SessionStartedEvent& e) {
        spdlog::info("[SessionStarted] session={} vault={} bytes={} part_size={} parts={}{}",
                     e.session_id, e.vault_name, e.total_size, e.part_size, e.num_parts,
                     e.resumed ? " (resumed)" : "");
    }

    void on_parts_verified(const PartsVerifiedEvent& e) {
        spdlog::info("[PartsVerified] session={} reported={} verified={} pending={}",
                     e.session_id, e.reported, e.verified, e.pending);
    }

    void on_part_uploaded(const PartUploadedEvent& e) {
        const double percentage = e.num_parts == 0
            ? 100.0
            : 100.0 * static_cast<double>(e.part_index + 1) / static_cast<double>(e.num_parts);
        spdlog::info("[PartUploaded] session={} part {} of {} ({:.2f}%) bytes={} attempts={}",
                     e.session_id, e.part_index + 1, e.num_parts, percentage, e.bytes, e.attempts);
    }

    void on_part_retry(const PartRetryEvent& e) {
        spdlog::warn("[PartRetry] session={} part={} attempt={} cause={} error={}",
                     e.session_id, e.part_index + 1, e.attempt, to_string(e.cause), e.message);
    }

    void on_part_failed(const PartFailedEvent& e) {
        spdlog::error("[PartFailed] session={} part={} attempts={} error={}",
                      e.session_id, e.part_index + 1, e.attempts, e.message);
    }

    void on_session_completed(const SessionCompletedEvent& e) {
        spdlog::info("[SessionCompleted] session={} archive={} tree_hash={} bytes={} duration={}ms",
                     e.session_id, e.archive_id, e.root_checksum, e.total_size, e.duration.count());
    }

    void on_session_abandoned(const SessionAbandonedEvent& e) {
        spdlog::error("[SessionAbandoned] session={} reason={} error={} (upload can be resumed)",
                      e.session_id, to_string(e.reason), e.message);
    }

    EventBus& bus_;
};

/**
 * @brief Counts parts and bytes for the end-of-run summary
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> sessions_started{0};
        std::atomic<uint64_t> sessions_completed{0};
        std::atomic<uint64_t> sessions_abandoned{0};
        std::atomic<uint64_t> parts_verified{0};
        std::atomic<uint64_t> parts_uploaded{0};
        std::atomic<uint64_t> parts_failed{0};
        std::atomic<uint64_t> retries{0};
        std::atomic<uint64_t> bytes_uploaded{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<SessionStartedEvent>([this](const SessionStartedEvent&) {
            stats_.sessions_started++;
        });

        bus_.subscribe<PartsVerifiedEvent>([this](const PartsVerifiedEvent& e) {
            stats_.parts_verified += e.verified;
        });

        bus_.subscribe<PartUploadedEvent>([this](const PartUploadedEvent& e) {
            stats_.parts_uploaded++;
            stats_.bytes_uploaded += e.bytes;
        });

        bus_.subscribe<PartRetryEvent>([this](const PartRetryEvent&) {
            stats_.retries++;
        });

        bus_.subscribe<PartFailedEvent>([this](const PartFailedEvent&) {
            stats_.parts_failed++;
        });

        bus_.subscribe<SessionCompletedEvent>([this](const SessionCompletedEvent&) {
            stats_.sessions_completed++;
        });

        bus_.subscribe<SessionAbandonedEvent>([this](const SessionAbandonedEvent&) {
            stats_.sessions_abandoned++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Parts verified:  {}", stats_.parts_verified.load());
        spdlog::info("  Parts uploaded:  {}", stats_.parts_uploaded.load());
        spdlog::info("  Parts failed:    {}", stats_.parts_failed.load());
        spdlog::info("  Retries:         {}", stats_.retries.load());
        spdlog::info("  Bytes uploaded:  {}", stats_.bytes_uploaded.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace archup::events
