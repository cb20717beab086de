#include "archup/upload/orchestrator.hpp"
#include "archup/events/events.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <optional>
#include <thread>

namespace archup::upload {

struct UploadOrchestrator::RunState {
    std::atomic<bool> cancelled{false};

    std::mutex mutex;
    std::optional<archup::Error> failure;
    std::optional<std::uint32_t> failed_part;
    std::vector<std::optional<hash::Digest>> digests; ///< Written once per index
    std::vector<std::uint32_t> attempts;
};

std::size_t OrchestratorOptions::default_concurrency() {
    const auto cpus = std::thread::hardware_concurrency();
    return std::max<std::size_t>(1, static_cast<std::size_t>(cpus) * 5);
}

UploadOrchestrator::UploadOrchestrator(RemoteStore& store, events::EventBus& bus, OrchestratorOptions options)
    : store_(store), bus_(bus), options_(options) {
    if (options_.concurrency == 0) {
        options_.concurrency = 1;
    }
    if (options_.max_attempts == 0) {
        options_.max_attempts = 1;
    }
}

archup::Result<UploadResult> UploadOrchestrator::run(const SessionDescriptor& session,
                                                     std::vector<Part>& parts,
                                                     SharedSource& source) {
    if (parts.empty()) {
        return archup::Err<UploadResult>(archup::Error(ErrorKind::InvalidConfig, "Session has no parts to upload"));
    }

    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].index != i) {
            return archup::Err<UploadResult>(archup::Error(
                ErrorKind::InvalidConfig, "Part list is not ordered by index at position " + std::to_string(i)));
        }
    }

    for (const auto& part : parts) {
        if (part.state == PartState::Failed) {
            return archup::Err<UploadResult>(archup::Error(
                ErrorKind::UploadFailed,
                "Part " + std::to_string(part.index + 1) + " already failed in this session",
                make_resume_point(session, parts)));
        }
    }

    RunState state;
    state.digests.resize(parts.size());
    state.attempts.assign(parts.size(), 0);

    std::vector<std::size_t> pending;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        const auto& part = parts[i];
        if (part.confirmed() && part.checksum.has_value()) {
            state.digests[i] = part.checksum;
        } else if (part.state == PartState::Pending) {
            pending.push_back(i);
        }
    }

    if (!pending.empty()) {
        const auto width = std::min(options_.concurrency, pending.size());
        spdlog::debug("Uploading {} of {} parts with {} workers", pending.size(), parts.size(), width);

        boost::asio::thread_pool pool(width);
        for (const auto index : pending) {
            boost::asio::post(pool, [this, &session, &parts, &source, &state, index]() {
                upload_part(session, parts[index], parts.size(), source, state);
            });
        }
        pool.join();
    }

    UploadResult result;
    for (const auto index : pending) {
        auto& part = parts[index];
        if (state.digests[index].has_value()) {
            part.state = PartState::Uploaded;
            part.checksum = state.digests[index];
            result.uploaded.push_back(part.index);
        } else if (state.failed_part == part.index) {
            part.state = PartState::Failed;
        }
        spdlog::trace("Part {} of {}: {} after {} attempts", part.index + 1, parts.size(),
                      to_string(part.state), state.attempts[index]);
    }

    if (state.failure.has_value()) {
        return archup::Err<UploadResult>(archup::Error(
            ErrorKind::UploadFailed, state.failure->message, make_resume_point(session, parts)));
    }

    for (const auto& part : parts) {
        if (!part.confirmed()) {
            return archup::Err<UploadResult>(archup::Error(
                ErrorKind::UploadFailed,
                "Part " + std::to_string(part.index + 1) + " is not confirmed remotely; refusing to complete",
                make_resume_point(session, parts)));
        }
    }

    // Every part is confirmed here; a missing digest is a bookkeeping gap only
    std::vector<hash::Digest> ordered;
    ordered.reserve(parts.size());
    for (const auto& digest : state.digests) {
        if (!digest.has_value()) {
            break;
        }
        ordered.push_back(*digest);
    }

    if (ordered.size() != parts.size()) {
        spdlog::warn("List of part checksums incomplete ({} of {}). Recalculating from source...",
                     ordered.size(), parts.size());
        auto recomputed = recompute_digests(parts, session.part_size, source);
        if (recomputed.is_error()) {
            return archup::Err<UploadResult>(recomputed.error());
        }
        ordered = std::move(recomputed.value());
        result.recomputed = true;
    }

    result.root_digest = hash::TreeHasher::root_digest(ordered);
    const auto root_hex = hash::to_hex(result.root_digest);

    spdlog::info("Completing multipart upload {}...", session.session_id);
    auto completed = store_.complete_session(session.vault_name, session.session_id, session.total_size, root_hex);
    if (completed.is_error()) {
        auto error = completed.error();
        error.resume = make_resume_point(session, parts);
        return archup::Err<UploadResult>(std::move(error));
    }

    result.receipt = completed.value();
    if (!hash::matches_hex(result.root_digest, result.receipt.checksum)) {
        return archup::Err<UploadResult>(archup::Error(
            ErrorKind::IntegrityViolation,
            "Remote root tree hash " + result.receipt.checksum + " does not match calculated " + root_hex,
            make_resume_point(session, parts)));
    }

    return archup::Ok(std::move(result));
}

void UploadOrchestrator::upload_part(const SessionDescriptor& session,
                                     const Part& part,
                                     std::size_t num_parts,
                                     SharedSource& source,
                                     RunState& state) {
    if (state.cancelled.load()) {
        return;
    }

    try {
        auto bytes = source.read_range(part.range.start, static_cast<std::size_t>(part.range.length()));
        if (bytes.is_error()) {
            record_failure(session, part, 0, bytes.error(), state);
            return;
        }

        hash::Digest digest;
        try {
            digest = hash::TreeHasher::part_digest(bytes.value(), static_cast<std::size_t>(session.part_size));
        } catch (const std::exception& e) {
            record_failure(session, part, 0, archup::Error(ErrorKind::Io, std::string("Hashing failed: ") + e.what()),
                           state);
            return;
        }

        archup::Error last_error;
        std::uint32_t attempt = 1;
        for (; attempt <= options_.max_attempts; ++attempt) {
            if (state.cancelled.load()) {
                return;
            }
            state.attempts[part.index] = attempt;

            auto response = store_.upload_part(session.vault_name, session.session_id, part.range, bytes.value());
            if (response.is_ok()) {
                if (hash::matches_hex(digest, response.value())) {
                    {
                        std::lock_guard lock(state.mutex);
                        if (!state.digests[part.index].has_value()) {
                            state.digests[part.index] = digest;
                        }
                    }
                    bus_.emit(events::PartUploadedEvent{session.session_id, part.index, num_parts,
                                                        part.range.length(), attempt});
                    return;
                }
                last_error = archup::Error(ErrorKind::ChecksumMismatch,
                                           "Part " + std::to_string(part.index + 1) + " checksum mismatch: local " +
                                               hash::to_hex(digest) + ", remote " + response.value());
            } else {
                last_error = response.error();
                if (!last_error.is_retryable()) {
                    break;
                }
            }

            if (attempt < options_.max_attempts) {
                bus_.emit(events::PartRetryEvent{session.session_id, part.index, attempt,
                                                 last_error.kind, last_error.message});
            }
        }

        record_failure(session, part, std::min(attempt, options_.max_attempts), last_error, state);
    } catch (const std::exception& e) {
        record_failure(session, part, state.attempts[part.index],
                       archup::Error(ErrorKind::Transport, std::string("Unexpected exception: ") + e.what()), state);
    }
}

void UploadOrchestrator::record_failure(const SessionDescriptor& session,
                                        const Part& part,
                                        std::uint32_t attempts,
                                        const archup::Error& cause,
                                        RunState& state) {
    {
        std::lock_guard lock(state.mutex);
        if (!state.failure.has_value()) {
            state.failure = archup::Error(
                ErrorKind::UploadFailed,
                "Part " + std::to_string(part.index + 1) + " failed after " + std::to_string(attempts) +
                    " attempts: " + cause.describe());
            state.failed_part = part.index;
        }
    }
    state.cancelled.store(true);
    bus_.emit(events::PartFailedEvent{session.session_id, part.index, attempts, cause.describe()});
}

archup::Result<std::vector<hash::Digest>> UploadOrchestrator::recompute_digests(const std::vector<Part>& parts,
                                                                                std::uint64_t part_size,
                                                                                SharedSource& source) const {
    std::vector<hash::Digest> digests;
    digests.reserve(parts.size());
    for (const auto& part : parts) {
        spdlog::debug("Checksum {} of {}...", part.index + 1, parts.size());
        auto bytes = source.read_range(part.range.start, static_cast<std::size_t>(part.range.length()));
        if (bytes.is_error()) {
            return archup::Err<std::vector<hash::Digest>>(bytes.error());
        }
        digests.push_back(hash::TreeHasher::part_digest(bytes.value(), static_cast<std::size_t>(part_size)));
    }
    return archup::Ok(std::move(digests));
}

ResumePoint UploadOrchestrator::make_resume_point(const SessionDescriptor& session, const std::vector<Part>& parts) {
    ResumePoint point;
    point.session_id = session.session_id;
    point.vault_name = session.vault_name;
    point.part_size = session.part_size;
    point.total_size = session.total_size;
    for (const auto& part : parts) {
        if (part.confirmed()) {
            point.confirmed_parts.push_back(part.index);
        }
    }
    return point;
}

} // namespace archup::upload
