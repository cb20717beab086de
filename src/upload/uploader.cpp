#include "archup/upload/uploader.hpp"
#include "archup/events/events.hpp"
#include "archup/upload/session.hpp"

#include <spdlog/spdlog.h>

namespace archup::upload {
namespace {

OrchestratorOptions make_options(const UploadConfig& config) {
    OrchestratorOptions options;
    if (config.concurrency > 0) {
        options.concurrency = config.concurrency;
    }
    options.max_attempts = config.max_attempts;
    return options;
}

archup::Error with_resume(archup::Error error, const SessionDescriptor& descriptor) {
    if (!error.resume.has_value()) {
        ResumePoint point;
        point.session_id = descriptor.session_id;
        point.vault_name = descriptor.vault_name;
        point.part_size = descriptor.part_size;
        point.total_size = descriptor.total_size;
        error.resume = std::move(point);
    }
    return error;
}

} // namespace

ArchiveUploader::ArchiveUploader(RemoteStore& store, events::EventBus& bus, UploadConfig config)
    : store_(store),
      bus_(bus),
      config_(std::move(config)),
      planner_(config_.single_request_threshold) {}

archup::Result<UploadOutcome> ArchiveUploader::upload(SharedSource& source,
                                                      const std::optional<std::string>& resume_session_id) {
    if (auto valid = config_.validate(); valid.is_error()) {
        return archup::Err<UploadOutcome>(valid.error());
    }

    const auto total_size = source.size();

    if (resume_session_id.has_value()) {
        spdlog::info("Resuming upload with id {}...", *resume_session_id);
        spdlog::info("Fetching already uploaded parts...");

        SessionDescriptor descriptor{*resume_session_id, config_.vault_name, 0, total_size};
        auto listing = fetch_all_parts(*resume_session_id);
        if (listing.is_error()) {
            return archup::Err<UploadOutcome>(with_resume(listing.error(), descriptor));
        }

        descriptor.part_size = listing.value().part_size;
        if (descriptor.part_size != config_.part_size_mb * kMiB) {
            spdlog::warn("Session {} uses part size {} bytes; ignoring configured {} MiB",
                         descriptor.session_id, descriptor.part_size, config_.part_size_mb);
        }

        auto plan = planner_.plan_fixed(total_size, descriptor.part_size);
        if (plan.is_error()) {
            return archup::Err<UploadOutcome>(with_resume(plan.error(), descriptor));
        }

        UploadSessionTracker tracker(descriptor, true);
        bus_.emit(events::SessionStartedEvent{descriptor.session_id, descriptor.vault_name, total_size,
                                              descriptor.part_size, plan.value().num_parts(), true});
        if (session_listener_) {
            session_listener_(descriptor);
        }

        if (auto res = tracker.transition_to(SessionState::Verifying); res.is_error()) {
            return archup::Err<UploadOutcome>(res.error());
        }
        auto report = verifier_.verify(source, listing.value().parts, plan.value().parts, descriptor.part_size);
        if (report.is_error()) {
            if (auto res = tracker.abandon(report.error().message); res.is_error()) {
                spdlog::warn("{}", res.error().message);
            }
            bus_.emit(events::SessionAbandonedEvent{descriptor.session_id, report.error().kind, report.error().message});
            return archup::Err<UploadOutcome>(with_resume(report.error(), descriptor));
        }

        const auto verified = report.value().verified.size();
        bus_.emit(events::PartsVerifiedEvent{descriptor.session_id, listing.value().parts.size(), verified,
                                             plan.value().num_parts() - verified});

        return run_session(tracker, std::move(plan.value()), source);
    }

    auto plan = planner_.plan(total_size, config_.part_size_mb);
    if (plan.is_error()) {
        return archup::Err<UploadOutcome>(plan.error());
    }

    if (plan.value().single_request) {
        return upload_single(source);
    }

    if (plan.value().adjusted) {
        if (!config_.allow_part_size_adjustment) {
            return archup::Err<UploadOutcome>(archup::Error(
                ErrorKind::InvalidConfig,
                "Part size of " + std::to_string(config_.part_size_mb) + " MiB needs more than " +
                    std::to_string(kMaxParts) + " parts; at least " +
                    std::to_string(plan.value().part_size / kMiB) + " MiB is required"));
        }
        spdlog::warn("Part size raised from {} MiB to {} MiB to stay within {} parts",
                     config_.part_size_mb, plan.value().part_size / kMiB, kMaxParts);
    }

    spdlog::info("Initiating multipart upload...");
    auto created = store_.create_session(config_.vault_name, config_.description, plan.value().part_size);
    if (created.is_error()) {
        return archup::Err<UploadOutcome>(created.error());
    }

    SessionDescriptor descriptor{created.value(), config_.vault_name, plan.value().part_size, total_size};
    spdlog::info("File size is {} bytes. Will upload in {} parts.", total_size, plan.value().num_parts());

    UploadSessionTracker tracker(descriptor, false);
    bus_.emit(events::SessionStartedEvent{descriptor.session_id, descriptor.vault_name, total_size,
                                          descriptor.part_size, plan.value().num_parts(), false});
    if (session_listener_) {
        session_listener_(descriptor);
    }

    return run_session(tracker, std::move(plan.value()), source);
}

archup::Result<UploadOutcome> ArchiveUploader::run_session(UploadSessionTracker& tracker,
                                                           PartPlan plan,
                                                           SharedSource& source) {
    const auto& descriptor = tracker.info().descriptor;
    if (auto res = tracker.transition_to(SessionState::Uploading); res.is_error()) {
        return archup::Err<UploadOutcome>(res.error());
    }

    std::size_t verified = 0;
    for (const auto& part : plan.parts) {
        if (part.state == PartState::Verified) {
            ++verified;
        }
    }

    UploadOrchestrator orchestrator(store_, bus_, make_options(config_));
    auto result = orchestrator.run(descriptor, plan.parts, source);
    if (result.is_error()) {
        auto error = with_resume(result.error(), descriptor);
        if (auto res = tracker.abandon(error.message); res.is_error()) {
            spdlog::warn("{}", res.error().message);
        }
        bus_.emit(events::SessionAbandonedEvent{descriptor.session_id, error.kind, error.message});
        return archup::Err<UploadOutcome>(std::move(error));
    }

    if (auto res = tracker.transition_to(SessionState::Completing); res.is_error()) {
        return archup::Err<UploadOutcome>(res.error());
    }
    if (auto res = tracker.transition_to(SessionState::Committed); res.is_error()) {
        return archup::Err<UploadOutcome>(res.error());
    }

    const auto& upload_result = result.value();
    bus_.emit(events::SessionCompletedEvent{descriptor.session_id, upload_result.receipt.archive_id,
                                            upload_result.receipt.checksum, descriptor.total_size,
                                            tracker.elapsed()});

    UploadOutcome outcome;
    outcome.session = descriptor;
    outcome.root_digest = upload_result.root_digest;
    outcome.receipt = upload_result.receipt;
    outcome.parts_verified = verified;
    outcome.parts_uploaded = upload_result.uploaded.size();
    outcome.part_size_adjusted = plan.adjusted;
    outcome.recomputed = upload_result.recomputed;
    return archup::Ok(std::move(outcome));
}

archup::Result<UploadOutcome> ArchiveUploader::upload_single(SharedSource& source) {
    spdlog::info("File size is less than {} bytes. Uploading in one request...", config_.single_request_threshold);

    auto bytes = source.read_range(0, static_cast<std::size_t>(source.size()));
    if (bytes.is_error()) {
        return archup::Err<UploadOutcome>(bytes.error());
    }

    const auto digest = hash::TreeHasher::part_digest(bytes.value());
    auto receipt = store_.upload_whole(config_.vault_name, config_.description, bytes.value());
    if (receipt.is_error()) {
        return archup::Err<UploadOutcome>(receipt.error());
    }

    if (!hash::matches_hex(digest, receipt.value().checksum)) {
        return archup::Err<UploadOutcome>(archup::Error(
            ErrorKind::IntegrityViolation,
            "Remote tree hash " + receipt.value().checksum + " does not match calculated " + hash::to_hex(digest)));
    }

    UploadOutcome outcome;
    outcome.single_request = true;
    outcome.session.vault_name = config_.vault_name;
    outcome.session.total_size = source.size();
    outcome.root_digest = digest;
    outcome.receipt = receipt.value();
    return archup::Ok(std::move(outcome));
}

archup::Result<PartListing> ArchiveUploader::fetch_all_parts(const std::string& session_id) {
    auto first = store_.list_session_parts(config_.vault_name, session_id, std::nullopt);
    if (first.is_error()) {
        return first;
    }

    PartListing listing = std::move(first.value());
    auto marker = listing.next_marker;
    while (marker.has_value()) {
        spdlog::debug("Getting more parts...");
        auto page = store_.list_session_parts(config_.vault_name, session_id, marker);
        if (page.is_error()) {
            return page;
        }
        auto& parts = page.value().parts;
        listing.parts.insert(listing.parts.end(), parts.begin(), parts.end());
        marker = page.value().next_marker;
    }
    listing.next_marker.reset();
    return archup::Ok(std::move(listing));
}

} // namespace archup::upload
