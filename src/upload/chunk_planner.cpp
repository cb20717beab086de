#include "archup/upload/chunk_planner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace archup::upload {

ChunkPlanner::ChunkPlanner(std::uint64_t single_request_threshold)
    : single_request_threshold_(single_request_threshold) {}

archup::Result<PartPlan> ChunkPlanner::plan(std::uint64_t total_size, std::uint64_t requested_part_size_mb) const {
    if (auto valid = validate_part_size_mb(requested_part_size_mb); valid.is_error()) {
        return archup::Err<PartPlan>(valid.error());
    }

    PartPlan plan;
    plan.total_size = total_size;
    plan.requested_part_size = requested_part_size_mb * kMiB;
    plan.part_size = plan.requested_part_size;

    if (total_size < single_request_threshold_) {
        plan.single_request = true;
        return archup::Ok(std::move(plan));
    }

    if (count_parts(total_size, plan.part_size) > kMaxParts) {
        std::uint64_t candidate = kMinPartSize;
        while (candidate <= kMaxPartSize && count_parts(total_size, candidate) > kMaxParts) {
            candidate *= 2;
        }
        if (candidate > kMaxPartSize) {
            return archup::Err<PartPlan>(archup::Error(
                ErrorKind::SizeExceedsLimit,
                "Object of " + std::to_string(total_size) + " bytes needs more than " +
                    std::to_string(kMaxParts) + " parts even at " + std::to_string(kMaxPartSizeMb) + " MiB"));
        }
        spdlog::debug("Part size {} MiB gives {} parts, raising to {} MiB",
                      requested_part_size_mb, count_parts(total_size, plan.part_size), candidate / kMiB);
        plan.part_size = candidate;
        plan.adjusted = true;
    }

    plan.parts = make_parts(total_size, plan.part_size);
    return archup::Ok(std::move(plan));
}

archup::Result<PartPlan> ChunkPlanner::plan_fixed(std::uint64_t total_size, std::uint64_t part_size_bytes) const {
    if (part_size_bytes % kMiB != 0) {
        return archup::Err<PartPlan>(archup::Error(
            ErrorKind::InvalidConfig,
            "Session part size " + std::to_string(part_size_bytes) + " is not a whole number of MiB"));
    }
    if (auto valid = validate_part_size_mb(part_size_bytes / kMiB); valid.is_error()) {
        return archup::Err<PartPlan>(valid.error());
    }
    if (total_size == 0) {
        return archup::Err<PartPlan>(archup::Error(ErrorKind::InvalidConfig, "Cannot plan parts for an empty object"));
    }
    if (count_parts(total_size, part_size_bytes) > kMaxParts) {
        return archup::Err<PartPlan>(archup::Error(
            ErrorKind::SizeExceedsLimit,
            "Object of " + std::to_string(total_size) + " bytes needs more than " +
                std::to_string(kMaxParts) + " parts at the session part size"));
    }

    PartPlan plan;
    plan.total_size = total_size;
    plan.part_size = part_size_bytes;
    plan.requested_part_size = part_size_bytes;
    plan.parts = make_parts(total_size, part_size_bytes);
    return archup::Ok(std::move(plan));
}

archup::Result<void> ChunkPlanner::validate_part_size_mb(std::uint64_t part_size_mb) {
    if (!is_power_of_two(part_size_mb)) {
        return archup::Err<void>(archup::Error(
            ErrorKind::InvalidConfig, "Part size must be a power of 2, got " + std::to_string(part_size_mb) + " MiB"));
    }
    if (part_size_mb < kMinPartSizeMb || part_size_mb > kMaxPartSizeMb) {
        return archup::Err<void>(archup::Error(
            ErrorKind::InvalidConfig, "Part size must be between 1 MiB and 4096 MiB, got " +
                                          std::to_string(part_size_mb) + " MiB"));
    }
    return archup::Ok();
}

bool ChunkPlanner::is_power_of_two(std::uint64_t value) noexcept {
    return value != 0 && (value & (value - 1)) == 0;
}

std::uint64_t ChunkPlanner::count_parts(std::uint64_t total_size, std::uint64_t part_size) noexcept {
    return (total_size + part_size - 1) / part_size;
}

std::vector<Part> ChunkPlanner::make_parts(std::uint64_t total_size, std::uint64_t part_size) {
    std::vector<Part> parts;
    parts.reserve(static_cast<std::size_t>(count_parts(total_size, part_size)));

    std::uint32_t index = 0;
    for (std::uint64_t start = 0; start < total_size; start += part_size, ++index) {
        Part part;
        part.index = index;
        part.range.start = start;
        part.range.end = std::min(start + part_size, total_size) - 1;
        part.range.total = total_size;
        parts.push_back(part);
    }
    return parts;
}

} // namespace archup::upload
