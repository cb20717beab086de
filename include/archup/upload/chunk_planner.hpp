#pragma once

#include "archup/core/result.hpp"
#include "archup/upload/types.hpp"

#include <cstdint>
#include <vector>

namespace archup::upload {

/**
 * @brief Outcome of planning one object
 *
 * When single_request is set the object goes up in one whole-object call
 * and parts is empty.
 */
struct PartPlan {
    bool single_request = false;
    std::uint64_t total_size = 0;
    std::uint64_t part_size = 0;
    std::uint64_t requested_part_size = 0;
    bool adjusted = false; ///< part_size was raised to stay within kMaxParts
    std::vector<Part> parts;

    [[nodiscard]] std::size_t num_parts() const noexcept { return parts.size(); }
};

class ChunkPlanner {
public:
    explicit ChunkPlanner(std::uint64_t single_request_threshold = kDefaultSingleRequestThreshold);

    /// Plans a fresh session from a part size given in MiB.
    archup::Result<PartPlan> plan(std::uint64_t total_size, std::uint64_t requested_part_size_mb) const;

    /// Plans against a part size fixed by an existing remote session. Never adjusts.
    archup::Result<PartPlan> plan_fixed(std::uint64_t total_size, std::uint64_t part_size_bytes) const;

    [[nodiscard]] std::uint64_t single_request_threshold() const noexcept { return single_request_threshold_; }

    static archup::Result<void> validate_part_size_mb(std::uint64_t part_size_mb);

    static bool is_power_of_two(std::uint64_t value) noexcept;

    static std::uint64_t count_parts(std::uint64_t total_size, std::uint64_t part_size) noexcept;

    static std::vector<Part> make_parts(std::uint64_t total_size, std::uint64_t part_size);

private:
    std::uint64_t single_request_threshold_;
};

} // namespace archup::upload
