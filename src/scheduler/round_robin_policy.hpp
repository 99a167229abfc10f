/**
 * @file round_robin_policy.hpp
 * @brief Round-robin scheduling policy: rotates through the candidate list.
 */

#pragma once

#include "core/concepts.hpp"
#include "scheduler/scheduler.hpp"

#include <span>
#include <string_view>

namespace ledger_scheduler {

/**
 * @brief Picks the first admissible VM at or after a persistent cursor.
 *
 * The cursor resets to 0 whenever the candidate count changes. A failed
 * scan leaves the cursor where it started.
 */
class RoundRobinPolicy {
public:
    ScheduleOutcome schedule(const Task& task, std::span<const VirtualMachine> candidates);

    [[nodiscard]] static constexpr std::string_view name() noexcept { return "roundrobin"; }

    [[nodiscard]] size_t cursor() const noexcept { return cursor_; }

private:
    size_t cursor_{0};
    size_t last_count_{0};
};

static_assert(SchedulingPolicyLike<RoundRobinPolicy>);

}  // namespace ledger_scheduler
