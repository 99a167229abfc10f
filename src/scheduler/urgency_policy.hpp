/**
 * @file urgency_policy.hpp
 * @brief Urgency-aware scheduling policy: earliest deadline, lightest VM.
 */

#pragma once

#include "core/concepts.hpp"
#include "scheduler/scheduler.hpp"

#include <span>
#include <string_view>

namespace ledger_scheduler {

class UrgencyAwarePolicy {
public:
    /// Weight of the VM load score relative to the deadline (in seconds).
    static constexpr double kLoadWeight = 5.0;

    ScheduleOutcome schedule(const Task& task, std::span<const VirtualMachine> candidates);

    [[nodiscard]] static constexpr std::string_view name() noexcept { return "urgency"; }

    /// deadline (epoch seconds) + kLoadWeight * load; lower is better.
    [[nodiscard]] static double score(const Task& task, const VirtualMachine& vm) noexcept;
};

static_assert(SchedulingPolicyLike<UrgencyAwarePolicy>);

}  // namespace ledger_scheduler
