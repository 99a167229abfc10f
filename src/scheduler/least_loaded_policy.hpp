/**
 * @file least_loaded_policy.hpp
 * @brief Least-loaded scheduling policy: prefers idle VMs, then minimal load.
 */

#pragma once

#include "core/concepts.hpp"
#include "scheduler/scheduler.hpp"

#include <span>
#include <string_view>

namespace ledger_scheduler {

class LeastLoadedPolicy {
public:
    ScheduleOutcome schedule(const Task& task, std::span<const VirtualMachine> candidates);

    [[nodiscard]] static constexpr std::string_view name() noexcept { return "leastloaded"; }
};

static_assert(SchedulingPolicyLike<LeastLoadedPolicy>);

}  // namespace ledger_scheduler
