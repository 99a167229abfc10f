/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for ledger_scheduler interfaces.
 *
 * The policy set is closed, so policies are plain classes held in a
 * std::variant and checked against this concept at compile time instead
 * of deriving from a virtual base.
 */

#pragma once

#include <concepts>
#include <span>
#include <string_view>

namespace ledger_scheduler {

// Forward declarations
struct Task;
class VirtualMachine;
struct ScheduleOutcome;

// ─────────────────────────────────────────────
// SchedulingPolicyLike
// ─────────────────────────────────────────────

/**
 * @concept SchedulingPolicyLike
 * @brief Constrains types that can pick a VM for a task.
 */
template <typename T>
concept SchedulingPolicyLike = requires(
    T policy,
    const Task& task,
    std::span<const VirtualMachine> candidates
) {
    { policy.schedule(task, candidates) } -> std::same_as<ScheduleOutcome>;
    { T::name() } -> std::convertible_to<std::string_view>;
};

}  // namespace ledger_scheduler
