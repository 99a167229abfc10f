/**
 * @file round_robin_policy.cpp
 * @brief RoundRobinPolicy: first admissible VM starting at the cursor.
 *
 * Algorithm:
 *   If |candidates| changed since the last call: cursor = 0
 *   Repeat |candidates| times:
 *     vm = candidates[cursor]; cursor = (cursor + 1) mod |candidates|
 *     If vm admits the task: return vm (cursor stays just past it)
 *   Restore cursor to its value before the scan; return none.
 *
 * Complexity: O(N).
 */

#include "scheduler/round_robin_policy.hpp"

namespace ledger_scheduler {

ScheduleOutcome RoundRobinPolicy::schedule(const Task& task,
                                           std::span<const VirtualMachine> candidates) {
    const size_t count = candidates.size();
    if (count == 0) {
        return ScheduleOutcome::none(0.0);
    }

    if (last_count_ != count) {
        last_count_ = count;
        cursor_ = 0;
    }

    const size_t start = cursor_;
    for (size_t step = 0; step < count; ++step) {
        const size_t i = cursor_;
        cursor_ = (cursor_ + 1) % count;

        if (candidates[i].can_admit(task)) {
            return ScheduleOutcome::chosen(candidates[i], i, candidates[i].load_score());
        }
    }

    cursor_ = start;
    return ScheduleOutcome::none(0.0);
}

}  // namespace ledger_scheduler
