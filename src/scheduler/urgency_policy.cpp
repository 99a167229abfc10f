/**
 * @file urgency_policy.cpp
 * @brief UrgencyAwarePolicy: minimum of deadline + 5 * load over admissible VMs.
 *
 * Ties break by ascending VM id. Returns (none, +inf) when nothing fits.
 */

#include "scheduler/urgency_policy.hpp"

namespace ledger_scheduler {

double UrgencyAwarePolicy::score(const Task& task, const VirtualMachine& vm) noexcept {
    return epoch_seconds(task.deadline) + kLoadWeight * vm.load_score();
}

ScheduleOutcome UrgencyAwarePolicy::schedule(const Task& task,
                                             std::span<const VirtualMachine> candidates) {
    std::optional<size_t> best;
    double best_score = kNoCandidateScore;

    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto& vm = candidates[i];
        if (!vm.can_admit(task)) continue;

        double s = score(task, vm);
        if (!best || s < best_score
            || (s == best_score && vm.id() < candidates[*best].id())) {
            best = i;
            best_score = s;
        }
    }

    if (!best) {
        return ScheduleOutcome::none(kNoCandidateScore);
    }
    return ScheduleOutcome::chosen(candidates[*best], *best, best_score);
}

}  // namespace ledger_scheduler
