/**
 * @file least_loaded_policy.cpp
 * @brief LeastLoadedPolicy: first idle admissible VM, else strict minimum load.
 *
 * Algorithm:
 *   If some admissible VM has load 0: return the first one, score 0
 *   Else: return the admissible VM with strictly minimal load
 *         (first encountered wins ties), score = its load
 *   Nothing admissible: (none, +inf)
 *
 * Complexity: O(N).
 */

#include "scheduler/least_loaded_policy.hpp"

namespace ledger_scheduler {

ScheduleOutcome LeastLoadedPolicy::schedule(const Task& task,
                                            std::span<const VirtualMachine> candidates) {
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (candidates[i].can_admit(task) && candidates[i].load_score() == 0.0) {
            return ScheduleOutcome::chosen(candidates[i], i, 0.0);
        }
    }

    std::optional<size_t> best;
    double min_load = kNoCandidateScore;

    for (size_t i = 0; i < candidates.size(); ++i) {
        if (!candidates[i].can_admit(task)) continue;

        double load = candidates[i].load_score();
        if (load < min_load) {
            min_load = load;
            best = i;
        }
    }

    if (!best) {
        return ScheduleOutcome::none(kNoCandidateScore);
    }
    return ScheduleOutcome::chosen(candidates[*best], *best, min_load);
}

}  // namespace ledger_scheduler
