/**
 * @file blockchain_policy.cpp
 * @brief BlockchainPolicy: urgency over dynamic weight, recorded in a ledger.
 *
 * Algorithm:
 *   For every candidate: push its utilization into its history window
 *   For every admissible candidate (all projected ratios <= 1.0):
 *     CRU   = mean current utilization
 *     HRU   = mean of per-sample means over the window
 *     DW    = max(alpha * CRU + beta * HRU, eps)
 *     UF    = 1 / max(deadline - now, eps)
 *     score = UF / DW
 *   Choose the maximum score, ties by ascending VM id.
 *
 * Complexity: O(N) per call plus one ledger append.
 */

#include "scheduler/blockchain_policy.hpp"

#include <algorithm>

namespace ledger_scheduler {

BlockchainPolicy::BlockchainPolicy(BlockchainPolicyConfig config, Clock clock)
    : config_(config)
    , clock_(std::move(clock))
    , history_(config.history_window)
    , ledger_(LedgerConfig{.block_size = config.block_size}, clock_) {}

double BlockchainPolicy::current_usage(const VirtualMachine& vm) const noexcept {
    return vm.utilization().mean();
}

double BlockchainPolicy::historical_usage(const VirtualMachine& vm) const {
    return history_.historical_usage(vm.id());
}

double BlockchainPolicy::dynamic_weight(const VirtualMachine& vm) const {
    double weight = config_.alpha * current_usage(vm) + config_.beta * historical_usage(vm);
    return std::max(weight, config_.epsilon);
}

double BlockchainPolicy::urgency_factor(const Task& task, Timestamp now) const noexcept {
    double time_left = std::chrono::duration<double>(task.deadline - now).count();
    return 1.0 / std::max(time_left, config_.epsilon);
}

double BlockchainPolicy::score(const VirtualMachine& vm, const Task& task, Timestamp now) const {
    return urgency_factor(task, now) / dynamic_weight(vm);
}

ScheduleOutcome BlockchainPolicy::schedule(const Task& task,
                                           std::span<const VirtualMachine> candidates) {
    const auto now = clock_();

    for (const auto& vm : candidates) {
        history_.record(vm.id(), vm.utilization());
    }

    std::optional<size_t> best;
    double best_score = 0.0;

    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto& vm = candidates[i];
        if (!vm.can_admit(task)) continue;

        double s = score(vm, task, now);
        if (!best || s > best_score
            || (s == best_score && vm.id() < candidates[*best].id())) {
            best = i;
            best_score = s;
        }
    }

    if (best) {
        const auto& vm = candidates[*best];
        ledger_.append(vm.id(), task, vm.usage(), vm.usage() + task.demand,
                       best_score, TransactionStatus::Assigned);
        return ScheduleOutcome::chosen(vm, *best, best_score);
    }

    if (!candidates.empty()) {
        const auto& reference = candidates.front();
        ledger_.append(reference.id(), task, reference.usage(), reference.usage(),
                       0.0, TransactionStatus::Failed);
    }
    return ScheduleOutcome::none(kNoCandidateScore);
}

}  // namespace ledger_scheduler
