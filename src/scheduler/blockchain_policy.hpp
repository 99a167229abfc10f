/**
 * @file blockchain_policy.hpp
 * @brief Blockchain-inspired scheduling policy with a hash-chained audit ledger.
 *
 * Scores every admissible VM by task urgency normalized with a blend of
 * current and historical utilization, and records each decision in its
 * own TransactionLedger.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/config.hpp"
#include "ledger/ledger.hpp"
#include "scheduler/resource_history.hpp"
#include "scheduler/scheduler.hpp"

#include <span>
#include <string_view>
#include <vector>

namespace ledger_scheduler {

class BlockchainPolicy {
public:
    explicit BlockchainPolicy(BlockchainPolicyConfig config = {}, Clock clock = system_clock());

    /**
     * @brief Select the admissible VM with the highest score.
     *
     * Records every candidate's utilization in the history window first.
     * On success appends an "assigned" transaction (state before and after
     * the hypothetical commit); on failure with candidates present appends
     * a "failed" transaction against the first candidate. Does not mutate
     * VM usage.
     */
    ScheduleOutcome schedule(const Task& task, std::span<const VirtualMachine> candidates);

    [[nodiscard]] static constexpr std::string_view name() noexcept { return "blockchain"; }

    // ── Scoring terms (exposed for inspection) ──

    /// Current resource usage: mean of the VM's four utilization ratios.
    [[nodiscard]] double current_usage(const VirtualMachine& vm) const noexcept;

    /// Historical resource usage over the VM's window; 0 if none.
    [[nodiscard]] double historical_usage(const VirtualMachine& vm) const;

    /// max(alpha * CRU + beta * HRU, epsilon).
    [[nodiscard]] double dynamic_weight(const VirtualMachine& vm) const;

    /// 1 / max(deadline - now, epsilon), in seconds.
    [[nodiscard]] double urgency_factor(const Task& task, Timestamp now) const noexcept;

    /// urgency_factor / dynamic_weight; higher is better.
    [[nodiscard]] double score(const VirtualMachine& vm, const Task& task, Timestamp now) const;

    // ── Ledger access ─────────────────────────

    [[nodiscard]] const TransactionLedger& ledger() const noexcept { return ledger_; }
    [[nodiscard]] const ResourceHistory& history() const noexcept { return history_; }
    [[nodiscard]] const BlockchainPolicyConfig& config() const noexcept { return config_; }

    /// The last @p limit ledger entries, committed or pending.
    [[nodiscard]] std::vector<SchedulingTransaction> recent_transactions(size_t limit) const {
        return ledger_.recent(limit);
    }

    /// Mine whatever is pending into a block.
    void force_mine() { ledger_.mine(); }

private:
    BlockchainPolicyConfig config_;
    Clock clock_;
    ResourceHistory history_;
    TransactionLedger ledger_;
};

static_assert(SchedulingPolicyLike<BlockchainPolicy>);

}  // namespace ledger_scheduler
