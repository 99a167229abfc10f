/**
 * @file policy.hpp
 * @brief Closed set of scheduling policies behind one synchronized handle.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "ledger/ledger.hpp"
#include "scheduler/blockchain_policy.hpp"
#include "scheduler/least_loaded_policy.hpp"
#include "scheduler/round_robin_policy.hpp"
#include "scheduler/scheduler.hpp"
#include "scheduler/urgency_policy.hpp"

#include <mutex>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

namespace ledger_scheduler {

using PolicyVariant = std::variant<RoundRobinPolicy,
                                   UrgencyAwarePolicy,
                                   LeastLoadedPolicy,
                                   BlockchainPolicy>;

/**
 * @brief Construct the policy named by @p kind from configuration.
 */
[[nodiscard]] PolicyVariant make_policy(PolicyKind kind,
                                        const SchedulerConfig& config,
                                        Clock clock = system_clock());

/**
 * @brief Ledger view assembled for a presentation layer.
 */
struct LedgerReport {
    LedgerSummary summary;
    std::vector<SchedulingTransaction> recent_transactions;
    std::vector<VmLedgerStats> vm_stats;    ///< One entry per VM seen in the stats window, by id
    LedgerSnapshot export_data;
};

/**
 * @brief One persistent policy instance and the lock that serializes it.
 *
 * Every operation holds the same mutex, so a schedule call (history update,
 * cursor advance, ledger append and any inline mining) is one atomic unit
 * with respect to other callers of this instance.
 */
class PolicyInstance {
public:
    explicit PolicyInstance(PolicyVariant policy);

    // Non-copyable, non-movable
    PolicyInstance(const PolicyInstance&) = delete;
    PolicyInstance& operator=(const PolicyInstance&) = delete;

    /**
     * @brief Run the policy under the instance lock.
     *
     * Blocks the ledger mined during this call are appended to @p mined
     * when it is non-null, so callers can report each block exactly once.
     */
    ScheduleOutcome schedule(const Task& task, std::span<const VirtualMachine> candidates,
                             std::vector<LedgerBlock>* mined = nullptr);

    [[nodiscard]] PolicyKind kind() const noexcept;
    [[nodiscard]] std::string_view name() const noexcept;
    [[nodiscard]] bool has_ledger() const noexcept;

    // ── Ledger operations (blockchain policy only) ──

    [[nodiscard]] Result<LedgerReport> ledger_report(size_t recent_limit = 20,
                                                     size_t stats_window = 100) const;
    [[nodiscard]] Result<LedgerSummary> ledger_summary() const;
    [[nodiscard]] Result<LedgerSnapshot> export_ledger() const;
    [[nodiscard]] Result<std::vector<SchedulingTransaction>> task_history(const TaskId& task_id) const;
    [[nodiscard]] Result<VmLedgerStats> vm_stats(VmId vm_id) const;
    [[nodiscard]] Result<void> verify_ledger() const;
    Result<void> force_mine(std::vector<LedgerBlock>* mined = nullptr);

    /// Number of committed blocks, 0 for policies without a ledger.
    [[nodiscard]] size_t block_count() const;

    /// Committed blocks with id >= @p first_id; empty for policies without a ledger.
    [[nodiscard]] std::vector<LedgerBlock> blocks_since(size_t first_id) const;

private:
    /// Caller holds mutex_.
    void collect_blocks_since(size_t first_id, std::vector<LedgerBlock>* out) const;
    [[nodiscard]] size_t block_count_locked() const noexcept;

    template <typename F>
    auto with_ledger(F&& func) const -> Result<std::invoke_result_t<F, const TransactionLedger&>>;

    mutable std::mutex mutex_;
    PolicyVariant policy_;
};

}  // namespace ledger_scheduler
