/**
 * @file vm_pool.hpp
 * @brief Thread-safe fleet of VMs with coupled select-and-commit.
 */

#pragma once

#include "cluster/vm.hpp"
#include "core/types.hpp"
#include "scheduler/policy.hpp"

#include <mutex>
#include <optional>
#include <vector>

namespace ledger_scheduler {

/**
 * @brief Owns the live VM state that scheduling decisions are committed to.
 *
 * schedule_and_commit() holds the pool lock across policy selection and
 * the commit of the winner, so two callers can never both win against
 * the same admission result. Lock order: pool, then policy instance.
 */
class VmPool {
public:
    VmPool() = default;
    explicit VmPool(std::vector<VirtualMachine> vms);

    void add_vm(VirtualMachine vm);

    /**
     * @brief Select a VM with @p policy and commit @p task to it atomically.
     *
     * The winner is re-checked with can_admit() before committing; a winner
     * that does not admit the task is reported as no assignment. Blocks
     * mined by the policy during the call are appended to @p mined.
     */
    ScheduleOutcome schedule_and_commit(PolicyInstance& policy, const Task& task,
                                        std::vector<LedgerBlock>* mined = nullptr);

    [[nodiscard]] std::vector<VirtualMachine> snapshot() const;
    [[nodiscard]] std::optional<VirtualMachine> find(VmId id) const;
    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<VirtualMachine> vms_;
};

}  // namespace ledger_scheduler
