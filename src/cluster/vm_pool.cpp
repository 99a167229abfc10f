/**
 * @file vm_pool.cpp
 * @brief VmPool implementation.
 */

#include "cluster/vm_pool.hpp"

#include <algorithm>

namespace ledger_scheduler {

VmPool::VmPool(std::vector<VirtualMachine> vms)
    : vms_(std::move(vms)) {}

void VmPool::add_vm(VirtualMachine vm) {
    std::lock_guard lock(mutex_);
    vms_.push_back(std::move(vm));
}

ScheduleOutcome VmPool::schedule_and_commit(PolicyInstance& policy, const Task& task,
                                            std::vector<LedgerBlock>* mined) {
    std::lock_guard lock(mutex_);
    auto outcome = policy.schedule(task, vms_, mined);
    if (!outcome.index) return outcome;

    auto& winner = vms_[*outcome.index];
    if (!winner.can_admit(task)) {
        return ScheduleOutcome::none(outcome.score);
    }
    winner.commit(task);
    return outcome;
}

std::vector<VirtualMachine> VmPool::snapshot() const {
    std::lock_guard lock(mutex_);
    return vms_;
}

std::optional<VirtualMachine> VmPool::find(VmId id) const {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(vms_.begin(), vms_.end(),
                           [id](const VirtualMachine& vm) { return vm.id() == id; });
    if (it == vms_.end()) return std::nullopt;
    return *it;
}

size_t VmPool::size() const {
    std::lock_guard lock(mutex_);
    return vms_.size();
}

}  // namespace ledger_scheduler
