/**
 * @file vm.cpp
 * @brief VirtualMachine admission test, commit and load scoring.
 */

#include "cluster/vm.hpp"

namespace ledger_scheduler {

VirtualMachine::VirtualMachine(VmId id, ResourceVector capacity)
    : id_(id), capacity_(capacity) {}

VirtualMachine::VirtualMachine(VmId id, ResourceVector capacity, ResourceVector usage,
                               std::vector<TaskId> assigned_tasks)
    : id_(id), capacity_(capacity), usage_(usage), tasks_(std::move(assigned_tasks)) {}

bool VirtualMachine::can_admit(const Task& task) const noexcept {
    return usage_.fits_with(task.demand, capacity_);
}

void VirtualMachine::commit(const Task& task) {
    usage_ += task.demand;
    tasks_.push_back(task.id);
}

double VirtualMachine::load_score() const noexcept {
    return utilization().mean();
}

Utilization VirtualMachine::utilization() const noexcept {
    return Utilization::of(usage_, capacity_);
}

Utilization VirtualMachine::projected_utilization(const Task& task) const noexcept {
    return Utilization::of(usage_.saturating_add(task.demand), capacity_);
}

std::vector<VirtualMachine> make_fleet(size_t count, const ResourceVector& capacity) {
    std::vector<VirtualMachine> fleet;
    fleet.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        fleet.emplace_back(static_cast<VmId>(i), capacity);
    }
    return fleet;
}

}  // namespace ledger_scheduler
