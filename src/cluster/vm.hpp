/**
 * @file vm.hpp
 * @brief Task and virtual machine resource model.
 *
 * A VirtualMachine tracks usage against a fixed capacity on four resource
 * dimensions. Usage never exceeds capacity as long as callers only commit
 * tasks that passed can_admit(); the model itself does not block an
 * out-of-band overcommit.
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <vector>

namespace ledger_scheduler {

/**
 * @brief A resource-bounded unit of work. Immutable once submitted.
 */
struct Task {
    TaskId id;
    ResourceVector demand;
    Timestamp deadline;
    std::optional<Duration> duration;
};

class VirtualMachine {
public:
    VirtualMachine(VmId id, ResourceVector capacity);

    /// Rebuild a VM from an externally tracked state.
    VirtualMachine(VmId id, ResourceVector capacity, ResourceVector usage,
                   std::vector<TaskId> assigned_tasks = {});

    [[nodiscard]] VmId id() const noexcept { return id_; }
    [[nodiscard]] const ResourceVector& capacity() const noexcept { return capacity_; }
    [[nodiscard]] const ResourceVector& usage() const noexcept { return usage_; }
    [[nodiscard]] const std::vector<TaskId>& assigned_tasks() const noexcept { return tasks_; }

    /// True iff usage + demand <= capacity on every dimension.
    [[nodiscard]] bool can_admit(const Task& task) const noexcept;

    /// Adds the task's demand to usage and records its id. No rollback.
    void commit(const Task& task);

    /// Mean of usage/capacity across the four dimensions.
    [[nodiscard]] double load_score() const noexcept;

    [[nodiscard]] Utilization utilization() const noexcept;

    /// Utilization as it would be after committing @p task.
    [[nodiscard]] Utilization projected_utilization(const Task& task) const noexcept;

private:
    VmId id_;
    ResourceVector capacity_;
    ResourceVector usage_;
    std::vector<TaskId> tasks_;
};

/**
 * @brief Build @p count idle VMs with ids 0..count-1.
 */
[[nodiscard]] std::vector<VirtualMachine> make_fleet(size_t count, const ResourceVector& capacity);

}  // namespace ledger_scheduler
