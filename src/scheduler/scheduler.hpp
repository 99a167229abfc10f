/**
 * @file scheduler.hpp
 * @brief Scheduling outcome shared by every policy.
 */

#pragma once

#include "cluster/vm.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <limits>
#include <optional>

namespace ledger_scheduler {

/**
 * @brief Result of one scheduling call.
 *
 * An empty vm_id means no candidate was admissible; that is a normal
 * outcome, not an error. Score interpretation is policy-specific:
 *   roundrobin   load score of the chosen VM, 0 when none
 *   urgency      lower is better, +inf when none
 *   leastloaded  lower is better, +inf when none
 *   blockchain   higher is better, +inf when none
 */
struct ScheduleOutcome {
    std::optional<VmId> vm_id;
    std::optional<size_t> index;    ///< Position of the chosen VM in the candidate span
    double score{0.0};

    [[nodiscard]] bool assigned() const noexcept { return vm_id.has_value(); }

    [[nodiscard]] static ScheduleOutcome chosen(const VirtualMachine& vm, size_t index, double score) {
        return ScheduleOutcome{.vm_id = vm.id(), .index = index, .score = score};
    }

    [[nodiscard]] static ScheduleOutcome none(double sentinel) {
        return ScheduleOutcome{.vm_id = std::nullopt, .index = std::nullopt, .score = sentinel};
    }
};

inline constexpr double kNoCandidateScore = std::numeric_limits<double>::infinity();

}  // namespace ledger_scheduler
