/**
 * @file resource_history.hpp
 * @brief Per-VM sliding window of utilization snapshots.
 */

#pragma once

#include "core/types.hpp"

#include <deque>
#include <unordered_map>

namespace ledger_scheduler {

/**
 * @brief Fixed-capacity FIFO of Utilization samples per VM id.
 *
 * When a window is full the oldest sample is evicted.
 */
class ResourceHistory {
public:
    explicit ResourceHistory(size_t window = 10);

    void record(VmId vm_id, const Utilization& sample);

    /// Mean over the window of each sample's four-dimension mean; 0 if empty.
    [[nodiscard]] double historical_usage(VmId vm_id) const;

    [[nodiscard]] size_t sample_count(VmId vm_id) const;
    [[nodiscard]] size_t window() const noexcept { return window_; }
    [[nodiscard]] size_t tracked_vms() const noexcept { return samples_.size(); }

private:
    size_t window_;
    std::unordered_map<VmId, std::deque<Utilization>> samples_;
};

}  // namespace ledger_scheduler
