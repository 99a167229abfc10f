/**
 * @file resource_history.cpp
 * @brief ResourceHistory implementation.
 */

#include "scheduler/resource_history.hpp"

#include <algorithm>

namespace ledger_scheduler {

ResourceHistory::ResourceHistory(size_t window)
    : window_(std::max<size_t>(window, 1)) {}

void ResourceHistory::record(VmId vm_id, const Utilization& sample) {
    auto& window = samples_[vm_id];
    window.push_back(sample);
    while (window.size() > window_) {
        window.pop_front();
    }
}

double ResourceHistory::historical_usage(VmId vm_id) const {
    auto it = samples_.find(vm_id);
    if (it == samples_.end() || it->second.empty()) return 0.0;

    double total = 0.0;
    for (const auto& sample : it->second) {
        total += sample.mean();
    }
    return total / static_cast<double>(it->second.size());
}

size_t ResourceHistory::sample_count(VmId vm_id) const {
    auto it = samples_.find(vm_id);
    return it == samples_.end() ? 0 : it->second.size();
}

}  // namespace ledger_scheduler
