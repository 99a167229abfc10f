/**
 * @file registry.cpp
 * @brief SchedulerRegistry implementation.
 */

#include "scheduler/registry.hpp"

namespace ledger_scheduler {

SchedulerRegistry::SchedulerRegistry(SchedulerConfig config, Clock clock)
    : config_(std::move(config)), clock_(std::move(clock)) {}

Result<PolicyInstance*> SchedulerRegistry::get(std::string_view name) {
    auto kind = parse_policy_kind(name);
    if (!kind) {
        return Error{ErrorCode::UnknownPolicy, "unknown scheduling policy: '" + std::string{name} + "'"};
    }
    return &get(*kind);
}

PolicyInstance& SchedulerRegistry::get(PolicyKind kind) {
    std::lock_guard lock(mutex_);
    auto& slot = instances_[kind];
    if (!slot) {
        slot = std::make_unique<PolicyInstance>(make_policy(kind, config_, clock_));
    }
    return *slot;
}

std::vector<std::string> SchedulerRegistry::constructed() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> names;
    names.reserve(instances_.size());
    for (const auto& [kind, instance] : instances_) {
        names.emplace_back(to_string(kind));
    }
    return names;
}

}  // namespace ledger_scheduler
