/**
 * @file registry.hpp
 * @brief Resolves policy names to persistent, lazily built policy instances.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "scheduler/policy.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace ledger_scheduler {

/**
 * @brief Owns exactly one PolicyInstance per policy name.
 *
 * Owned by the composing service rather than living in a global. Repeated
 * lookups of the same name return the same instance, so round-robin
 * cursors, history windows and ledgers persist across calls. Construction
 * is guarded by a mutex; returned pointers stay valid for the registry's
 * lifetime.
 */
class SchedulerRegistry {
public:
    explicit SchedulerRegistry(SchedulerConfig config, Clock clock = system_clock());

    // Non-copyable, non-movable
    SchedulerRegistry(const SchedulerRegistry&) = delete;
    SchedulerRegistry& operator=(const SchedulerRegistry&) = delete;

    /// Look up by registry name; ErrorCode::UnknownPolicy for anything else.
    [[nodiscard]] Result<PolicyInstance*> get(std::string_view name);

    [[nodiscard]] PolicyInstance& get(PolicyKind kind);

    /// Names of the instances built so far, in PolicyKind order.
    [[nodiscard]] std::vector<std::string> constructed() const;

private:
    SchedulerConfig config_;
    Clock clock_;
    mutable std::mutex mutex_;
    std::map<PolicyKind, std::unique_ptr<PolicyInstance>> instances_;
};

}  // namespace ledger_scheduler
