/**
 * @file scheduling_service.hpp
 * @brief Top-level SchedulingService facade: ties all modules together.
 *
 * Provides a single entry point for:
 *   1. Scheduling a task against caller-supplied VM snapshots
 *   2. Scheduling and committing a task against the service's own fleet
 *   3. Inspecting, mining and verifying the blockchain policy's ledger
 *
 * The service owns its policy registry; nothing is kept in process globals.
 */

#pragma once

#include "cluster/vm.hpp"
#include "cluster/vm_pool.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "scheduler/policy.hpp"
#include "scheduler/registry.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace ledger_scheduler {

class SchedulingService {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;       ///< NullSink when empty
        std::unique_ptr<ILogSink> metrics_sink;   ///< NullSink when empty
        Clock clock = system_clock();
    };

    explicit SchedulingService(Options opts);

    // Non-copyable, non-movable
    SchedulingService(const SchedulingService&) = delete;
    SchedulingService& operator=(const SchedulingService&) = delete;

    /**
     * @brief Pick a VM from @p candidates. Committing the winner is the caller's job.
     *
     * Fails only for an unknown policy name; "no VM fits" is an outcome.
     */
    Result<ScheduleOutcome> schedule(std::string_view policy,
                                     const Task& task,
                                     std::span<const VirtualMachine> candidates);

    /// Schedule against the owned fleet and commit the winner atomically.
    Result<ScheduleOutcome> submit(std::string_view policy, const Task& task);

    /// Summary, 20 recent transactions, per-VM stats and the full export.
    Result<LedgerReport> ledger_report(std::string_view policy);

    Result<void> force_mine(std::string_view policy);

    /// Verify chain integrity; violations are logged and returned, never repaired.
    Result<void> verify(std::string_view policy);

    // ── Accessors ───────────────────────────
    VmPool& pool() { return pool_; }
    SchedulerRegistry& registry() { return registry_; }
    Logger& logger() { return logger_; }
    MetricsCollector& metrics() { return metrics_; }
    const Config& config() const { return config_; }

private:
    Result<PolicyInstance*> resolve(std::string_view policy);
    void record_decision(PolicyInstance& policy, const Task& task,
                         const ScheduleOutcome& outcome, std::span<const LedgerBlock> mined);

    Config config_;
    Logger logger_;
    MetricsCollector metrics_;
    SchedulerRegistry registry_;
    VmPool pool_;
};

}  // namespace ledger_scheduler
