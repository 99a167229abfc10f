/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "ledger/block.hpp"
#include "scheduler/scheduler.hpp"

#include <memory>
#include <mutex>
#include <string_view>

namespace ledger_scheduler {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_scheduling_decision(std::string_view policy,
                                    const TaskId& task_id,
                                    const ScheduleOutcome& outcome);
    void record_block_mined(std::string_view policy, const LedgerBlock& block);
    void record_integrity_violation(std::string_view policy, std::string_view detail);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace ledger_scheduler
