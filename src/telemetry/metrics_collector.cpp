/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <cmath>
#include <format>
#include <sstream>

namespace ledger_scheduler {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_scheduling_decision(std::string_view policy,
                                                  const TaskId& task_id,
                                                  const ScheduleOutcome& outcome) {
    std::ostringstream oss;
    oss << R"({"event":"scheduling_decision")"
        << R"(,"policy":")" << policy << "\""
        << R"(,"task":")" << json_escape(task_id) << "\""
        << R"(,"vm":)";
    if (outcome.vm_id) {
        oss << *outcome.vm_id;
    } else {
        oss << "null";
    }
    oss << R"(,"score":)";
    if (std::isfinite(outcome.score)) {
        oss << std::format("{}", outcome.score);
    } else {
        oss << "null";
    }
    oss << R"(,"outcome":")" << (outcome.assigned() ? "assigned" : "rejected") << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_block_mined(std::string_view policy, const LedgerBlock& block) {
    std::ostringstream oss;
    oss << R"({"event":"block_mined")"
        << R"(,"policy":")" << policy << "\""
        << R"(,"block_id":)" << block.block_id
        << R"(,"transactions":)" << block.transactions.size()
        << R"(,"hash":")" << block.block_hash << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_integrity_violation(std::string_view policy, std::string_view detail) {
    std::ostringstream oss;
    oss << R"({"event":"integrity_violation")"
        << R"(,"policy":")" << policy << "\""
        << R"(,"detail":")" << json_escape(detail) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << event << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace ledger_scheduler
