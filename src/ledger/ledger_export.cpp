/**
 * @file ledger_export.cpp
 * @brief Hand-rolled JSON writers for ledger structures.
 */

#include "ledger/ledger_export.hpp"

#include "core/logger.hpp"

#include <cmath>
#include <format>
#include <sstream>

namespace ledger_scheduler {

namespace {

/// JSON has no infinity or NaN; emit null for them.
std::string json_number(double value) {
    if (!std::isfinite(value)) return "null";
    return std::format("{}", value);
}

std::string json_resources(const ResourceVector& r) {
    return std::format(R"({{"cpu":{},"mem":{},"io":{},"bw":{}}})", r.cpu, r.mem, r.io, r.bw);
}

template <typename Range>
void write_array(std::ostringstream& oss, const Range& items) {
    oss << '[';
    bool first = true;
    for (const auto& item : items) {
        if (!first) oss << ',';
        first = false;
        oss << to_json(item);
    }
    oss << ']';
}

}  // anonymous namespace

std::string to_json(const SchedulingTransaction& tx) {
    std::ostringstream oss;
    oss << R"({"transaction_id":")" << json_escape(tx.transaction_id) << "\""
        << R"(,"timestamp":)" << json_number(epoch_seconds(tx.timestamp))
        << R"(,"vm_id":)" << tx.vm_id
        << R"(,"task_id":")" << json_escape(tx.task_id) << "\""
        << R"(,"task_requirements":)" << json_resources(tx.task_requirements)
        << R"(,"vm_state_before":)" << json_resources(tx.vm_state_before)
        << R"(,"vm_state_after":)" << json_resources(tx.vm_state_after)
        << R"(,"score":)" << json_number(tx.score)
        << R"(,"status":")" << to_string(tx.status) << "\""
        << R"(,"block_hash":")" << tx.block_hash << "\""
        << "}";
    return oss.str();
}

std::string to_json(const LedgerBlock& block) {
    std::ostringstream oss;
    oss << R"({"block_id":)" << block.block_id
        << R"(,"timestamp":)" << json_number(epoch_seconds(block.timestamp))
        << R"(,"previous_hash":")" << block.previous_hash << "\""
        << R"(,"block_hash":")" << block.block_hash << "\""
        << R"(,"merkle_root":")" << block.merkle_root << "\""
        << R"(,"transactions":)";
    write_array(oss, block.transactions);
    oss << "}";
    return oss.str();
}

std::string to_json(const LedgerSummary& summary) {
    std::ostringstream oss;
    oss << R"({"total_blocks":)" << summary.total_blocks
        << R"(,"total_transactions":)" << summary.total_transactions
        << R"(,"pending_transactions":)" << summary.pending_transactions
        << R"(,"successful_assignments":)" << summary.successful_assignments
        << R"(,"failed_assignments":)" << summary.failed_assignments
        << R"(,"success_rate":)" << json_number(summary.success_rate)
        << R"(,"chain_integrity":)" << (summary.chain_integrity ? "true" : "false")
        << R"(,"latest_block_hash":)";
    if (summary.latest_block_hash.empty()) {
        oss << "null";
    } else {
        oss << '"' << summary.latest_block_hash << '"';
    }
    oss << "}";
    return oss.str();
}

std::string to_json(const VmLedgerStats& stats) {
    std::ostringstream oss;
    oss << R"({"vm_id":)" << stats.vm_id
        << R"(,"total_assignments":)" << stats.total_assignments
        << R"(,"failed_assignments":)" << stats.failed_assignments
        << R"(,"success_rate":)" << json_number(stats.success_rate)
        << R"(,"average_score":)" << json_number(stats.average_score)
        << R"(,"total_cpu_allocated":)" << stats.total_cpu_allocated
        << R"(,"total_mem_allocated":)" << stats.total_mem_allocated
        << R"(,"total_transactions":)" << stats.total_transactions
        << "}";
    return oss.str();
}

std::string to_json(const LedgerSnapshot& snapshot) {
    std::ostringstream oss;
    oss << R"({"blocks":)";
    write_array(oss, snapshot.blocks);
    oss << R"(,"pending_transactions":)";
    write_array(oss, snapshot.pending);
    oss << R"(,"summary":)" << to_json(snapshot.summary)
        << "}";
    return oss.str();
}

}  // namespace ledger_scheduler
