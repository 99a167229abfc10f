/**
 * @file scheduling_service.cpp
 * @brief SchedulingService implementation.
 */

#include "service/scheduling_service.hpp"

#include <format>

namespace ledger_scheduler {

namespace {

std::unique_ptr<ILogSink> or_null(std::unique_ptr<ILogSink> sink) {
    if (sink) return sink;
    return std::make_unique<NullSink>();
}

}  // anonymous namespace

SchedulingService::SchedulingService(Options opts)
    : config_(std::move(opts.config))
    , logger_(or_null(std::move(opts.log_sink)),
              parse_log_level(config_.telemetry.log_level).value_or(LogLevel::Info))
    , metrics_(or_null(std::move(opts.metrics_sink)))
    , registry_(config_.scheduler, opts.clock)
    , pool_(make_fleet(config_.cluster.vm_count, config_.cluster.capacity)) {
    logger_.info(std::format("Scheduling service ready: {} VMs, default policy {}",
                             config_.cluster.vm_count, config_.scheduler.policy));
}

Result<PolicyInstance*> SchedulingService::resolve(std::string_view policy) {
    auto instance = registry_.get(policy);
    if (!instance) {
        logger_.warn(instance.error().message);
    }
    return instance;
}

Result<ScheduleOutcome> SchedulingService::schedule(std::string_view policy,
                                                    const Task& task,
                                                    std::span<const VirtualMachine> candidates) {
    auto instance = resolve(policy);
    if (!instance) return instance.error();

    auto& chosen = **instance;
    std::vector<LedgerBlock> mined;
    auto outcome = chosen.schedule(task, candidates, &mined);
    record_decision(chosen, task, outcome, mined);
    return outcome;
}

Result<ScheduleOutcome> SchedulingService::submit(std::string_view policy, const Task& task) {
    auto instance = resolve(policy);
    if (!instance) return instance.error();

    auto& chosen = **instance;
    std::vector<LedgerBlock> mined;
    auto outcome = pool_.schedule_and_commit(chosen, task, &mined);
    record_decision(chosen, task, outcome, mined);
    return outcome;
}

Result<LedgerReport> SchedulingService::ledger_report(std::string_view policy) {
    return resolve(policy).and_then([](PolicyInstance* instance) {
        return instance->ledger_report();
    });
}

Result<void> SchedulingService::force_mine(std::string_view policy) {
    auto instance = resolve(policy);
    if (!instance) return instance.error();

    auto& chosen = **instance;
    std::vector<LedgerBlock> blocks;
    auto mined = chosen.force_mine(&blocks);
    if (!mined) return mined;

    for (const auto& block : blocks) {
        logger_.info(std::format("Mined block {} ({} transactions) on demand",
                                 block.block_id, block.transactions.size()));
        metrics_.record_block_mined(chosen.name(), block);
    }
    return mined;
}

Result<void> SchedulingService::verify(std::string_view policy) {
    auto instance = resolve(policy);
    if (!instance) return instance.error();

    auto& chosen = **instance;
    auto verdict = chosen.verify_ledger();
    if (!verdict && verdict.error().code == ErrorCode::IntegrityViolation) {
        logger_.error("Ledger integrity violation in " + std::string{chosen.name()}
                      + ": " + verdict.error().message);
        metrics_.record_integrity_violation(chosen.name(), verdict.error().message);
    }
    return verdict;
}

void SchedulingService::record_decision(PolicyInstance& policy, const Task& task,
                                        const ScheduleOutcome& outcome,
                                        std::span<const LedgerBlock> mined) {
    metrics_.record_scheduling_decision(policy.name(), task.id, outcome);

    if (outcome.assigned()) {
        logger_.debug(std::format("{}: task {} -> VM {} (score {})",
                                  policy.name(), task.id, *outcome.vm_id, outcome.score));
    } else {
        logger_.info(std::format("{}: no admissible VM for task {}", policy.name(), task.id));
    }

    for (const auto& block : mined) {
        logger_.info(std::format("Mined block {} ({} transactions, hash {})",
                                 block.block_id, block.transactions.size(),
                                 block.block_hash.substr(0, 16)));
        metrics_.record_block_mined(policy.name(), block);
    }
}

}  // namespace ledger_scheduler
