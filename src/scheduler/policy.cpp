/**
 * @file policy.cpp
 * @brief PolicyInstance dispatch over the policy variant.
 */

#include "scheduler/policy.hpp"

#include <set>

namespace ledger_scheduler {

namespace {

template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

Error no_ledger(std::string_view policy) {
    return Error{ErrorCode::LedgerUnavailable,
                 "policy '" + std::string{policy} + "' does not keep a ledger"};
}

}  // anonymous namespace

PolicyVariant make_policy(PolicyKind kind, const SchedulerConfig& config, Clock clock) {
    switch (kind) {
        case PolicyKind::RoundRobin:         return RoundRobinPolicy{};
        case PolicyKind::UrgencyAware:       return UrgencyAwarePolicy{};
        case PolicyKind::LeastLoaded:        return LeastLoadedPolicy{};
        case PolicyKind::BlockchainInspired: return BlockchainPolicy{config.blockchain, std::move(clock)};
    }
    return RoundRobinPolicy{};
}

PolicyInstance::PolicyInstance(PolicyVariant policy)
    : policy_(std::move(policy)) {}

ScheduleOutcome PolicyInstance::schedule(const Task& task,
                                         std::span<const VirtualMachine> candidates,
                                         std::vector<LedgerBlock>* mined) {
    std::lock_guard lock(mutex_);
    auto blocks_before = block_count_locked();
    auto outcome = std::visit([&](auto& policy) { return policy.schedule(task, candidates); }, policy_);
    collect_blocks_since(blocks_before, mined);
    return outcome;
}

PolicyKind PolicyInstance::kind() const noexcept {
    return std::visit(Overloaded{
        [](const RoundRobinPolicy&)   { return PolicyKind::RoundRobin; },
        [](const UrgencyAwarePolicy&) { return PolicyKind::UrgencyAware; },
        [](const LeastLoadedPolicy&)  { return PolicyKind::LeastLoaded; },
        [](const BlockchainPolicy&)   { return PolicyKind::BlockchainInspired; }
    }, policy_);
}

std::string_view PolicyInstance::name() const noexcept {
    return std::visit([](const auto& policy) { return std::decay_t<decltype(policy)>::name(); },
                      policy_);
}

bool PolicyInstance::has_ledger() const noexcept {
    return std::holds_alternative<BlockchainPolicy>(policy_);
}

template <typename F>
auto PolicyInstance::with_ledger(F&& func) const
    -> Result<std::invoke_result_t<F, const TransactionLedger&>> {
    std::lock_guard lock(mutex_);
    const auto* chain = std::get_if<BlockchainPolicy>(&policy_);
    if (chain == nullptr) {
        return no_ledger(name());
    }
    return func(chain->ledger());
}

Result<LedgerReport> PolicyInstance::ledger_report(size_t recent_limit, size_t stats_window) const {
    return with_ledger([&](const TransactionLedger& ledger) {
        LedgerReport report;
        report.summary = ledger.summary();
        report.recent_transactions = ledger.recent(recent_limit);

        std::set<VmId> seen;
        for (const auto& tx : ledger.recent(stats_window)) {
            seen.insert(tx.vm_id);
        }
        for (auto vm_id : seen) {
            report.vm_stats.push_back(ledger.vm_stats(vm_id));
        }

        report.export_data = ledger.snapshot();
        return report;
    });
}

Result<LedgerSummary> PolicyInstance::ledger_summary() const {
    return with_ledger([](const TransactionLedger& ledger) { return ledger.summary(); });
}

Result<LedgerSnapshot> PolicyInstance::export_ledger() const {
    return with_ledger([](const TransactionLedger& ledger) { return ledger.snapshot(); });
}

Result<std::vector<SchedulingTransaction>> PolicyInstance::task_history(const TaskId& task_id) const {
    return with_ledger([&](const TransactionLedger& ledger) {
        return ledger.history(std::nullopt, task_id);
    });
}

Result<VmLedgerStats> PolicyInstance::vm_stats(VmId vm_id) const {
    return with_ledger([&](const TransactionLedger& ledger) { return ledger.vm_stats(vm_id); });
}

Result<void> PolicyInstance::verify_ledger() const {
    std::lock_guard lock(mutex_);
    const auto* chain = std::get_if<BlockchainPolicy>(&policy_);
    if (chain == nullptr) {
        return no_ledger(name());
    }
    return chain->ledger().verify();
}

Result<void> PolicyInstance::force_mine(std::vector<LedgerBlock>* mined) {
    std::lock_guard lock(mutex_);
    auto* chain = std::get_if<BlockchainPolicy>(&policy_);
    if (chain == nullptr) {
        return no_ledger(name());
    }
    auto blocks_before = block_count_locked();
    chain->force_mine();
    collect_blocks_since(blocks_before, mined);
    return Result<void>{};
}

size_t PolicyInstance::block_count() const {
    std::lock_guard lock(mutex_);
    return block_count_locked();
}

std::vector<LedgerBlock> PolicyInstance::blocks_since(size_t first_id) const {
    std::lock_guard lock(mutex_);
    std::vector<LedgerBlock> blocks;
    collect_blocks_since(first_id, &blocks);
    return blocks;
}

size_t PolicyInstance::block_count_locked() const noexcept {
    const auto* chain = std::get_if<BlockchainPolicy>(&policy_);
    return chain == nullptr ? 0 : chain->ledger().blocks().size();
}

void PolicyInstance::collect_blocks_since(size_t first_id, std::vector<LedgerBlock>* out) const {
    if (out == nullptr) return;
    const auto* chain = std::get_if<BlockchainPolicy>(&policy_);
    if (chain == nullptr) return;

    const auto& blocks = chain->ledger().blocks();
    if (first_id >= blocks.size()) return;
    out->insert(out->end(), blocks.begin() + static_cast<std::ptrdiff_t>(first_id), blocks.end());
}

}  // namespace ledger_scheduler
