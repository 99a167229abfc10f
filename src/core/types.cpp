/**
 * @file types.cpp
 * @brief Out-of-line helpers for the core vocabulary types.
 */

#include "core/types.hpp"

#include <array>
#include <limits>

namespace ledger_scheduler {

namespace {

double ratio(uint64_t used, uint64_t capacity) noexcept {
    if (capacity == 0) {
        return used == 0 ? 0.0 : std::numeric_limits<double>::infinity();
    }
    return static_cast<double>(used) / static_cast<double>(capacity);
}

constexpr std::array kPolicyKinds{
    PolicyKind::RoundRobin,
    PolicyKind::UrgencyAware,
    PolicyKind::LeastLoaded,
    PolicyKind::BlockchainInspired
};

}  // anonymous namespace

Utilization Utilization::of(const ResourceVector& used,
                            const ResourceVector& capacity) noexcept {
    return Utilization{
        .cpu = ratio(used.cpu, capacity.cpu),
        .mem = ratio(used.mem, capacity.mem),
        .io = ratio(used.io, capacity.io),
        .bw = ratio(used.bw, capacity.bw)
    };
}

std::optional<TransactionStatus> parse_status(std::string_view text) noexcept {
    if (text == "assigned") return TransactionStatus::Assigned;
    if (text == "failed")   return TransactionStatus::Failed;
    if (text == "rejected") return TransactionStatus::Rejected;
    return std::nullopt;
}

std::optional<PolicyKind> parse_policy_kind(std::string_view name) noexcept {
    for (auto kind : kPolicyKinds) {
        if (to_string(kind) == name) return kind;
    }
    return std::nullopt;
}

}  // namespace ledger_scheduler
