/**
 * @file types.hpp
 * @brief Fundamental types used throughout ledger_scheduler.
 *
 * Defines VmId, TaskId, ResourceVector, Utilization and the small enums
 * shared by the fleet model, the scheduling policies and the ledger.
 * All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace ledger_scheduler {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using VmId = int64_t;
using TaskId = std::string;
using TransactionId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;

/// Source of "now". Injected wherever wall-clock time feeds a decision or a hash.
using Clock = std::function<Timestamp()>;

[[nodiscard]] inline Clock system_clock() {
    return [] { return std::chrono::system_clock::now(); };
}

[[nodiscard]] inline double epoch_seconds(Timestamp t) noexcept {
    return std::chrono::duration<double>(t.time_since_epoch()).count();
}

[[nodiscard]] inline int64_t epoch_micros(Timestamp t) noexcept {
    return std::chrono::duration_cast<std::chrono::microseconds>(t.time_since_epoch()).count();
}

[[nodiscard]] inline Timestamp from_epoch_micros(int64_t us) noexcept {
    return Timestamp{std::chrono::duration_cast<Timestamp::duration>(std::chrono::microseconds{us})};
}

// ─────────────────────────────────────────────
// Resource Vector
// ─────────────────────────────────────────────

/**
 * @brief Amount of each resource dimension: capacity, usage or demand.
 */
struct ResourceVector {
    uint64_t cpu{0};
    uint64_t mem{0};
    uint64_t io{0};
    uint64_t bw{0};

    auto operator<=>(const ResourceVector&) const = default;

    [[nodiscard]] constexpr ResourceVector operator+(const ResourceVector& o) const noexcept {
        return {cpu + o.cpu, mem + o.mem, io + o.io, bw + o.bw};
    }

    ResourceVector& operator+=(const ResourceVector& o) noexcept {
        cpu += o.cpu;
        mem += o.mem;
        io += o.io;
        bw += o.bw;
        return *this;
    }

    /// True iff every dimension is <= the corresponding dimension of @p limit.
    [[nodiscard]] constexpr bool fits_within(const ResourceVector& limit) const noexcept {
        return cpu <= limit.cpu && mem <= limit.mem && io <= limit.io && bw <= limit.bw;
    }

    /// Per-dimension sum clamped at the largest representable amount.
    [[nodiscard]] constexpr ResourceVector saturating_add(const ResourceVector& o) const noexcept {
        constexpr auto add = [](uint64_t a, uint64_t b) {
            return a > std::numeric_limits<uint64_t>::max() - b
                ? std::numeric_limits<uint64_t>::max() : a + b;
        };
        return {add(cpu, o.cpu), add(mem, o.mem), add(io, o.io), add(bw, o.bw)};
    }

    /// True iff this usage plus @p demand stays within @p limit on every
    /// dimension. Never forms the sum, so it cannot wrap.
    [[nodiscard]] constexpr bool fits_with(const ResourceVector& demand,
                                           const ResourceVector& limit) const noexcept {
        constexpr auto fits = [](uint64_t used, uint64_t extra, uint64_t cap) {
            return used <= cap && extra <= cap - used;
        };
        return fits(cpu, demand.cpu, limit.cpu) && fits(mem, demand.mem, limit.mem)
            && fits(io, demand.io, limit.io) && fits(bw, demand.bw, limit.bw);
    }

    [[nodiscard]] constexpr bool any_zero() const noexcept {
        return cpu == 0 || mem == 0 || io == 0 || bw == 0;
    }
};

// ─────────────────────────────────────────────
// Utilization
// ─────────────────────────────────────────────

/**
 * @brief Per-dimension usage/capacity ratios for one VM at one instant.
 */
struct Utilization {
    double cpu{0.0};
    double mem{0.0};
    double io{0.0};
    double bw{0.0};

    [[nodiscard]] constexpr double mean() const noexcept {
        return (cpu + mem + io + bw) / 4.0;
    }

    [[nodiscard]] constexpr bool within_capacity() const noexcept {
        return cpu <= 1.0 && mem <= 1.0 && io <= 1.0 && bw <= 1.0;
    }

    /// Ratios of @p used against @p capacity. A zero-capacity dimension is
    /// 0 when unused and +inf otherwise.
    [[nodiscard]] static Utilization of(const ResourceVector& used,
                                        const ResourceVector& capacity) noexcept;
};

// ─────────────────────────────────────────────
// Transaction Status
// ─────────────────────────────────────────────

enum class TransactionStatus : uint8_t {
    Assigned,
    Failed,
    Rejected
};

[[nodiscard]] constexpr std::string_view to_string(TransactionStatus status) noexcept {
    switch (status) {
        case TransactionStatus::Assigned: return "assigned";
        case TransactionStatus::Failed:   return "failed";
        case TransactionStatus::Rejected: return "rejected";
    }
    return "unknown";
}

[[nodiscard]] std::optional<TransactionStatus> parse_status(std::string_view text) noexcept;

// ─────────────────────────────────────────────
// Policy Kind
// ─────────────────────────────────────────────

enum class PolicyKind : uint8_t {
    RoundRobin,
    UrgencyAware,
    LeastLoaded,
    BlockchainInspired
};

/**
 * @brief Registry name of a policy ("roundrobin", "urgency", ...).
 */
[[nodiscard]] constexpr std::string_view to_string(PolicyKind kind) noexcept {
    switch (kind) {
        case PolicyKind::RoundRobin:         return "roundrobin";
        case PolicyKind::UrgencyAware:       return "urgency";
        case PolicyKind::LeastLoaded:        return "leastloaded";
        case PolicyKind::BlockchainInspired: return "blockchain";
    }
    return "unknown";
}

[[nodiscard]] std::optional<PolicyKind> parse_policy_kind(std::string_view name) noexcept;

}  // namespace ledger_scheduler
