/**
 * @file ledger.hpp
 * @brief Append-only, hash-chained, block-structured log of scheduling outcomes.
 *
 * The ledger holds an only-growing sequence of committed blocks plus a
 * pending buffer. Appending a transaction that fills the buffer to the
 * configured block size mines a block inline; there is no background miner.
 * Committed blocks are never edited in place. The ledger is not internally
 * synchronized: its owner serializes access (see PolicyInstance).
 */

#pragma once

#include "cluster/vm.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "ledger/block.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace ledger_scheduler {

struct LedgerConfig {
    size_t block_size = 10;
};

/**
 * @brief Per-VM assignment statistics derived from the ledger.
 */
struct VmLedgerStats {
    VmId vm_id{0};
    size_t total_assignments = 0;
    size_t failed_assignments = 0;
    size_t total_transactions = 0;
    double success_rate = 0.0;       ///< assigned / max(assigned + failed, 1)
    double average_score = 0.0;      ///< Over assigned transactions only
    uint64_t total_cpu_allocated = 0;
    uint64_t total_mem_allocated = 0;
};

struct LedgerSummary {
    size_t total_blocks = 0;
    size_t total_transactions = 0;   ///< Committed + pending
    size_t pending_transactions = 0;
    size_t successful_assignments = 0;
    size_t failed_assignments = 0;
    double success_rate = 0.0;       ///< assigned / max(total_transactions, 1)
    bool chain_integrity = false;
    std::string latest_block_hash;
};

/**
 * @brief Full structural export: blocks with nested transactions, the
 *        pending buffer and the summary.
 */
struct LedgerSnapshot {
    std::vector<LedgerBlock> blocks;
    std::vector<SchedulingTransaction> pending;
    LedgerSummary summary;
};

/**
 * @brief Check chain linkage and recompute every block's merkle root and hash.
 *
 * Fails with ErrorCode::IntegrityViolation naming the first offending block.
 * Nothing is repaired.
 */
[[nodiscard]] Result<void> verify_chain(std::span<const LedgerBlock> blocks);

class TransactionLedger {
public:
    explicit TransactionLedger(LedgerConfig config = {}, Clock clock = system_clock());

    /**
     * @brief Rebuild a ledger from an exported snapshot.
     *
     * Rejects structurally malformed data with ErrorCode::MalformedRecord.
     * Hash inconsistencies are kept as-is and reported by verify().
     */
    [[nodiscard]] static Result<TransactionLedger> restore(LedgerSnapshot snapshot,
                                                           LedgerConfig config = {},
                                                           Clock clock = system_clock());

    /**
     * @brief Record one scheduling outcome in the pending buffer.
     *
     * Mines a block when the buffer reaches block_size.
     * @return The new transaction's id ("tx_<counter>_<epoch ms>").
     */
    TransactionId append(VmId vm_id,
                         const Task& task,
                         const ResourceVector& state_before,
                         const ResourceVector& state_after,
                         double score,
                         TransactionStatus status);

    /// Close the pending buffer into a new block. No-op when nothing is pending.
    void mine();

    [[nodiscard]] bool verify_integrity() const;
    [[nodiscard]] Result<void> verify() const;

    /// Committed and pending transactions, optionally filtered, by ascending timestamp.
    [[nodiscard]] std::vector<SchedulingTransaction> history(
        std::optional<VmId> vm_id = std::nullopt,
        const std::optional<TaskId>& task_id = std::nullopt) const;

    /// The last @p limit entries of history().
    [[nodiscard]] std::vector<SchedulingTransaction> recent(size_t limit) const;

    [[nodiscard]] VmLedgerStats vm_stats(VmId vm_id) const;
    [[nodiscard]] LedgerSummary summary() const;
    [[nodiscard]] LedgerSnapshot snapshot() const;

    [[nodiscard]] const std::vector<LedgerBlock>& blocks() const noexcept { return blocks_; }
    [[nodiscard]] const std::vector<SchedulingTransaction>& pending() const noexcept { return pending_; }
    [[nodiscard]] const LedgerBlock& tip() const noexcept { return blocks_.back(); }
    [[nodiscard]] size_t block_size() const noexcept { return config_.block_size; }

private:
    void create_genesis_block();

    LedgerConfig config_;
    Clock clock_;
    std::vector<LedgerBlock> blocks_;
    std::vector<SchedulingTransaction> pending_;
    uint64_t transaction_counter_{0};
};

}  // namespace ledger_scheduler
