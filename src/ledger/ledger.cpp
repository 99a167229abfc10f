/**
 * @file ledger.cpp
 * @brief TransactionLedger: append, mine, verify and query.
 *
 * Mining:
 *   block.id            = chain length
 *   block.previous_hash = tip hash (genesis: 64 zeros)
 *   block.transactions  = pending, in append order
 *   block.merkle_root   = merkle(transactions without block_hash)
 *   block.block_hash    = H(id, timestamp, previous_hash, merkle_root, count)
 *   every transaction is stamped with block.block_hash, pending is cleared.
 */

#include "ledger/ledger.hpp"

#include "ledger/hash.hpp"

#include <algorithm>
#include <chrono>
#include <format>

namespace ledger_scheduler {

// ─────────────────────────────────────────────
// Chain verification
// ─────────────────────────────────────────────

Result<void> verify_chain(std::span<const LedgerBlock> blocks) {
    if (blocks.empty()) {
        return Error{ErrorCode::IntegrityViolation, "chain has no genesis block"};
    }
    if (blocks.front().previous_hash != kGenesisPreviousHash) {
        return Error{ErrorCode::IntegrityViolation,
                     "genesis block previous_hash is not the zero sentinel"};
    }

    for (size_t i = 0; i < blocks.size(); ++i) {
        const auto& block = blocks[i];
        auto where = std::format("block {}", i);

        if (i > 0 && block.previous_hash != blocks[i - 1].block_hash) {
            return Error{ErrorCode::IntegrityViolation,
                         where + ": previous_hash does not match predecessor"};
        }
        if (block.merkle_root != compute_merkle_root(block.transactions)) {
            return Error{ErrorCode::IntegrityViolation, where + ": merkle root mismatch"};
        }
        if (block.block_hash != compute_block_hash(block)) {
            return Error{ErrorCode::IntegrityViolation, where + ": block hash mismatch"};
        }
        for (const auto& tx : block.transactions) {
            if (tx.block_hash != block.block_hash) {
                return Error{ErrorCode::IntegrityViolation,
                             where + ": transaction " + tx.transaction_id
                             + " carries a foreign block hash"};
            }
        }
    }

    return Result<void>{};
}

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

TransactionLedger::TransactionLedger(LedgerConfig config, Clock clock)
    : config_(config), clock_(std::move(clock)) {
    config_.block_size = std::max<size_t>(config_.block_size, 1);
    create_genesis_block();
}

void TransactionLedger::create_genesis_block() {
    LedgerBlock genesis{
        .block_id = 0,
        .timestamp = clock_(),
        .transactions = {},
        .previous_hash = kGenesisPreviousHash,
        .merkle_root = compute_merkle_root({}),
        .block_hash = {}
    };
    genesis.block_hash = compute_block_hash(genesis);
    blocks_.push_back(std::move(genesis));
}

Result<TransactionLedger> TransactionLedger::restore(LedgerSnapshot snapshot,
                                                     LedgerConfig config,
                                                     Clock clock) {
    if (snapshot.blocks.empty()) {
        return Error{ErrorCode::MalformedRecord, "snapshot has no genesis block"};
    }

    size_t tx_count = 0;
    for (size_t i = 0; i < snapshot.blocks.size(); ++i) {
        const auto& block = snapshot.blocks[i];
        if (block.block_id != i) {
            return Error{ErrorCode::MalformedRecord,
                         std::format("block at position {} has id {}", i, block.block_id)};
        }
        if (!is_hex_digest(block.previous_hash) || !is_hex_digest(block.merkle_root)
            || !is_hex_digest(block.block_hash)) {
            return Error{ErrorCode::MalformedRecord,
                         std::format("block {} has a malformed digest", i)};
        }
        tx_count += block.transactions.size();
    }

    for (const auto& tx : snapshot.pending) {
        if (!tx.block_hash.empty()) {
            return Error{ErrorCode::MalformedRecord,
                         "pending transaction " + tx.transaction_id + " carries a block hash"};
        }
    }

    TransactionLedger ledger(config, std::move(clock));
    ledger.blocks_ = std::move(snapshot.blocks);
    ledger.pending_ = std::move(snapshot.pending);
    ledger.transaction_counter_ = tx_count + ledger.pending_.size();
    return ledger;
}

// ─────────────────────────────────────────────
// Append & Mine
// ─────────────────────────────────────────────

TransactionId TransactionLedger::append(VmId vm_id,
                                        const Task& task,
                                        const ResourceVector& state_before,
                                        const ResourceVector& state_after,
                                        double score,
                                        TransactionStatus status) {
    auto now = clock_();
    ++transaction_counter_;
    auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();

    SchedulingTransaction tx{
        .transaction_id = std::format("tx_{}_{}", transaction_counter_, epoch_ms),
        .timestamp = now,
        .vm_id = vm_id,
        .task_id = task.id,
        .task_requirements = task.demand,
        .vm_state_before = state_before,
        .vm_state_after = state_after,
        .score = score,
        .status = status,
        .block_hash = {}
    };
    auto id = tx.transaction_id;
    pending_.push_back(std::move(tx));

    if (pending_.size() >= config_.block_size) {
        mine();
    }
    return id;
}

void TransactionLedger::mine() {
    if (pending_.empty()) return;

    LedgerBlock block{
        .block_id = blocks_.size(),
        .timestamp = clock_(),
        .transactions = pending_,
        .previous_hash = blocks_.empty() ? kGenesisPreviousHash : blocks_.back().block_hash,
        .merkle_root = {},
        .block_hash = {}
    };
    block.merkle_root = compute_merkle_root(block.transactions);
    block.block_hash = compute_block_hash(block);

    for (auto& tx : block.transactions) {
        tx.block_hash = block.block_hash;
    }

    blocks_.push_back(std::move(block));
    pending_.clear();
}

// ─────────────────────────────────────────────
// Verification
// ─────────────────────────────────────────────

bool TransactionLedger::verify_integrity() const {
    return verify().has_value();
}

Result<void> TransactionLedger::verify() const {
    return verify_chain(blocks_);
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

std::vector<SchedulingTransaction> TransactionLedger::history(
    std::optional<VmId> vm_id,
    const std::optional<TaskId>& task_id) const {

    auto matches = [&](const SchedulingTransaction& tx) {
        if (vm_id && tx.vm_id != *vm_id) return false;
        if (task_id && tx.task_id != *task_id) return false;
        return true;
    };

    std::vector<SchedulingTransaction> result;
    for (const auto& block : blocks_) {
        for (const auto& tx : block.transactions) {
            if (matches(tx)) result.push_back(tx);
        }
    }
    for (const auto& tx : pending_) {
        if (matches(tx)) result.push_back(tx);
    }

    std::stable_sort(result.begin(), result.end(),
        [](const SchedulingTransaction& a, const SchedulingTransaction& b) {
            return a.timestamp < b.timestamp;
        });
    return result;
}

std::vector<SchedulingTransaction> TransactionLedger::recent(size_t limit) const {
    auto all = history();
    if (all.size() > limit) {
        all.erase(all.begin(), all.end() - static_cast<std::ptrdiff_t>(limit));
    }
    return all;
}

VmLedgerStats TransactionLedger::vm_stats(VmId vm_id) const {
    VmLedgerStats stats;
    stats.vm_id = vm_id;

    double score_sum = 0.0;
    for (const auto& tx : history(vm_id)) {
        ++stats.total_transactions;
        if (tx.status == TransactionStatus::Assigned) {
            ++stats.total_assignments;
            score_sum += tx.score;
            stats.total_cpu_allocated += tx.task_requirements.cpu;
            stats.total_mem_allocated += tx.task_requirements.mem;
        } else if (tx.status == TransactionStatus::Failed) {
            ++stats.failed_assignments;
        }
    }

    auto assigned = static_cast<double>(stats.total_assignments);
    stats.average_score = score_sum / std::max(assigned, 1.0);
    stats.success_rate = assigned / std::max(
        static_cast<double>(stats.total_assignments + stats.failed_assignments), 1.0);
    return stats;
}

LedgerSummary TransactionLedger::summary() const {
    LedgerSummary summary;
    summary.total_blocks = blocks_.size();
    summary.pending_transactions = pending_.size();

    auto tally = [&summary](const SchedulingTransaction& tx) {
        ++summary.total_transactions;
        if (tx.status == TransactionStatus::Assigned) ++summary.successful_assignments;
        if (tx.status == TransactionStatus::Failed) ++summary.failed_assignments;
    };
    for (const auto& block : blocks_) {
        std::for_each(block.transactions.begin(), block.transactions.end(), tally);
    }
    std::for_each(pending_.begin(), pending_.end(), tally);

    summary.success_rate = static_cast<double>(summary.successful_assignments)
        / std::max(static_cast<double>(summary.total_transactions), 1.0);
    summary.chain_integrity = verify_integrity();
    summary.latest_block_hash = blocks_.back().block_hash;
    return summary;
}

LedgerSnapshot TransactionLedger::snapshot() const {
    return LedgerSnapshot{
        .blocks = blocks_,
        .pending = pending_,
        .summary = summary()
    };
}

}  // namespace ledger_scheduler
