/**
 * @file block.hpp
 * @brief Scheduling transactions, ledger blocks and their digests.
 *
 * Hashes are SHA-256 over a canonical serialization: a JSON object with
 * keys in sorted order, integers in decimal, doubles in shortest
 * round-trip form and timestamps as epoch microseconds. The same
 * serialization is used when a block is mined and when it is re-verified.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace ledger_scheduler {

/**
 * @brief One recorded scheduling outcome.
 *
 * Immutable after creation except for block_hash, stamped when the
 * transaction is mined into a block.
 */
struct SchedulingTransaction {
    TransactionId transaction_id;
    Timestamp timestamp;
    VmId vm_id{0};
    TaskId task_id;
    ResourceVector task_requirements;
    ResourceVector vm_state_before;
    ResourceVector vm_state_after;
    double score{0.0};
    TransactionStatus status{TransactionStatus::Assigned};
    std::string block_hash;   ///< Empty while pending
};

/**
 * @brief A mined block. Immutable once appended to the chain.
 */
struct LedgerBlock {
    uint64_t block_id{0};
    Timestamp timestamp;
    std::vector<SchedulingTransaction> transactions;
    std::string previous_hash;
    std::string merkle_root;
    std::string block_hash;
};

/// Canonical text of a transaction, excluding its block_hash.
[[nodiscard]] std::string canonical_form(const SchedulingTransaction& tx);

[[nodiscard]] std::string hash_transaction(const SchedulingTransaction& tx);

/**
 * @brief Merkle root over @p transactions.
 *
 * Leaves are transaction hashes; each level pairs adjacent hashes
 * (duplicating the last one when the level is odd) and hashes their
 * concatenation until one root remains. An empty set hashes the literal
 * "empty_block".
 */
[[nodiscard]] std::string compute_merkle_root(std::span<const SchedulingTransaction> transactions);

/// Hash of {block_id, timestamp, previous_hash, merkle_root, transaction_count}.
[[nodiscard]] std::string compute_block_hash(const LedgerBlock& block);

}  // namespace ledger_scheduler
