/**
 * @file test_ledger.cpp
 * @brief Unit tests for the transaction ledger: mining, verification, queries, restore.
 */

#include "ledger/hash.hpp"
#include "ledger/ledger.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

using namespace ledger_scheduler;

namespace {

/// Clock that advances one millisecond per reading.
Clock stepping_clock() {
    auto ticks = std::make_shared<int64_t>(1'700'000'000'000'000);
    return [ticks] {
        *ticks += 1000;
        return from_epoch_micros(*ticks);
    };
}

Task make_task(std::string id, ResourceVector demand = {1, 2, 1, 1}) {
    return Task{
        .id = std::move(id),
        .demand = demand,
        .deadline = from_epoch_micros(1'800'000'000'000'000),
        .duration = std::nullopt
    };
}

}  // namespace

class LedgerTest : public ::testing::Test {
protected:
    TransactionLedger ledger_{LedgerConfig{.block_size = 3}, stepping_clock()};

    void assign(VmId vm, const std::string& task_id, double score = 1.0) {
        auto task = make_task(task_id);
        ledger_.append(vm, task, {}, task.demand, score, TransactionStatus::Assigned);
    }

    void fail(VmId vm, const std::string& task_id) {
        ledger_.append(vm, make_task(task_id), {}, {}, 0.0, TransactionStatus::Failed);
    }
};

// ─── Genesis ─────────────────────────────────

TEST_F(LedgerTest, GenesisBlock) {
    ASSERT_EQ(ledger_.blocks().size(), 1u);
    const auto& genesis = ledger_.tip();
    EXPECT_EQ(genesis.block_id, 0u);
    EXPECT_EQ(genesis.previous_hash, kGenesisPreviousHash);
    EXPECT_EQ(genesis.merkle_root, sha256_hex("empty_block"));
    EXPECT_TRUE(genesis.transactions.empty());
    EXPECT_TRUE(is_hex_digest(genesis.block_hash));
    EXPECT_TRUE(ledger_.verify_integrity());
}

TEST_F(LedgerTest, ZeroBlockSizeClampsToOne) {
    TransactionLedger ledger(LedgerConfig{.block_size = 0}, stepping_clock());
    EXPECT_EQ(ledger.block_size(), 1u);
    ledger.append(0, make_task("t"), {}, {}, 1.0, TransactionStatus::Assigned);
    EXPECT_EQ(ledger.blocks().size(), 2u);
}

// ─── Append & Mine ───────────────────────────

TEST_F(LedgerTest, AppendStaysPendingBelowBlockSize) {
    assign(0, "t1");
    assign(1, "t2");
    EXPECT_EQ(ledger_.pending().size(), 2u);
    EXPECT_EQ(ledger_.blocks().size(), 1u);
}

TEST_F(LedgerTest, TransactionIdsAreSequential) {
    auto first = ledger_.append(0, make_task("a"), {}, {}, 1.0, TransactionStatus::Assigned);
    auto second = ledger_.append(0, make_task("b"), {}, {}, 1.0, TransactionStatus::Assigned);
    EXPECT_EQ(first.rfind("tx_1_", 0), 0u);
    EXPECT_EQ(second.rfind("tx_2_", 0), 0u);
}

TEST_F(LedgerTest, MinesWhenBlockSizeReached) {
    assign(0, "t1");
    assign(1, "t2");
    assign(0, "t3");

    ASSERT_EQ(ledger_.blocks().size(), 2u);
    EXPECT_TRUE(ledger_.pending().empty());

    const auto& block = ledger_.tip();
    EXPECT_EQ(block.block_id, 1u);
    EXPECT_EQ(block.previous_hash, ledger_.blocks()[0].block_hash);
    ASSERT_EQ(block.transactions.size(), 3u);
    EXPECT_EQ(block.transactions[0].task_id, "t1");
    EXPECT_EQ(block.transactions[2].task_id, "t3");
    for (const auto& tx : block.transactions) {
        EXPECT_EQ(tx.block_hash, block.block_hash);
    }
    EXPECT_EQ(block.merkle_root, compute_merkle_root(block.transactions));
    EXPECT_TRUE(ledger_.verify_integrity());
}

TEST_F(LedgerTest, MineWithNothingPendingIsNoop) {
    ledger_.mine();
    EXPECT_EQ(ledger_.blocks().size(), 1u);
}

TEST_F(LedgerTest, ForcedMineClosesPartialBlock) {
    assign(0, "t1");
    ledger_.mine();
    ASSERT_EQ(ledger_.blocks().size(), 2u);
    EXPECT_EQ(ledger_.tip().transactions.size(), 1u);
    EXPECT_TRUE(ledger_.pending().empty());
}

TEST_F(LedgerTest, ChainLinksAcrossManyBlocks) {
    for (int i = 0; i < 10; ++i) {
        assign(i % 3, "t" + std::to_string(i));
    }
    ledger_.mine();

    const auto& blocks = ledger_.blocks();
    ASSERT_EQ(blocks.size(), 5u);  // genesis + 3 full + 1 partial
    for (size_t i = 1; i < blocks.size(); ++i) {
        EXPECT_EQ(blocks[i].block_id, i);
        EXPECT_EQ(blocks[i].previous_hash, blocks[i - 1].block_hash);
    }
    EXPECT_TRUE(ledger_.verify().has_value());
}

// ─── Tamper detection ────────────────────────

TEST_F(LedgerTest, DetectsEditedTransaction) {
    for (int i = 0; i < 6; ++i) assign(0, "t" + std::to_string(i));

    auto blocks = ledger_.blocks();
    blocks[1].transactions[1].score = 99.0;

    auto verdict = verify_chain(blocks);
    ASSERT_FALSE(verdict.has_value());
    EXPECT_EQ(verdict.error().code, ErrorCode::IntegrityViolation);
    EXPECT_NE(verdict.error().message.find("block 1"), std::string::npos);
    EXPECT_NE(verdict.error().message.find("merkle"), std::string::npos);
}

TEST_F(LedgerTest, DetectsBrokenLink) {
    for (int i = 0; i < 6; ++i) assign(0, "t" + std::to_string(i));

    auto blocks = ledger_.blocks();
    blocks[2].previous_hash = sha256_hex("forged");

    auto verdict = verify_chain(blocks);
    ASSERT_FALSE(verdict.has_value());
    EXPECT_NE(verdict.error().message.find("block 2"), std::string::npos);
    EXPECT_NE(verdict.error().message.find("previous_hash"), std::string::npos);
}

TEST_F(LedgerTest, DetectsRewrittenBlockHash) {
    assign(0, "t1");
    ledger_.mine();

    auto blocks = ledger_.blocks();
    blocks[1].timestamp += std::chrono::seconds{1};

    auto verdict = verify_chain(blocks);
    ASSERT_FALSE(verdict.has_value());
    EXPECT_NE(verdict.error().message.find("block hash"), std::string::npos);
}

TEST_F(LedgerTest, DetectsOverwrittenStoredHash) {
    assign(0, "t1");
    ledger_.mine();

    auto blocks = ledger_.blocks();
    blocks[1].block_hash = sha256_hex("forged");
    EXPECT_FALSE(verify_chain(blocks).has_value());
}

TEST_F(LedgerTest, DetectsForeignTransactionStamp) {
    assign(0, "t1");
    ledger_.mine();

    auto blocks = ledger_.blocks();
    blocks[1].transactions[0].block_hash = blocks[0].block_hash;

    auto verdict = verify_chain(blocks);
    ASSERT_FALSE(verdict.has_value());
    EXPECT_NE(verdict.error().message.find("foreign block hash"), std::string::npos);
}

TEST_F(LedgerTest, DetectsAlteredGenesis) {
    auto blocks = ledger_.blocks();
    blocks[0].previous_hash = sha256_hex("not zero");
    EXPECT_FALSE(verify_chain(blocks).has_value());
}

TEST_F(LedgerTest, EmptyChainFailsVerification) {
    EXPECT_FALSE(verify_chain({}).has_value());
}

TEST_F(LedgerTest, TamperedRestoreIsReportedNotRepaired) {
    for (int i = 0; i < 3; ++i) assign(0, "t" + std::to_string(i));

    auto snap = ledger_.snapshot();
    snap.blocks[1].transactions[0].vm_id = 42;

    auto restored = TransactionLedger::restore(snap, LedgerConfig{.block_size = 3}, stepping_clock());
    ASSERT_TRUE(restored.has_value());
    EXPECT_FALSE(restored->verify_integrity());
    EXPECT_FALSE(restored->summary().chain_integrity);
    EXPECT_EQ(restored->blocks()[1].transactions[0].vm_id, 42);
}

// ─── Queries ─────────────────────────────────

TEST_F(LedgerTest, HistoryIncludesPendingAndFilters) {
    assign(0, "t1");
    assign(1, "t2");
    assign(0, "t3");  // mines
    fail(1, "t4");     // pending

    auto all = ledger_.history();
    ASSERT_EQ(all.size(), 4u);
    EXPECT_EQ(all.front().task_id, "t1");
    EXPECT_EQ(all.back().task_id, "t4");
    for (size_t i = 1; i < all.size(); ++i) {
        EXPECT_LE(all[i - 1].timestamp, all[i].timestamp);
    }

    auto vm1 = ledger_.history(VmId{1});
    ASSERT_EQ(vm1.size(), 2u);
    EXPECT_EQ(vm1[0].task_id, "t2");
    EXPECT_EQ(vm1[1].task_id, "t4");

    auto by_task = ledger_.history(std::nullopt, TaskId{"t3"});
    ASSERT_EQ(by_task.size(), 1u);
    EXPECT_EQ(by_task[0].vm_id, 0);

    EXPECT_TRUE(ledger_.history(VmId{1}, TaskId{"t3"}).empty());
}

TEST_F(LedgerTest, RecentReturnsTail) {
    for (int i = 0; i < 5; ++i) assign(0, "t" + std::to_string(i));

    auto tail = ledger_.recent(2);
    ASSERT_EQ(tail.size(), 2u);
    EXPECT_EQ(tail[0].task_id, "t3");
    EXPECT_EQ(tail[1].task_id, "t4");
    EXPECT_EQ(ledger_.recent(100).size(), 5u);
}

TEST_F(LedgerTest, VmStats) {
    assign(0, "t1", 2.0);
    assign(0, "t2", 4.0);
    fail(0, "t3");
    assign(1, "t4", 1.0);

    auto stats = ledger_.vm_stats(0);
    EXPECT_EQ(stats.vm_id, 0);
    EXPECT_EQ(stats.total_transactions, 3u);
    EXPECT_EQ(stats.total_assignments, 2u);
    EXPECT_EQ(stats.failed_assignments, 1u);
    EXPECT_DOUBLE_EQ(stats.average_score, 3.0);
    EXPECT_DOUBLE_EQ(stats.success_rate, 2.0 / 3.0);
    EXPECT_EQ(stats.total_cpu_allocated, 2u);
    EXPECT_EQ(stats.total_mem_allocated, 4u);
}

TEST_F(LedgerTest, VmStatsForUnknownVm) {
    auto stats = ledger_.vm_stats(99);
    EXPECT_EQ(stats.total_transactions, 0u);
    EXPECT_DOUBLE_EQ(stats.average_score, 0.0);
    EXPECT_DOUBLE_EQ(stats.success_rate, 0.0);
}

TEST_F(LedgerTest, Summary) {
    assign(0, "t1");
    fail(1, "t2");
    assign(2, "t3");  // mines
    assign(0, "t4");

    auto summary = ledger_.summary();
    EXPECT_EQ(summary.total_blocks, 2u);
    EXPECT_EQ(summary.total_transactions, 4u);
    EXPECT_EQ(summary.pending_transactions, 1u);
    EXPECT_EQ(summary.successful_assignments, 3u);
    EXPECT_EQ(summary.failed_assignments, 1u);
    EXPECT_DOUBLE_EQ(summary.success_rate, 0.75);
    EXPECT_TRUE(summary.chain_integrity);
    EXPECT_EQ(summary.latest_block_hash, ledger_.tip().block_hash);
}

TEST_F(LedgerTest, EmptyLedgerSummary) {
    auto summary = ledger_.summary();
    EXPECT_EQ(summary.total_blocks, 1u);
    EXPECT_EQ(summary.total_transactions, 0u);
    EXPECT_DOUBLE_EQ(summary.success_rate, 0.0);
    EXPECT_TRUE(summary.chain_integrity);
}

// ─── Restore ─────────────────────────────────

TEST_F(LedgerTest, RestoreContinuesChain) {
    for (int i = 0; i < 4; ++i) assign(0, "t" + std::to_string(i));
    auto snap = ledger_.snapshot();

    auto restored = TransactionLedger::restore(snap, LedgerConfig{.block_size = 3}, stepping_clock());
    ASSERT_TRUE(restored.has_value()) << restored.error().message;
    EXPECT_EQ(restored->blocks().size(), 2u);
    EXPECT_EQ(restored->pending().size(), 1u);

    auto id = restored->append(1, make_task("t4"), {}, {}, 1.0, TransactionStatus::Assigned);
    EXPECT_EQ(id.rfind("tx_5_", 0), 0u);
    restored->mine();
    EXPECT_EQ(restored->tip().previous_hash, snap.blocks.back().block_hash);
    EXPECT_TRUE(restored->verify_integrity());
}

TEST_F(LedgerTest, RestoreRejectsEmptyChain) {
    auto restored = TransactionLedger::restore(LedgerSnapshot{});
    ASSERT_FALSE(restored.has_value());
    EXPECT_EQ(restored.error().code, ErrorCode::MalformedRecord);
}

TEST_F(LedgerTest, RestoreRejectsOutOfSequenceIds) {
    assign(0, "t1");
    ledger_.mine();
    auto snap = ledger_.snapshot();
    snap.blocks[1].block_id = 7;

    auto restored = TransactionLedger::restore(snap);
    ASSERT_FALSE(restored.has_value());
    EXPECT_EQ(restored.error().code, ErrorCode::MalformedRecord);
}

TEST_F(LedgerTest, RestoreRejectsMalformedDigest) {
    auto snap = ledger_.snapshot();
    snap.blocks[0].merkle_root = "not-a-digest";

    auto restored = TransactionLedger::restore(snap);
    ASSERT_FALSE(restored.has_value());
    EXPECT_EQ(restored.error().code, ErrorCode::MalformedRecord);
}

TEST_F(LedgerTest, RestoreRejectsStampedPendingTransaction) {
    assign(0, "t1");
    auto snap = ledger_.snapshot();
    snap.pending[0].block_hash = ledger_.tip().block_hash;

    auto restored = TransactionLedger::restore(snap);
    ASSERT_FALSE(restored.has_value());
    EXPECT_EQ(restored.error().code, ErrorCode::MalformedRecord);
}
